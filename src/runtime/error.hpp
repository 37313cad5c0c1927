#ifndef PARENS_RUNTIME_ERROR_HPP
#define PARENS_RUNTIME_ERROR_HPP

#include "util/named_runtime_error.hpp"

#include <fmt/format.h>

#include <string_view>
#include <utility>

namespace parens {

// Faults raised while evaluating a transformed program. try converts both of
// these into an {:error, message} tuple.
using evaluation_error = named_runtime_error<class evaluation_error_tag>;
using type_error = named_runtime_error<class type_error_tag>;

template <typename Error = evaluation_error, typename... Args>
Error
make_error(std::string_view fmt, Args&&... args) {
  return Error{"{}", fmt::format(fmt::runtime(fmt),
                                 std::forward<Args>(args)...)};
}

} // namespace parens

#endif
