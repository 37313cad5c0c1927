#ifndef PARENS_UTIL_NAMED_RUNTIME_ERROR_HPP
#define PARENS_UTIL_NAMED_RUNTIME_ERROR_HPP

#include "compiler/source_location.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace parens {

// Base of every error the front end and the evaluator throw. The message is
// formatted eagerly; if a location is given, it is prefixed to the message.
class error : public std::runtime_error {
public:
  template <typename... Args>
  explicit
  error(std::string_view fmt, Args&&... args)
    : std::runtime_error{fmt::format(fmt::runtime(fmt),
                                     std::forward<Args>(args)...)}
  { }

  template <typename... Args>
  error(source_location const& loc, std::string_view fmt, Args&&... args)
    : std::runtime_error{
        fmt::format("{}: {}", format_location(loc),
                    fmt::format(fmt::runtime(fmt),
                                std::forward<Args>(args)...))
      }
  { }
};

template <typename>
class named_runtime_error : public error {
public:
  using error::error;
};

} // namespace parens

#endif
