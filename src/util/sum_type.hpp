#ifndef PARENS_UTIL_SUM_TYPE_HPP
#define PARENS_UTIL_SUM_TYPE_HPP

#include "util/named_runtime_error.hpp"

#include <fmt/format.h>

#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

namespace parens {

using sum_type_error = named_runtime_error<class sum_type_error_tag>;

// A nullable, shared handle to exactly one of the node classes Ts. Every T has
// to provide a static type_name used in diagnostics.
template <typename... Ts>
class sum_type {
public:
  sum_type() = default;

  template <typename U>
  requires (std::is_same_v<U, Ts> || ...)
  sum_type(std::shared_ptr<U> x)
    : value_{std::move(x)}
  { }

  explicit
  operator bool () const {
    return std::visit([] (auto const& p) { return static_cast<bool>(p); },
                      value_);
  }

  template <typename T>
  std::shared_ptr<T>
  get_if() const {
    if (auto p = std::get_if<std::shared_ptr<T>>(&value_))
      return *p;
    else
      return {};
  }

  template <typename F>
  decltype(auto)
  visit(F&& f) const {
    if (!*this)
      throw sum_type_error{"Visiting an empty {}", "sum_type"};
    return std::visit(std::forward<F>(f), value_);
  }

  bool
  operator == (sum_type const&) const = default;

private:
  // Default-constructed to an empty pointer of the first alternative.
  std::variant<std::shared_ptr<Ts>...> value_;
};

template <typename... Ts>
char const*
type_name(sum_type<Ts...> const& s) {
  if (!s)
    return "<empty>";
  return s.visit([] <typename T> (std::shared_ptr<T> const&) {
    return T::type_name;
  });
}

template <typename T, typename... Ts>
bool
is(sum_type<Ts...> const& s) {
  return static_cast<bool>(s.template get_if<T>());
}

template <typename T, typename... Ts>
std::shared_ptr<T>
match(sum_type<Ts...> const& s) {
  return s.template get_if<T>();
}

template <typename T, typename... Ts>
std::shared_ptr<T>
expect(sum_type<Ts...> const& s) {
  if (auto result = s.template get_if<T>())
    return result;
  else
    throw sum_type_error{"Invalid type: expected {}, got {}",
                         T::type_name, type_name(s)};
}

} // namespace parens

#endif
