#include "runtime/numeric.hpp"

#include <cstdint>
#include <limits>

namespace parens {

static void
check_numbers(value const& lhs, value const& rhs) {
  if (!is_number(lhs))
    throw make_type_error<double>(lhs);
  if (!is_number(rhs))
    throw make_type_error<double>(rhs);
}

template <typename F>
static std::int64_t
checked(F&& f, std::int64_t x, std::int64_t y) {
  std::int64_t result{};
  if (f(x, y, &result))
    throw make_error("Integer overflow");
  return result;
}

value
add(value const& lhs, value const& rhs) {
  check_numbers(lhs, rhs);
  auto x = match<std::int64_t>(lhs);
  auto y = match<std::int64_t>(rhs);
  if (x && y)
    return checked([] (auto a, auto b, auto r) {
                     return __builtin_add_overflow(a, b, r);
                   }, *x, *y);
  return to_double(lhs) + to_double(rhs);
}

value
subtract(value const& lhs, value const& rhs) {
  check_numbers(lhs, rhs);
  auto x = match<std::int64_t>(lhs);
  auto y = match<std::int64_t>(rhs);
  if (x && y)
    return checked([] (auto a, auto b, auto r) {
                     return __builtin_sub_overflow(a, b, r);
                   }, *x, *y);
  return to_double(lhs) - to_double(rhs);
}

value
multiply(value const& lhs, value const& rhs) {
  check_numbers(lhs, rhs);
  auto x = match<std::int64_t>(lhs);
  auto y = match<std::int64_t>(rhs);
  if (x && y)
    return checked([] (auto a, auto b, auto r) {
                     return __builtin_mul_overflow(a, b, r);
                   }, *x, *y);
  return to_double(lhs) * to_double(rhs);
}

value
divide(value const& lhs, value const& rhs) {
  check_numbers(lhs, rhs);
  double divisor = to_double(rhs);
  if (divisor == 0.0)
    throw make_error("Division by zero");
  return to_double(lhs) / divisor;
}

value
remainder(value const& lhs, value const& rhs) {
  std::int64_t x = expect<std::int64_t>(lhs);
  std::int64_t y = expect<std::int64_t>(rhs);
  if (y == 0)
    throw make_error("Division by zero");
  if (y == -1)
    return std::int64_t{0};
  return x % y;
}

value
negate(value const& v) {
  if (auto i = match<std::int64_t>(v)) {
    if (*i == std::numeric_limits<std::int64_t>::min())
      throw make_error("Integer overflow");
    return -*i;
  } else if (auto d = match<double>(v))
    return -*d;
  else
    throw make_type_error<double>(v);
}

} // namespace parens
