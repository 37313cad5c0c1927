#ifndef PARENS_UTIL_SYMBOLIC_ENUM_HPP
#define PARENS_UTIL_SYMBOLIC_ENUM_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <tuple>

namespace parens {

// A fixed table of source names for the enumerators of E. Several names may map
// to the same enumerator; the first one listed is its canonical name.
template <typename E, std::size_t N>
using symbolic_mapping = std::array<std::tuple<char const*, E>, N>;

template <typename E, std::size_t N>
std::optional<E>
find_symbolic(symbolic_mapping<E, N> const& mapping, std::string_view name) {
  for (auto const& [n, value] : mapping)
    if (name == n)
      return value;
  return std::nullopt;
}

template <typename E, std::size_t N>
char const*
symbolic_name(symbolic_mapping<E, N> const& mapping, E value) {
  for (auto const& [name, v] : mapping)
    if (v == value)
      return name;

  throw std::logic_error{"Invalid enumerator"};
}

} // namespace parens

#endif
