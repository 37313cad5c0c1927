#ifndef PARENS_COMPILER_SOURCE_LOCATION_HPP
#define PARENS_COMPILER_SOURCE_LOCATION_HPP

#include <cstddef>
#include <functional>
#include <string>

namespace parens {

// Position of a character in a source text. Lines and columns count from 1;
// 0 means the position isn't known.
struct source_location {
  static source_location const unknown;

  std::string file_name;
  unsigned    line   = 0;
  unsigned    column = 0;

  // Location of the character following c.
  void
  advance(char c) {
    if (c == '\n') {
      ++line;
      column = 1;
    } else
      ++column;
  }

  std::size_t
  hash() const;

  friend bool
  operator == (source_location const&, source_location const&) = default;
};

inline source_location const source_location::unknown{"<unknown>", 0, 0};

// file:line:column
std::string
format_location(source_location const&);

} // namespace parens

template <>
struct std::hash<parens::source_location> {
  std::size_t
  operator () (parens::source_location const& loc) const {
    return loc.hash();
  }
};

#endif
