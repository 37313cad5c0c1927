#ifndef PARENS_IO_READ_HPP
#define PARENS_IO_READ_HPP

#include "io/tokenizer.hpp"
#include "runtime/sexpr.hpp"
#include "util/named_runtime_error.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace parens {

struct source_location;

class parse_error : public error {
public:
  parse_error(std::string const& message, source_location const&);
};

// Deepest bracket or prefix nesting the reader accepts.
constexpr std::size_t max_nesting_depth = 1000;

// Read all top-level S-expressions. An empty token sequence gives an empty
// result.
std::vector<sexpr>
read_multiple(std::vector<token> const&);

std::vector<sexpr>
read_multiple(std::string const& source,
              std::string const& file_name = "<input>");

// Read exactly one top-level S-expression; anything else is a parse_error.
sexpr
read(std::vector<token> const&);

sexpr
read(std::string const& source, std::string const& file_name = "<input>");

} // namespace parens

#endif
