#ifndef PARENS_IO_WRITE_HPP
#define PARENS_IO_WRITE_HPP

#include <string>

namespace parens {

class sexpr;
class value;

// Canonical single-line source text of the expression. Reading the result
// back gives an equal expression.
std::string
sexpr_to_string(sexpr const&);

// Like sexpr_to_string, but lists longer than three elements, or containing a
// nested sequence, are broken over several lines, one element per line,
// indented by two spaces per level.
std::string
format_sexpr(sexpr const&, unsigned indent = 0);

// Representation of a run-time value: strings are quoted, tags are written as
// keywords.
std::string
value_to_string(value const&);

// Text used by str, print and println: strings are written without quotes,
// tags without the colon, and nil as the empty string.
std::string
display_string(value const&);

std::string
number_to_string(double);

// String literal denoting s.
std::string
quote_string(std::string const& s);

} // namespace parens

#endif
