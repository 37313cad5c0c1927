#ifndef PARENS_RUNTIME_NUMERIC_HPP
#define PARENS_RUNTIME_NUMERIC_HPP

#include "runtime/value.hpp"

namespace parens {

// Arithmetic on run-time numbers. Two integers give an integer, raising an
// evaluation_error on overflow; a float operand makes the result a float.
// Non-numeric operands raise a type_error.

value
add(value const&, value const&);

value
subtract(value const&, value const&);

value
multiply(value const&, value const&);

// Always gives a float. Division by zero is an evaluation_error.
value
divide(value const&, value const&);

// Integer remainder, with the sign of the dividend.
value
remainder(value const&, value const&);

value
negate(value const&);

} // namespace parens

#endif
