#ifndef PARENS_COMPILER_TRANSFORMER_HPP
#define PARENS_COMPILER_TRANSFORMER_HPP

#include "compiler/compilation_config.hpp"
#include "compiler/expression.hpp"
#include "runtime/sexpr.hpp"
#include "runtime/value.hpp"
#include "util/named_runtime_error.hpp"

#include <string>
#include <vector>

namespace parens {

// The transformer turns S-expressions into the expression tree defined in
// ast.hpp. Head symbols naming a special form or a built-in operation get their
// own rule; any other list is a call.

class transform_error : public error {
public:
  transform_error(std::string const& message, source_location const&);
};

expression
transform(sexpr const&,
          transform_config const& = transform_config::default_config());

// Transform a sequence of top-level forms. A def makes its name known to the
// forms after it.
std::vector<expression>
transform_program(std::vector<sexpr> const&,
                  transform_config const& = transform_config::default_config());

// Data value denoted by a quoted S-expression: symbols and keywords become
// tags, lists and vectors become lists, tuples become tuples.
value
quote_datum(sexpr const&);

} // namespace parens

#endif
