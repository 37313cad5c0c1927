#ifndef PARENS_PARENS_HPP
#define PARENS_PARENS_HPP

#include "compiler/compilation_config.hpp"
#include "compiler/expression.hpp"
#include "runtime/sexpr.hpp"
#include "runtime/value.hpp"
#include "vm/vm.hpp"

#include <string>
#include <vector>

namespace parens {

// Entry points for embedding the language. Each runs some prefix of the
// tokenize, read, transform and evaluate pipeline.

// Run every top-level form of the source in the vm's main module. Returns the
// value of the last form, or nil if there are none.
value
eval(vm&, std::string const& source,
     transform_config const& = transform_config::default_config(),
     std::string const& file_name = "<input>");

// The S-expressions of the source, without transforming them.
std::vector<sexpr>
parse(std::string const& source, std::string const& file_name = "<input>");

expression
to_ast(sexpr const&,
       transform_config const& = transform_config::default_config());

// Readable source text of the transformed program, one top-level form after
// another.
std::string
compile(std::string const& source,
        transform_config const& = transform_config::default_config(),
        std::string const& file_name = "<input>");

// Indented rendering of the S-expression.
std::string
pp(sexpr const&);

} // namespace parens

#endif
