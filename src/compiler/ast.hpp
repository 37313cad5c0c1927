#ifndef PARENS_COMPILER_AST_HPP
#define PARENS_COMPILER_AST_HPP

#include "compiler/expression.hpp"
#include "compiler/operations.hpp"
#include "compiler/source_location.hpp"
#include "runtime/value.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace parens {

class literal_expression {
public:
  static constexpr char const* type_name = "literal_expression";

  explicit
  literal_expression(parens::value v)
    : value_{std::move(v)}
  { }

  parens::value const&
  value() const { return value_; }

  std::string
  show(std::size_t indent) const;

private:
  parens::value value_;
};

// Reference to a name introduced by a binding form. Resolved through the
// lexical frames first, then through the module's def bindings.
class local_reference_expression {
public:
  static constexpr char const* type_name = "local_reference_expression";

  explicit
  local_reference_expression(std::string name)
    : name_{std::move(name)}
  { }

  std::string const&
  name() const { return name_; }

  std::string
  show(std::size_t indent) const;

private:
  std::string name_;
};

// A name no enclosing binding form introduces; resolution is left to run time.
class free_reference_expression {
public:
  static constexpr char const* type_name = "free_reference_expression";

  free_reference_expression(std::string name, source_location loc)
    : name_{std::move(name)}
    , origin_loc_{std::move(loc)}
  { }

  std::string const&
  name() const { return name_; }

  source_location const&
  origin_location() const { return origin_loc_; }

  std::string
  show(std::size_t indent) const;

private:
  std::string     name_;
  source_location origin_loc_;
};

// Call of a function by name.
class application_expression {
public:
  static constexpr char const* type_name = "application_expression";

  application_expression(source_location loc, std::string name,
                         std::vector<expression> args)
    : name_{std::move(name)}
    , arguments_{std::move(args)}
    , origin_loc_{std::move(loc)}
  { }

  std::string const&
  name() const { return name_; }

  std::vector<expression> const&
  arguments() const { return arguments_; }

  source_location const&
  origin_location() const { return origin_loc_; }

  std::string
  show(std::size_t indent) const;

private:
  std::string             name_;
  std::vector<expression> arguments_;
  source_location         origin_loc_;
};

// Ns.member(args...)
class qualified_call_expression {
public:
  static constexpr char const* type_name = "qualified_call_expression";

  qualified_call_expression(source_location loc, std::string module_name,
                            std::string member, std::vector<expression> args)
    : module_name_{std::move(module_name)}
    , member_{std::move(member)}
    , arguments_{std::move(args)}
    , origin_loc_{std::move(loc)}
  { }

  std::string const&
  module_name() const { return module_name_; }

  std::string const&
  member() const { return member_; }

  std::vector<expression> const&
  arguments() const { return arguments_; }

  source_location const&
  origin_location() const { return origin_loc_; }

  std::string
  show(std::size_t indent) const;

private:
  std::string             module_name_;
  std::string             member_;
  std::vector<expression> arguments_;
  source_location         origin_loc_;
};

// Call of a procedure value computed at run time.
class apply_expression {
public:
  static constexpr char const* type_name = "apply_expression";

  apply_expression(source_location loc, expression target,
                   std::vector<expression> args)
    : target_{std::move(target)}
    , arguments_{std::move(args)}
    , origin_loc_{std::move(loc)}
  { }

  expression const&
  target() const { return target_; }

  std::vector<expression> const&
  arguments() const { return arguments_; }

  source_location const&
  origin_location() const { return origin_loc_; }

  std::string
  show(std::size_t indent) const;

private:
  expression              target_;
  std::vector<expression> arguments_;
  source_location         origin_loc_;
};

class built_in_operation_expression {
public:
  static constexpr char const* type_name = "built_in_operation_expression";

  built_in_operation_expression(source_location loc, opcode op,
                                std::vector<expression> operands)
    : operation_{op}
    , operands_{std::move(operands)}
    , origin_loc_{std::move(loc)}
  { }

  opcode
  operation() const { return operation_; }

  std::vector<expression> const&
  operands() const { return operands_; }

  source_location const&
  origin_location() const { return origin_loc_; }

  std::string
  show(std::size_t indent) const;

private:
  opcode                  operation_;
  std::vector<expression> operands_;
  source_location         origin_loc_;
};

// Short-circuiting: yields lhs if it is falsy, rhs otherwise.
class and_expression {
public:
  static constexpr char const* type_name = "and_expression";

  and_expression(expression lhs, expression rhs)
    : lhs_{std::move(lhs)}
    , rhs_{std::move(rhs)}
  { }

  expression const&
  lhs() const { return lhs_; }

  expression const&
  rhs() const { return rhs_; }

  std::string
  show(std::size_t indent) const;

private:
  expression lhs_;
  expression rhs_;
};

// Short-circuiting: yields lhs if it is truthy, rhs otherwise.
class or_expression {
public:
  static constexpr char const* type_name = "or_expression";

  or_expression(expression lhs, expression rhs)
    : lhs_{std::move(lhs)}
    , rhs_{std::move(rhs)}
  { }

  expression const&
  lhs() const { return lhs_; }

  expression const&
  rhs() const { return rhs_; }

  std::string
  show(std::size_t indent) const;

private:
  expression lhs_;
  expression rhs_;
};

class if_expression {
public:
  static constexpr char const* type_name = "if_expression";

  if_expression(expression test, expression consequent,
                expression alternative)
    : test_{std::move(test)}
    , consequent_{std::move(consequent)}
    , alternative_{std::move(alternative)}
  { }

  expression const&
  test() const { return test_; }

  expression const&
  consequent() const { return consequent_; }

  expression const&
  alternative() const { return alternative_; }

  std::string
  show(std::size_t indent) const;

private:
  expression test_;
  expression consequent_;
  expression alternative_;
};

class cond_expression {
public:
  static constexpr char const* type_name = "cond_expression";

  struct clause {
    expression test;
    expression result;
  };

  cond_expression(source_location loc, std::vector<clause> clauses)
    : clauses_{std::move(clauses)}
    , origin_loc_{std::move(loc)}
  { }

  std::vector<clause> const&
  clauses() const { return clauses_; }

  source_location const&
  origin_location() const { return origin_loc_; }

  std::string
  show(std::size_t indent) const;

private:
  std::vector<clause> clauses_;
  source_location     origin_loc_;
};

class case_expression {
public:
  static constexpr char const* type_name = "case_expression";

  // A clause without a pattern matches anything.
  struct clause {
    std::optional<parens::value> pattern;
    expression                   body;
  };

  case_expression(source_location loc, expression scrutinee,
                  std::vector<clause> clauses)
    : scrutinee_{std::move(scrutinee)}
    , clauses_{std::move(clauses)}
    , origin_loc_{std::move(loc)}
  { }

  expression const&
  scrutinee() const { return scrutinee_; }

  std::vector<clause> const&
  clauses() const { return clauses_; }

  source_location const&
  origin_location() const { return origin_loc_; }

  std::string
  show(std::size_t indent) const;

private:
  expression          scrutinee_;
  std::vector<clause> clauses_;
  source_location     origin_loc_;
};

// Sequential bindings: each initialiser sees the names bound before it.
class let_expression {
public:
  static constexpr char const* type_name = "let_expression";

  struct binding {
    std::string name;
    expression  init;
  };

  let_expression(std::vector<binding> bindings, expression body)
    : bindings_{std::move(bindings)}
    , body_{std::move(body)}
  { }

  std::vector<binding> const&
  bindings() const { return bindings_; }

  expression const&
  body() const { return body_; }

  std::string
  show(std::size_t indent) const;

private:
  std::vector<binding> bindings_;
  expression           body_;
};

// One clause of a named or anonymous function. The clause applies when the
// arguments match the parameter patterns and every guard is truthy.
struct function_clause {
  std::vector<pattern>    parameters;
  std::vector<expression> guards;
  expression              body;
  source_location         location;
};

class lambda_expression {
public:
  static constexpr char const* type_name = "lambda_expression";

  explicit
  lambda_expression(std::shared_ptr<function_clause const> clause)
    : clause_{std::move(clause)}
  { }

  std::shared_ptr<function_clause const> const&
  clause() const { return clause_; }

  std::string
  show(std::size_t indent) const;

private:
  std::shared_ptr<function_clause const> clause_;
};

// defn or defp. Evaluating it adds its clauses to the current module.
class function_definition_expression {
public:
  static constexpr char const* type_name = "function_definition_expression";

  function_definition_expression(
    std::string name, bool exported,
    std::vector<std::shared_ptr<function_clause const>> clauses
  )
    : name_{std::move(name)}
    , exported_{exported}
    , clauses_{std::move(clauses)}
  { }

  std::string const&
  name() const { return name_; }

  bool
  exported() const { return exported_; }

  std::vector<std::shared_ptr<function_clause const>> const&
  clauses() const { return clauses_; }

  std::string
  show(std::size_t indent) const;

private:
  std::string                                         name_;
  bool                                                exported_;
  std::vector<std::shared_ptr<function_clause const>> clauses_;
};

// def
class definition_expression {
public:
  static constexpr char const* type_name = "definition_expression";

  definition_expression(std::string name, expression value)
    : name_{std::move(name)}
    , value_{std::move(value)}
  { }

  std::string const&
  name() const { return name_; }

  expression const&
  value() const { return value_; }

  std::string
  show(std::size_t indent) const;

private:
  std::string name_;
  expression  value_;
};

class sequence_expression {
public:
  static constexpr char const* type_name = "sequence_expression";

  sequence_expression() = default;

  explicit
  sequence_expression(std::vector<expression> exprs)
    : expressions_{std::move(exprs)}
  { }

  std::vector<expression> const&
  expressions() const { return expressions_; }

  std::string
  show(std::size_t indent) const;

private:
  std::vector<expression> expressions_;
};

class try_expression {
public:
  static constexpr char const* type_name = "try_expression";

  explicit
  try_expression(expression body)
    : body_{std::move(body)}
  { }

  expression const&
  body() const { return body_; }

  std::string
  show(std::size_t indent) const;

private:
  expression body_;
};

// Builds a list. Elements flagged as spliced must evaluate to lists, whose
// elements are inserted in place.
class make_list_expression {
public:
  static constexpr char const* type_name = "make_list_expression";

  explicit
  make_list_expression(std::vector<expression> elements)
    : elements_{std::move(elements)}
    , spliced_(elements_.size(), false)
  { }

  make_list_expression(std::vector<expression> elements,
                       std::vector<bool> spliced)
    : elements_{std::move(elements)}
    , spliced_{std::move(spliced)}
  { }

  std::vector<expression> const&
  elements() const { return elements_; }

  bool
  spliced(std::size_t i) const { return spliced_[i]; }

  std::string
  show(std::size_t indent) const;

private:
  std::vector<expression> elements_;
  std::vector<bool>       spliced_;
};

class make_tuple_expression {
public:
  static constexpr char const* type_name = "make_tuple_expression";

  explicit
  make_tuple_expression(std::vector<expression> elements)
    : elements_{std::move(elements)}
  { }

  std::vector<expression> const&
  elements() const { return elements_; }

  std::string
  show(std::size_t indent) const;

private:
  std::vector<expression> elements_;
};

class module_definition_expression {
public:
  static constexpr char const* type_name = "module_definition_expression";

  module_definition_expression(std::string name, std::vector<expression> body)
    : name_{std::move(name)}
    , body_{std::move(body)}
  { }

  std::string const&
  name() const { return name_; }

  std::vector<expression> const&
  body() const { return body_; }

  std::string
  show(std::size_t indent) const;

private:
  std::string             name_;
  std::vector<expression> body_;
};

class variable_pattern {
public:
  static constexpr char const* type_name = "variable_pattern";

  explicit
  variable_pattern(std::string name)
    : name_{std::move(name)}
  { }

  std::string const&
  name() const { return name_; }

  std::string
  show() const { return name_; }

private:
  std::string name_;
};

class wildcard_pattern {
public:
  static constexpr char const* type_name = "wildcard_pattern";

  std::string
  show() const { return "_"; }
};

class literal_pattern {
public:
  static constexpr char const* type_name = "literal_pattern";

  explicit
  literal_pattern(parens::value v)
    : value_{std::move(v)}
  { }

  parens::value const&
  value() const { return value_; }

  std::string
  show() const;

private:
  parens::value value_;
};

// Matches a list with exactly as many elements as there are element patterns,
// or, if there is a rest pattern, at least as many; the rest pattern is then
// matched against the remaining elements.
class list_pattern {
public:
  static constexpr char const* type_name = "list_pattern";

  list_pattern(std::vector<pattern> elements, pattern rest)
    : elements_{std::move(elements)}
    , rest_{std::move(rest)}
  { }

  std::vector<pattern> const&
  elements() const { return elements_; }

  // Empty if the pattern has no rest part.
  pattern const&
  rest() const { return rest_; }

  std::string
  show() const;

private:
  std::vector<pattern> elements_;
  pattern              rest_;
};

class tuple_pattern {
public:
  static constexpr char const* type_name = "tuple_pattern";

  explicit
  tuple_pattern(std::vector<pattern> elements)
    : elements_{std::move(elements)}
  { }

  std::vector<pattern> const&
  elements() const { return elements_; }

  std::string
  show() const;

private:
  std::vector<pattern> elements_;
};

// Readable source text of the expression, with nested lines indented by
// indent + 2 spaces.
std::string
show(expression const&, std::size_t indent = 0);

std::string
show(pattern const&);

// Names bound by the pattern, in left-to-right order.
std::vector<std::string>
pattern_variables(pattern const&);

template <typename T, typename... Args>
expression
make_expression(Args&&... args) {
  return std::make_shared<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args>
pattern
make_pattern(Args&&... args) {
  return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace parens

#endif
