#include "compiler/ast.hpp"

#include "io/write.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string>
#include <vector>

namespace parens {

static std::string
show_value(value const& v);

static std::string
show_elements(value_vector const& elements) {
  std::vector<std::string> parts;
  for (value const& e : elements)
    parts.push_back(show_value(e));
  return fmt::format("{}", fmt::join(parts, ", "));
}

static std::string
show_value(value const& v) {
  if (auto l = match<value::list>(v))
    return fmt::format("[{}]", show_elements(*l->elements));
  else if (auto t = match<value::tuple>(v))
    return fmt::format("{{{}}}", show_elements(*t->elements));
  else if (auto m = match<value::map>(v)) {
    std::vector<std::string> parts;
    for (auto const& [key, val] : *m->entries)
      parts.push_back(fmt::format("{} => {}", show_value(key), show_value(val)));
    return fmt::format("%{{{}}}", fmt::join(parts, ", "));
  } else
    return value_to_string(v);
}

static std::string
padding(std::size_t indent) {
  return std::string(indent, ' ');
}

static std::string
show_list(std::vector<expression> const& exprs, std::size_t indent) {
  std::vector<std::string> parts;
  for (expression const& e : exprs)
    parts.push_back(show(e, indent));
  return fmt::format("{}", fmt::join(parts, ", "));
}

static std::string
show_block(std::vector<expression> const& exprs, std::size_t indent) {
  std::string result;
  for (expression const& e : exprs)
    result += fmt::format("{}{}\n", padding(indent + 2), show(e, indent + 2));
  return result;
}

static std::string
show_patterns(std::vector<pattern> const& patterns) {
  std::vector<std::string> parts;
  for (pattern const& p : patterns)
    parts.push_back(show(p));
  return fmt::format("{}", fmt::join(parts, ", "));
}

static std::string
show_guards(std::vector<expression> const& guards, std::size_t indent) {
  if (guards.empty())
    return "";

  std::vector<std::string> parts;
  for (expression const& g : guards)
    parts.push_back(show(g, indent));
  return fmt::format(" when {}", fmt::join(parts, " and "));
}

static bool
is_infix(opcode op) {
  switch (op) {
  case opcode::add:
  case opcode::subtract:
  case opcode::multiply:
  case opcode::divide:
  case opcode::remainder:
  case opcode::less:
  case opcode::greater:
  case opcode::less_or_equal:
  case opcode::greater_or_equal:
  case opcode::arith_equal:
  case opcode::arith_not_equal:
    return true;
  default:
    return false;
  }
}

static int
precedence(opcode op) {
  switch (op) {
  case opcode::negate:
  case opcode::not_:
    return 6;
  case opcode::multiply:
  case opcode::divide:
  case opcode::remainder:
    return 5;
  case opcode::add:
  case opcode::subtract:
    return 4;
  case opcode::less:
  case opcode::greater:
  case opcode::less_or_equal:
  case opcode::greater_or_equal:
  case opcode::arith_equal:
  case opcode::arith_not_equal:
    return 3;
  default:
    return 10;
  }
}

static int
precedence(expression const& e) {
  if (auto op = match<built_in_operation_expression>(e))
    return precedence(op->operation());
  else if (is<and_expression>(e))
    return 2;
  else if (is<or_expression>(e))
    return 1;
  else
    return 10;
}

// Operand of an infix or prefix operator, parenthesised if it binds less
// tightly than the operator. Operators associate to the left.
static std::string
show_operand(expression const& operand, int parent, bool right,
             std::size_t indent) {
  int p = precedence(operand);
  std::string s = show(operand, indent);
  if (p < parent || (right && p == parent))
    return fmt::format("({})", s);
  else
    return s;
}

std::string
literal_expression::show(std::size_t) const {
  return show_value(value_);
}

std::string
local_reference_expression::show(std::size_t) const {
  return name_;
}

std::string
free_reference_expression::show(std::size_t) const {
  return name_;
}

std::string
application_expression::show(std::size_t indent) const {
  return fmt::format("{}({})", name_, show_list(arguments_, indent));
}

std::string
qualified_call_expression::show(std::size_t indent) const {
  return fmt::format("{}.{}({})", module_name_, member_,
                     show_list(arguments_, indent));
}

std::string
apply_expression::show(std::size_t indent) const {
  return fmt::format("apply({}, [{}])", parens::show(target_, indent),
                     show_list(arguments_, indent));
}

std::string
built_in_operation_expression::show(std::size_t indent) const {
  char const* name = operation_name(operation_);
  int prec = precedence(operation_);

  if (is_infix(operation_) && operands_.size() == 2)
    return fmt::format("{} {} {}",
                       show_operand(operands_[0], prec, false, indent),
                       name,
                       show_operand(operands_[1], prec, true, indent));
  else if (operation_ == opcode::negate)
    return fmt::format("-{}", show_operand(operands_[0], prec, false, indent));
  else if (operation_ == opcode::not_)
    return fmt::format("not {}",
                       show_operand(operands_[0], prec, false, indent));
  else
    return fmt::format("{}({})", name, show_list(operands_, indent));
}

std::string
and_expression::show(std::size_t indent) const {
  return fmt::format("{} and {}", show_operand(lhs_, 2, false, indent),
                     show_operand(rhs_, 2, true, indent));
}

std::string
or_expression::show(std::size_t indent) const {
  return fmt::format("{} or {}", show_operand(lhs_, 1, false, indent),
                     show_operand(rhs_, 1, true, indent));
}

std::string
if_expression::show(std::size_t indent) const {
  std::string pad = padding(indent);
  std::string inner = padding(indent + 2);
  return fmt::format("if {} then\n{}{}\n{}else\n{}{}\n{}end",
                     parens::show(test_, indent),
                     inner, parens::show(consequent_, indent + 2),
                     pad,
                     inner, parens::show(alternative_, indent + 2),
                     pad);
}

std::string
cond_expression::show(std::size_t indent) const {
  std::string result = "cond\n";
  for (clause const& c : clauses_)
    result += fmt::format("{}{} -> {}\n", padding(indent + 2),
                          parens::show(c.test, indent + 2),
                          parens::show(c.result, indent + 2));
  return result + padding(indent) + "end";
}

std::string
case_expression::show(std::size_t indent) const {
  std::string result = fmt::format("case {} of\n",
                                   parens::show(scrutinee_, indent));
  for (clause const& c : clauses_)
    result += fmt::format("{}{} -> {}\n", padding(indent + 2),
                          c.pattern ? show_value(*c.pattern) : "_",
                          parens::show(c.body, indent + 2));
  return result + padding(indent) + "end";
}

std::string
let_expression::show(std::size_t indent) const {
  std::vector<std::string> parts;
  for (binding const& b : bindings_)
    parts.push_back(fmt::format("{} = {}", b.name,
                                parens::show(b.init, indent)));
  return fmt::format("let {} in\n{}{}\n{}end",
                     fmt::join(parts, ", "),
                     padding(indent + 2), parens::show(body_, indent + 2),
                     padding(indent));
}

std::string
lambda_expression::show(std::size_t indent) const {
  return fmt::format("fn ({}){} -> {} end",
                     show_patterns(clause_->parameters),
                     show_guards(clause_->guards, indent),
                     parens::show(clause_->body, indent));
}

std::string
function_definition_expression::show(std::size_t indent) const {
  std::vector<std::string> parts;
  for (auto const& c : clauses_)
    parts.push_back(fmt::format("{} {}({}){} do\n{}{}\n{}end",
                                exported_ ? "defn" : "defp",
                                name_,
                                show_patterns(c->parameters),
                                show_guards(c->guards, indent),
                                padding(indent + 2),
                                parens::show(c->body, indent + 2),
                                padding(indent)));
  return fmt::format("{}", fmt::join(parts, "\n" + padding(indent)));
}

std::string
definition_expression::show(std::size_t indent) const {
  return fmt::format("def {} = {}", name_, parens::show(value_, indent));
}

std::string
sequence_expression::show(std::size_t indent) const {
  if (expressions_.empty())
    return "do end";
  return fmt::format("do\n{}{}end", show_block(expressions_, indent),
                     padding(indent));
}

std::string
try_expression::show(std::size_t indent) const {
  return fmt::format("try do\n{}{}\n{}end", padding(indent + 2),
                     parens::show(body_, indent + 2), padding(indent));
}

std::string
make_list_expression::show(std::size_t indent) const {
  std::vector<std::string> parts;
  for (std::size_t i = 0; i < elements_.size(); ++i)
    parts.push_back(fmt::format("{}{}", spliced_[i] ? "..." : "",
                                parens::show(elements_[i], indent)));
  return fmt::format("[{}]", fmt::join(parts, ", "));
}

std::string
make_tuple_expression::show(std::size_t indent) const {
  return fmt::format("{{{}}}", show_list(elements_, indent));
}

std::string
module_definition_expression::show(std::size_t indent) const {
  return fmt::format("defmodule {} do\n{}{}end", name_,
                     show_block(body_, indent), padding(indent));
}

std::string
literal_pattern::show() const {
  return show_value(value_);
}

std::string
list_pattern::show() const {
  if (rest_)
    return fmt::format("[{} | {}]", show_patterns(elements_),
                       parens::show(rest_));
  else
    return fmt::format("[{}]", show_patterns(elements_));
}

std::string
tuple_pattern::show() const {
  return fmt::format("{{{}}}", show_patterns(elements_));
}

std::string
show(expression const& e, std::size_t indent) {
  return e.visit([&] (auto const& node) { return node->show(indent); });
}

std::string
show(pattern const& p) {
  return p.visit([] (auto const& node) { return node->show(); });
}

static void
collect_variables(pattern const& p, std::vector<std::string>& result) {
  if (auto v = match<variable_pattern>(p))
    result.push_back(v->name());
  else if (auto l = match<list_pattern>(p)) {
    for (pattern const& e : l->elements())
      collect_variables(e, result);
    if (l->rest())
      collect_variables(l->rest(), result);
  } else if (auto t = match<tuple_pattern>(p))
    for (pattern const& e : t->elements())
      collect_variables(e, result);
}

std::vector<std::string>
pattern_variables(pattern const& p) {
  std::vector<std::string> result;
  collect_variables(p, result);
  return result;
}

} // namespace parens
