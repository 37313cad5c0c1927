#include "compiler/transformer.hpp"

#include "compiler/ast.hpp"
#include "compiler/binding_environment.hpp"
#include "compiler/operations.hpp"
#include "io/write.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace parens {

transform_error::transform_error(std::string const& message,
                                 source_location const& loc)
  : error{loc, "Transform error: {}", message}
{ }

namespace {
  struct transform_context {
    transform_config const& config;
  };
}

using arguments = std::span<sexpr const>;

static expression
transform_expression(transform_context&, sexpr const&,
                     binding_environment const&);

static std::vector<expression>
transform_expressions(transform_context& tc, arguments args,
                      binding_environment const& env) {
  std::vector<expression> result;
  result.reserve(args.size());
  for (sexpr const& arg : args)
    result.push_back(transform_expression(tc, arg, env));
  return result;
}

static bool
is_special_name(std::string const& name) {
  return find_symbolic(special_forms, name) || find_operation(name);
}

static binding_environment
bind_name(transform_context& tc, binding_environment const& env,
          std::string const& name, source_location const& loc) {
  if (is_special_name(name))
    tc.config.diagnostics.show(
      loc,
      fmt::format("Binding {} shadows the special form of the same name", name)
    );
  return env.extend(name);
}

static std::string const&
expect_name(sexpr const& x, std::string_view form) {
  if (auto a = match<sexpr::atom>(x))
    return a->name;
  else
    throw transform_error{fmt::format("{} expects a name, got {}", form,
                                      sexpr_to_string(x)),
                          x.location};
}

static void
check_argument_count(arguments args, std::size_t min, std::size_t max,
                     std::string_view form, source_location const& loc) {
  if (args.size() < min || args.size() > max) {
    std::string expected = min == max
                             ? fmt::format("{}", min)
                             : fmt::format("{} to {}", min, max);
    throw transform_error{fmt::format("{} expects {} arguments, got {}",
                                      form, expected, args.size()),
                          loc};
  }
}

static bool
is_when_keyword(sexpr const& x) {
  auto k = match<sexpr::keyword>(x);
  return k && k->name == "when";
}

static std::string const*
definition_name(sexpr const& x) {
  if (auto l = match<sexpr::list>(x))
    if (l->elements.size() >= 2 && is_symbol(l->elements[0], "def"))
      if (auto a = match<sexpr::atom>(l->elements[1]))
        return &a->name;
  return nullptr;
}

// Transform a body, making each def visible to the forms that follow it.
static std::vector<expression>
transform_body(transform_context& tc, arguments forms,
               binding_environment env) {
  std::vector<expression> result;
  for (sexpr const& form : forms) {
    result.push_back(transform_expression(tc, form, env));
    if (std::string const* name = definition_name(form))
      env = bind_name(tc, env, *name, form.location);
  }
  return result;
}

value
quote_datum(sexpr const& x) {
  auto quote_all = [] (std::vector<sexpr> const& elements) {
    value_vector result;
    result.reserve(elements.size());
    for (sexpr const& e : elements)
      result.push_back(quote_datum(e));
    return result;
  };

  auto prefixed = [] (char const* name, sexpr const& datum) {
    return make_list({make_tag(name), quote_datum(datum)});
  };

  if (is<sexpr::nil>(x))
    return value::nil{};
  else if (auto a = match<sexpr::atom>(x))
    return make_tag(a->name);
  else if (auto n = match<sexpr::number>(x))
    return std::visit([] (auto v) { return value{v}; }, n->value);
  else if (auto s = match<sexpr::string_literal>(x))
    return s->value;
  else if (auto b = match<sexpr::boolean>(x))
    return b->value;
  else if (auto k = match<sexpr::keyword>(x))
    return make_tag(k->name);
  else if (auto i = match<sexpr::interpolate>(x))
    return make_list({make_tag("interpolate"), make_tag(i->name)});
  else if (auto l = match<sexpr::list>(x))
    return make_list(quote_all(l->elements));
  else if (auto v = match<sexpr::vector>(x))
    return make_list(quote_all(v->elements));
  else if (auto t = match<sexpr::tuple>(x))
    return make_tuple(quote_all(t->elements));
  else if (auto q = match<sexpr::quote>(x))
    return prefixed("quote", *q->datum);
  else if (auto qq = match<sexpr::quasiquote>(x))
    return prefixed("quasiquote", *qq->datum);
  else if (auto u = match<sexpr::unquote>(x))
    return prefixed("unquote", *u->datum);
  else
    return prefixed("unquote-splicing",
                    *std::get<sexpr::unquote_splicing>(x.value).datum);
}

static bool
contains_unquote(sexpr const& x) {
  if (is<sexpr::unquote>(x) || is<sexpr::unquote_splicing>(x)
      || is<sexpr::interpolate>(x))
    return true;
  else if (auto elements = sequence_elements(x))
    return std::ranges::any_of(*elements, contains_unquote);
  else
    return false;
}

static expression
transform_quasiquote(transform_context& tc, sexpr const& x,
                     binding_environment const& env) {
  if (!contains_unquote(x))
    return make_expression<literal_expression>(quote_datum(x));

  if (auto u = match<sexpr::unquote>(x))
    return transform_expression(tc, *u->datum, env);
  else if (auto i = match<sexpr::interpolate>(x))
    return make_expression<local_reference_expression>(i->name);
  else if (is<sexpr::unquote_splicing>(x))
    throw transform_error{"Splice outside of a list", x.location};
  else if (auto t = match<sexpr::tuple>(x)) {
    std::vector<expression> elements;
    for (sexpr const& e : t->elements) {
      if (is<sexpr::unquote_splicing>(e))
        throw transform_error{"Can't splice into a tuple", e.location};
      elements.push_back(transform_quasiquote(tc, e, env));
    }
    return make_expression<make_tuple_expression>(std::move(elements));
  }

  std::vector<expression> elements;
  std::vector<bool> spliced;
  for (sexpr const& e : *sequence_elements(x))
    if (auto s = match<sexpr::unquote_splicing>(e)) {
      elements.push_back(transform_expression(tc, *s->datum, env));
      spliced.push_back(true);
    } else {
      elements.push_back(transform_quasiquote(tc, e, env));
      spliced.push_back(false);
    }
  return make_expression<make_list_expression>(std::move(elements),
                                               std::move(spliced));
}

static pattern
transform_pattern(sexpr const& x, std::vector<sexpr const*>& guards);

static std::vector<pattern>
transform_patterns(arguments elements, std::vector<sexpr const*>& guards) {
  std::vector<pattern> result;
  for (sexpr const& e : elements)
    result.push_back(transform_pattern(e, guards));
  return result;
}

static pattern
transform_list_pattern(std::vector<sexpr> const& elements,
                       source_location const& loc,
                       std::vector<sexpr const*>& guards) {
  auto bar = std::ranges::find_if(elements, [] (sexpr const& e) {
    return is_symbol(e, "|");
  });
  if (bar == elements.end())
    return make_pattern<list_pattern>(transform_patterns(elements, guards),
                                      pattern{});

  if (std::next(bar) == elements.end() || std::next(bar, 2) != elements.end())
    throw transform_error{"Expected exactly one pattern after |", loc};

  return make_pattern<list_pattern>(
    transform_patterns(arguments{elements.begin(), bar}, guards),
    transform_pattern(*std::next(bar), guards)
  );
}

static pattern
transform_pattern(sexpr const& x, std::vector<sexpr const*>& guards) {
  if (auto a = match<sexpr::atom>(x)) {
    if (a->name == "_")
      return make_pattern<wildcard_pattern>();
    else if (a->name == "|")
      throw transform_error{"Unexpected | in pattern", x.location};
    else
      return make_pattern<variable_pattern>(a->name);
  } else if (is<sexpr::nil>(x) || is<sexpr::number>(x)
             || is<sexpr::string_literal>(x) || is<sexpr::boolean>(x)
             || is<sexpr::keyword>(x))
    return make_pattern<literal_pattern>(quote_datum(x));
  else if (auto q = match<sexpr::quote>(x))
    return make_pattern<literal_pattern>(quote_datum(*q->datum));
  else if (auto v = match<sexpr::vector>(x))
    return transform_list_pattern(v->elements, x.location, guards);
  else if (auto t = match<sexpr::tuple>(x))
    return make_pattern<tuple_pattern>(transform_patterns(t->elements, guards));
  else if (auto l = match<sexpr::list>(x)) {
    auto const& elements = l->elements;
    if (elements.empty())
      return make_pattern<literal_pattern>(make_list(value_vector{}));
    else if (is_symbol(elements[0], "|")) {
      if (elements.size() != 3)
        throw transform_error{"(| head tail) expects two patterns",
                              x.location};
      return make_pattern<list_pattern>(
        std::vector<pattern>{transform_pattern(elements[1], guards)},
        transform_pattern(elements[2], guards)
      );
    } else if (is_symbol(elements[0], "when")) {
      if (elements.size() != 3)
        throw transform_error{"(when pattern guard) expects two arguments",
                              x.location};
      pattern result = transform_pattern(elements[1], guards);
      guards.push_back(&elements[2]);
      return result;
    } else
      return make_pattern<tuple_pattern>(transform_patterns(elements, guards));
  } else
    throw transform_error{fmt::format("Invalid pattern: {}", sexpr_to_string(x)),
                          x.location};
}

static std::vector<sexpr> const&
parameter_list(sexpr const& params, std::string_view form) {
  if (auto v = match<sexpr::vector>(params))
    return v->elements;
  else if (auto l = match<sexpr::list>(params))
    return l->elements;
  else
    throw transform_error{fmt::format("Invalid argument list in {}: {}", form,
                                      sexpr_to_string(params)),
                          params.location};
}

static std::shared_ptr<function_clause const>
transform_clause(transform_context& tc, sexpr const& params,
                 sexpr const* guard, sexpr const& body,
                 binding_environment env, std::string_view form) {
  std::vector<sexpr const*> guard_forms;
  std::vector<pattern> patterns = transform_patterns(parameter_list(params, form),
                                                     guard_forms);
  if (guard)
    guard_forms.push_back(guard);

  for (pattern const& p : patterns)
    for (std::string const& name : pattern_variables(p))
      env = bind_name(tc, env, name, params.location);

  std::vector<expression> guards;
  for (sexpr const* g : guard_forms)
    guards.push_back(transform_expression(tc, *g, env));

  return std::make_shared<function_clause const>(
    function_clause{std::move(patterns), std::move(guards),
                    transform_expression(tc, body, env), params.location}
  );
}

static bool
is_parameter_sequence(sexpr const& x) {
  return is<sexpr::vector>(x) || is<sexpr::list>(x);
}

// [params body], [params guard body] or [params :when guard body], as a vector
// or a list, with params itself a vector or a list.
static bool
is_clause_shaped(sexpr const& x) {
  if (!is_parameter_sequence(x))
    return false;

  auto const& elements = *sequence_elements(x);
  std::size_t size = elements.size();
  return (size == 2 || size == 3
          || (size == 4 && is_when_keyword(elements[1])))
         && is_parameter_sequence(elements[0]);
}

static std::shared_ptr<function_clause const>
transform_clause_form(transform_context& tc, sexpr const& clause,
                      binding_environment const& env, std::string_view form) {
  auto const& elements = *sequence_elements(clause);
  if (elements.size() == 2)
    return transform_clause(tc, elements[0], nullptr, elements[1], env, form);
  else if (elements.size() == 3)
    return transform_clause(tc, elements[0], &elements[1], elements[2], env,
                            form);
  else
    return transform_clause(tc, elements[0], &elements[2], elements[3], env,
                            form);
}

// Names bound by a parameter sequence, or nothing if it is not a valid one.
static std::optional<std::vector<std::string>>
names_bound_by(sexpr const& params) {
  if (!is_parameter_sequence(params))
    return std::nullopt;

  std::vector<sexpr const*> guards;
  std::vector<std::string> result;
  try {
    for (pattern const& p : transform_patterns(*sequence_elements(params),
                                               guards))
      for (std::string const& name : pattern_variables(p))
        result.push_back(name);
  } catch (transform_error const&) {
    return std::nullopt;
  }
  return result;
}

static void
collect_symbols(sexpr const& x, std::vector<std::string>& result) {
  if (auto a = match<sexpr::atom>(x))
    result.push_back(a->name);
  else if (auto i = match<sexpr::interpolate>(x))
    result.push_back(i->name);
  else if (auto u = match<sexpr::unquote>(x))
    collect_symbols(*u->datum, result);
  else if (auto s = match<sexpr::unquote_splicing>(x))
    collect_symbols(*s->datum, result);
  else if (auto elements = sequence_elements(x))
    for (sexpr const& e : *elements)
      collect_symbols(e, result);
}

namespace {
  enum class definition_shape { clauses, single_clause, ambiguous };
}

// Two clause-shaped forms after the name can also be read as a single
// parameter list and its body. They are clauses unless one of them uses a
// name that its own parameters leave unbound but the single-clause
// parameters would bind.
static definition_shape
two_form_shape(arguments rest, binding_environment const& env) {
  auto single_bound = names_bound_by(rest[0]);
  if (!single_bound)
    return definition_shape::clauses;

  for (sexpr const& clause : rest) {
    auto const& elements = *sequence_elements(clause);
    auto own_bound = names_bound_by(elements[0]);
    if (!own_bound)
      return definition_shape::single_clause;

    std::vector<std::string> used;
    for (std::size_t i = 1; i < elements.size(); ++i)
      collect_symbols(elements[i], used);

    for (std::string const& name : used)
      if (!env.contains(name)
          && std::ranges::find(*own_bound, name) == own_bound->end()
          && std::ranges::find(*single_bound, name) != single_bound->end())
        return definition_shape::ambiguous;
  }

  return definition_shape::clauses;
}

static expression
transform_function_definition(transform_context& tc, arguments args,
                              bool exported, source_location const& loc,
                              binding_environment const& env) {
  char const* form = exported ? "defn" : "defp";
  if (args.size() < 2)
    throw transform_error{fmt::format("{} expects a name and a function body",
                                      form),
                          loc};

  std::string const& name = expect_name(args[0], form);
  arguments rest = args.subspan(1);

  bool all_clauses = std::ranges::all_of(rest, is_clause_shaped);
  if (all_clauses && rest.size() == 2) {
    definition_shape shape = two_form_shape(rest, env);
    if (shape == definition_shape::ambiguous)
      throw transform_error{
        fmt::format("{} {} is ambiguous: its two forms read both as two "
                    "clauses and as one argument list with a body",
                    form, name),
        loc
      };
    all_clauses = shape == definition_shape::clauses;
  }

  std::vector<std::shared_ptr<function_clause const>> clauses;
  if (all_clauses)
    for (sexpr const& clause : rest)
      clauses.push_back(transform_clause_form(tc, clause, env, form));
  else if (rest.size() == 2)
    clauses.push_back(transform_clause(tc, rest[0], nullptr, rest[1], env,
                                       form));
  else if (rest.size() == 4 && is_when_keyword(rest[1]))
    clauses.push_back(transform_clause(tc, rest[0], &rest[2], rest[3], env,
                                       form));
  else
    throw transform_error{
      fmt::format("{} {} expects an argument list and a body", form, name),
      loc
    };

  return make_expression<function_definition_expression>(name, exported,
                                                          std::move(clauses));
}

static expression
transform_lambda(transform_context& tc, arguments args,
                 source_location const& loc, binding_environment const& env) {
  if (args.size() == 2)
    return make_expression<lambda_expression>(
      transform_clause(tc, args[0], nullptr, args[1], env, "fn")
    );
  else if (args.size() == 4 && is_when_keyword(args[1]))
    return make_expression<lambda_expression>(
      transform_clause(tc, args[0], &args[2], args[3], env, "fn")
    );
  else
    throw transform_error{"fn expects an argument list and a body", loc};
}

static expression
transform_def(transform_context& tc, arguments args,
              source_location const& loc, binding_environment const& env) {
  check_argument_count(args, 2, 2, "def", loc);
  return make_expression<definition_expression>(
    expect_name(args[0], "def"),
    transform_expression(tc, args[1], env)
  );
}

static expression
transform_defmodule(transform_context& tc, arguments args,
                    source_location const& loc,
                    binding_environment const& env) {
  if (args.empty())
    throw transform_error{"defmodule expects a module name", loc};

  return make_expression<module_definition_expression>(
    expect_name(args[0], "defmodule"),
    transform_body(tc, args.subspan(1), env)
  );
}

// Bindings are either flat, [x 1 y 2], or pairs, [(x 1) (y 2)].
static std::vector<std::pair<sexpr const*, sexpr const*>>
let_pairs(sexpr const& bindings) {
  auto elements = sequence_elements(bindings);
  if (!elements || is<sexpr::tuple>(bindings))
    throw transform_error{fmt::format("Invalid let bindings: {}",
                                      sexpr_to_string(bindings)),
                          bindings.location};

  std::vector<std::pair<sexpr const*, sexpr const*>> result;
  bool pair_form = !elements->empty()
                   && std::ranges::all_of(*elements, [] (sexpr const& e) {
                        auto l = match<sexpr::list>(e);
                        return l && l->elements.size() == 2;
                      });

  if (pair_form)
    for (sexpr const& e : *elements) {
      auto const& pair = match<sexpr::list>(e)->elements;
      result.emplace_back(&pair[0], &pair[1]);
    }
  else {
    if (elements->size() % 2 != 0)
      throw transform_error{"let bindings need a value for every name",
                            bindings.location};
    for (std::size_t i = 0; i < elements->size(); i += 2)
      result.emplace_back(&(*elements)[i], &(*elements)[i + 1]);
  }

  return result;
}

static expression
transform_let(transform_context& tc, arguments args,
              source_location const& loc, binding_environment env) {
  check_argument_count(args, 2, 2, "let", loc);

  std::vector<let_expression::binding> bindings;
  for (auto [name_stx, init_stx] : let_pairs(args[0])) {
    std::string const& name = expect_name(*name_stx, "let");
    expression init = transform_expression(tc, *init_stx, env);
    env = bind_name(tc, env, name, name_stx->location);
    bindings.push_back({name, std::move(init)});
  }

  return make_expression<let_expression>(std::move(bindings),
                                         transform_expression(tc, args[1], env));
}

static expression
transform_if(transform_context& tc, arguments args,
             source_location const& loc, binding_environment const& env) {
  check_argument_count(args, 2, 3, "if", loc);
  return make_expression<if_expression>(
    transform_expression(tc, args[0], env),
    transform_expression(tc, args[1], env),
    args.size() == 3
      ? transform_expression(tc, args[2], env)
      : make_expression<literal_expression>(value::nil{})
  );
}

static std::vector<sexpr> const&
clause_pair(sexpr const& clause, std::string_view form) {
  auto elements = sequence_elements(clause);
  if (!elements || is<sexpr::tuple>(clause) || elements->size() != 2)
    throw transform_error{fmt::format("Invalid {} clause: {}", form,
                                      sexpr_to_string(clause)),
                          clause.location};
  return *elements;
}

static expression
transform_cond(transform_context& tc, arguments args,
               source_location const& loc, binding_environment const& env) {
  std::vector<cond_expression::clause> clauses;
  for (sexpr const& clause : args) {
    auto const& pair = clause_pair(clause, "cond");
    clauses.push_back({transform_expression(tc, pair[0], env),
                       transform_expression(tc, pair[1], env)});
  }

  bool has_default = !args.empty()
                     && clause_pair(args.back(), "cond")[0]
                        == sexpr{sexpr::boolean{true}};
  if (!has_default)
    tc.config.diagnostics.show(
      loc, "cond without a true clause raises an error when nothing matches"
    );

  return make_expression<cond_expression>(loc, std::move(clauses));
}

static expression
transform_case(transform_context& tc, arguments args,
               source_location const& loc, binding_environment const& env) {
  if (args.empty())
    throw transform_error{"case expects an expression to match", loc};

  std::vector<case_expression::clause> clauses;
  for (sexpr const& clause : args.subspan(1)) {
    auto const& pair = clause_pair(clause, "case");
    std::optional<value> pattern;
    if (auto q = match<sexpr::quote>(pair[0]))
      pattern = quote_datum(*q->datum);
    else if (!is_symbol(pair[0], "_"))
      pattern = quote_datum(pair[0]);

    clauses.push_back({std::move(pattern),
                       transform_expression(tc, pair[1], env)});
  }

  return make_expression<case_expression>(
    loc, transform_expression(tc, args[0], env), std::move(clauses)
  );
}

static expression
transform_logical(transform_context& tc, arguments args, bool is_and,
                  source_location const& loc, binding_environment const& env) {
  if (args.size() < 2)
    throw transform_error{fmt::format("{} expects at least 2 arguments, got {}",
                                      is_and ? "and" : "or", args.size()),
                          loc};

  std::vector<expression> operands = transform_expressions(tc, args, env);
  expression result = std::move(operands.front());
  for (std::size_t i = 1; i < operands.size(); ++i)
    if (is_and)
      result = make_expression<and_expression>(std::move(result),
                                               std::move(operands[i]));
    else
      result = make_expression<or_expression>(std::move(result),
                                              std::move(operands[i]));
  return result;
}

static expression
transform_special_form(transform_context& tc, special_form form,
                       arguments args, source_location const& loc,
                       binding_environment const& env) {
  switch (form) {
  case special_form::defn:
    return transform_function_definition(tc, args, true, loc, env);
  case special_form::defp:
    return transform_function_definition(tc, args, false, loc, env);
  case special_form::def:
    return transform_def(tc, args, loc, env);
  case special_form::defmodule:
    return transform_defmodule(tc, args, loc, env);
  case special_form::let:
    return transform_let(tc, args, loc, env);
  case special_form::if_:
    return transform_if(tc, args, loc, env);
  case special_form::cond:
    return transform_cond(tc, args, loc, env);
  case special_form::case_:
    return transform_case(tc, args, loc, env);
  case special_form::lambda:
    return transform_lambda(tc, args, loc, env);
  case special_form::do_:
    return make_expression<sequence_expression>(transform_body(tc, args, env));
  case special_form::quote:
    check_argument_count(args, 1, 1, "quote", loc);
    return make_expression<literal_expression>(quote_datum(args[0]));
  case special_form::quasiquote:
    check_argument_count(args, 1, 1, "quasiquote", loc);
    return transform_quasiquote(tc, args[0], env);
  case special_form::unquote:
  case special_form::unquote_splicing:
    check_argument_count(args, 1, 1, symbolic_name(special_forms, form), loc);
    return transform_expression(tc, args[0], env);
  case special_form::try_:
    check_argument_count(args, 1, 1, "try", loc);
    return make_expression<try_expression>(
      transform_expression(tc, args[0], env)
    );
  case special_form::and_:
    return transform_logical(tc, args, true, loc, env);
  case special_form::or_:
    return transform_logical(tc, args, false, loc, env);
  case special_form::list:
    return make_expression<make_list_expression>(
      transform_expressions(tc, args, env)
    );
  }

  throw std::logic_error{"Unhandled special form"};
}

static expression
transform_operation(transform_context& tc, operation_info const& op,
                    arguments args, source_location const& loc,
                    binding_environment const& env) {
  switch (op.arity) {
  case operation_arity::unary:
    check_argument_count(args, 1, 1, op.name, loc);
    break;
  case operation_arity::binary:
    check_argument_count(args, 2, 2, op.name, loc);
    break;
  case operation_arity::fold:
    if (op.code == opcode::subtract && args.size() == 1)
      return make_expression<built_in_operation_expression>(
        loc, opcode::negate, transform_expressions(tc, args, env)
      );
    if (args.size() < 2)
      throw transform_error{fmt::format("{} expects at least 2 arguments, "
                                        "got {}",
                                        op.name, args.size()),
                            loc};
    break;
  case operation_arity::variadic:
    break;
  }

  std::vector<expression> operands = transform_expressions(tc, args, env);
  if (op.arity != operation_arity::fold)
    return make_expression<built_in_operation_expression>(loc, op.code,
                                                          std::move(operands));

  expression result = std::move(operands.front());
  for (std::size_t i = 1; i < operands.size(); ++i)
    result = make_expression<built_in_operation_expression>(
      loc, op.code,
      std::vector<expression>{std::move(result), std::move(operands[i])}
    );
  return result;
}

static expression
transform_field_access(transform_context& tc, std::string const& field,
                       arguments args, source_location const& loc,
                       binding_environment const& env) {
  check_argument_count(args, 1, 1, ":" + field, loc);
  return make_expression<built_in_operation_expression>(
    loc, opcode::lookup,
    std::vector<expression>{
      transform_expression(tc, args[0], env),
      make_expression<literal_expression>(make_tag(field))
    }
  );
}

static expression
transform_call(transform_context& tc, std::string const& name, arguments args,
               source_location const& loc, binding_environment const& env) {
  if (auto form = find_symbolic(special_forms, name))
    return transform_special_form(tc, *form, args, loc, env);
  else if (auto op = find_operation(name))
    return transform_operation(tc, *op, args, loc, env);
  else if (name.size() > 1 && name.front() == ':')
    return transform_field_access(tc, name.substr(1), args, loc, env);
  else if (env.contains(name))
    return make_expression<apply_expression>(
      loc, make_expression<local_reference_expression>(name),
      transform_expressions(tc, args, env)
    );

  auto dot = name.find('.');
  if (dot != std::string::npos && dot != 0 && dot != name.size() - 1)
    return make_expression<qualified_call_expression>(
      loc, name.substr(0, dot), name.substr(dot + 1),
      transform_expressions(tc, args, env)
    );
  else
    return make_expression<application_expression>(
      loc, name, transform_expressions(tc, args, env)
    );
}

static expression
transform_list(transform_context& tc, sexpr::list const& list,
               source_location const& loc, binding_environment const& env) {
  if (list.elements.empty())
    return make_expression<literal_expression>(make_list(value_vector{}));

  sexpr const& head = list.elements.front();
  arguments args = arguments{list.elements}.subspan(1);

  if (auto a = match<sexpr::atom>(head))
    return transform_call(tc, a->name, args, loc, env);
  else if (auto k = match<sexpr::keyword>(head))
    return transform_field_access(tc, k->name, args, loc, env);
  else if (is<sexpr::list>(head) || is<sexpr::interpolate>(head)
           || is<sexpr::unquote>(head))
    return make_expression<apply_expression>(
      loc, transform_expression(tc, head, env),
      transform_expressions(tc, args, env)
    );
  else
    throw transform_error{fmt::format("Can't call a {}: {}",
                                      sexpr_kind_name(head),
                                      sexpr_to_string(head)),
                          head.location};
}

static expression
transform_expression(transform_context& tc, sexpr const& x,
                     binding_environment const& env) {
  if (is<sexpr::nil>(x))
    return make_expression<literal_expression>(value::nil{});
  else if (auto a = match<sexpr::atom>(x)) {
    if (env.contains(a->name))
      return make_expression<local_reference_expression>(a->name);
    else
      return make_expression<free_reference_expression>(a->name, x.location);
  } else if (is<sexpr::number>(x) || is<sexpr::string_literal>(x)
             || is<sexpr::boolean>(x) || is<sexpr::keyword>(x))
    return make_expression<literal_expression>(quote_datum(x));
  else if (auto i = match<sexpr::interpolate>(x))
    return make_expression<local_reference_expression>(i->name);
  else if (auto l = match<sexpr::list>(x))
    return transform_list(tc, *l, x.location, env);
  else if (auto v = match<sexpr::vector>(x))
    return make_expression<make_list_expression>(
      transform_expressions(tc, v->elements, env)
    );
  else if (auto t = match<sexpr::tuple>(x))
    return make_expression<make_tuple_expression>(
      transform_expressions(tc, t->elements, env)
    );
  else if (auto q = match<sexpr::quote>(x))
    return make_expression<literal_expression>(quote_datum(*q->datum));
  else if (auto qq = match<sexpr::quasiquote>(x))
    return transform_quasiquote(tc, *qq->datum, env);
  else if (auto u = match<sexpr::unquote>(x))
    return transform_expression(tc, *u->datum, env);
  else if (auto s = match<sexpr::unquote_splicing>(x))
    return transform_expression(tc, *s->datum, env);
  else
    throw transform_error{fmt::format("No rule to transform a {}",
                                      sexpr_kind_name(x)),
                          x.location};
}

expression
transform(sexpr const& x, transform_config const& config) {
  transform_context tc{config};
  return transform_expression(tc, x, binding_environment{});
}

std::vector<expression>
transform_program(std::vector<sexpr> const& forms,
                  transform_config const& config) {
  transform_context tc{config};
  return transform_body(tc, forms, binding_environment{});
}

} // namespace parens
