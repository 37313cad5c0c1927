#include "vm/vm.hpp"

#include "compiler/ast.hpp"
#include "io/write.hpp"
#include "runtime/core_library.hpp"
#include "runtime/error.hpp"
#include "runtime/numeric.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <exception>
#include <stdexcept>
#include <utility>

namespace parens {

namespace {
  // One binding of a lexical scope. Frames form persistent chains; closures
  // keep the chain they were created in.
  class frame {
  public:
    frame(std::shared_ptr<frame const> parent, std::string name, value v)
      : parent_{std::move(parent)}
      , name_{std::move(name)}
      , value_{std::move(v)}
    { }

    value const*
    find(std::string const& name) const {
      for (frame const* f = this; f; f = f->parent_.get())
        if (f->name_ == name)
          return &f->value_;
      return nullptr;
    }

  private:
    std::shared_ptr<frame const> parent_;
    std::string                  name_;
    value                        value_;
  };
}

using frame_ptr = std::shared_ptr<frame const>;

static value const*
find_in_frames(frame_ptr const& f, std::string const& name) {
  return f ? f->find(name) : nullptr;
}

static frame_ptr
extend(frame_ptr const& parent, std::string const& name, value v) {
  return std::make_shared<frame const>(parent, name, std::move(v));
}

static value
invoke_clauses(vm& state, module_& m, std::string const& name,
               std::vector<std::shared_ptr<function_clause const>> const&,
               frame_ptr const& base, std::vector<value> const& args);

namespace {
  class closure final : public procedure {
  public:
    closure(std::shared_ptr<function_clause const> clause, frame_ptr env,
            module_& m)
      : clause_{std::move(clause)}
      , env_{std::move(env)}
      , mod_{m}
    { }

    std::string
    name() const override { return "fn"; }

    value
    call(vm& state, std::vector<value> const& args) const override {
      return invoke_clauses(state, mod_, "fn", {clause_}, env_, args);
    }

  private:
    std::shared_ptr<function_clause const> clause_;
    frame_ptr                              env_;
    module_&                               mod_;
  };

  // A named function used as a value.
  class function_reference final : public procedure {
  public:
    function_reference(module_& m, std::string name)
      : mod_{m}
      , name_{std::move(name)}
    { }

    std::string
    name() const override { return name_; }

    value
    call(vm& state, std::vector<value> const& args) const override {
      module_::function const* f = mod_.find_function(name_);
      if (!f)
        throw make_error("Undefined function {}", name_);
      return invoke_clauses(state, mod_, name_, f->clauses, {}, args);
    }

  private:
    module_&    mod_;
    std::string name_;
  };
}

static std::string
format_arguments(std::vector<value> const& args) {
  std::vector<std::string> parts;
  for (value const& a : args)
    parts.push_back(value_to_string(a));
  return fmt::format("{}", fmt::join(parts, " "));
}

static bool
match_pattern(pattern const& p, value const& v, frame_ptr& f);

static bool
match_elements(std::vector<pattern> const& patterns, value_vector const& values,
               std::size_t count, frame_ptr& f) {
  for (std::size_t i = 0; i < count; ++i)
    if (!match_pattern(patterns[i], values[i], f))
      return false;
  return true;
}

static bool
match_pattern(pattern const& p, value const& v, frame_ptr& f) {
  if (auto var = match<variable_pattern>(p)) {
    f = extend(f, var->name(), v);
    return true;
  } else if (is<wildcard_pattern>(p))
    return true;
  else if (auto lit = match<literal_pattern>(p))
    return equal(lit->value(), v);
  else if (auto lp = match<list_pattern>(p)) {
    auto l = match<value::list>(v);
    if (!l)
      return false;

    auto const& elements = *l->elements;
    std::size_t n = lp->elements().size();
    if (lp->rest() ? elements.size() < n : elements.size() != n)
      return false;
    if (!match_elements(lp->elements(), elements, n, f))
      return false;
    if (lp->rest())
      return match_pattern(lp->rest(),
                           make_list(value_vector(elements.begin() + n,
                                                  elements.end())),
                           f);
    return true;
  } else {
    auto tp = expect<tuple_pattern>(p);
    auto t = match<value::tuple>(v);
    if (!t || t->elements->size() != tp->elements().size())
      return false;
    return match_elements(tp->elements(), *t->elements,
                          tp->elements().size(), f);
  }
}

namespace {
  class evaluator {
  public:
    evaluator(vm& state, module_& m)
      : state_{state}
      , mod_{m}
    { }

    value
    eval(expression const& e, frame_ptr const& f, bool top_level = false);

    bool
    guards_hold(function_clause const& clause, frame_ptr const& f);

  private:
    vm&      state_;
    module_& mod_;

    value
    eval_local(local_reference_expression const&, frame_ptr const&);

    value
    eval_free(free_reference_expression const&, frame_ptr const&);

    value
    eval_application(application_expression const&, frame_ptr const&);

    value
    eval_qualified_call(qualified_call_expression const&, frame_ptr const&);

    value
    eval_apply(apply_expression const&, frame_ptr const&);

    value
    eval_operation(built_in_operation_expression const&, frame_ptr const&);

    value
    eval_cond(cond_expression const&, frame_ptr const&);

    value
    eval_case(case_expression const&, frame_ptr const&);

    value
    eval_let(let_expression const&, frame_ptr const&);

    value
    eval_sequence(std::vector<expression> const&, frame_ptr const&,
                  bool top_level);

    value
    eval_try(try_expression const&, frame_ptr const&);

    value
    eval_make_list(make_list_expression const&, frame_ptr const&);

    value
    eval_module(module_definition_expression const&);

    std::vector<value>
    eval_all(std::vector<expression> const&, frame_ptr const&);

    value const*
    find_definition(std::string const& name);

    value
    call_named(module_& m, std::string const& name,
               std::vector<value> const& args, source_location const& loc);
  };
}

value
evaluator::eval(expression const& e, frame_ptr const& f, bool top_level) {
  if (auto lit = match<literal_expression>(e))
    return lit->value();
  else if (auto local = match<local_reference_expression>(e))
    return eval_local(*local, f);
  else if (auto ref = match<free_reference_expression>(e))
    return eval_free(*ref, f);
  else if (auto app = match<application_expression>(e))
    return eval_application(*app, f);
  else if (auto qc = match<qualified_call_expression>(e))
    return eval_qualified_call(*qc, f);
  else if (auto ap = match<apply_expression>(e))
    return eval_apply(*ap, f);
  else if (auto op = match<built_in_operation_expression>(e))
    return eval_operation(*op, f);
  else if (auto a = match<and_expression>(e)) {
    value lhs = eval(a->lhs(), f);
    return truthy(lhs) ? eval(a->rhs(), f) : lhs;
  } else if (auto o = match<or_expression>(e)) {
    value lhs = eval(o->lhs(), f);
    return truthy(lhs) ? lhs : eval(o->rhs(), f);
  } else if (auto i = match<if_expression>(e))
    return truthy(eval(i->test(), f)) ? eval(i->consequent(), f)
                                      : eval(i->alternative(), f);
  else if (auto c = match<cond_expression>(e))
    return eval_cond(*c, f);
  else if (auto cs = match<case_expression>(e))
    return eval_case(*cs, f);
  else if (auto l = match<let_expression>(e))
    return eval_let(*l, f);
  else if (auto lambda = match<lambda_expression>(e))
    return value::procedure_ptr{
      std::make_shared<closure const>(lambda->clause(), f, mod_)
    };
  else if (auto fd = match<function_definition_expression>(e)) {
    mod_.add_clauses(fd->name(), fd->exported(), fd->clauses());
    return value::procedure_ptr{
      std::make_shared<function_reference const>(mod_, fd->name())
    };
  } else if (auto d = match<definition_expression>(e)) {
    value v = eval(d->value(), f);
    if (top_level)
      mod_.define(d->name(), v);
    return v;
  } else if (auto s = match<sequence_expression>(e))
    return eval_sequence(s->expressions(), f, top_level);
  else if (auto t = match<try_expression>(e))
    return eval_try(*t, f);
  else if (auto ml = match<make_list_expression>(e))
    return eval_make_list(*ml, f);
  else if (auto mt = match<make_tuple_expression>(e))
    return make_tuple(eval_all(mt->elements(), f));
  else if (auto md = match<module_definition_expression>(e))
    return eval_module(*md);
  else
    throw std::logic_error{fmt::format("Can't evaluate {}", type_name(e))};
}

std::vector<value>
evaluator::eval_all(std::vector<expression> const& exprs, frame_ptr const& f) {
  std::vector<value> result;
  result.reserve(exprs.size());
  for (expression const& e : exprs)
    result.push_back(eval(e, f));
  return result;
}

value const*
evaluator::find_definition(std::string const& name) {
  if (value const* v = mod_.find_definition(name))
    return v;
  else if (&mod_ != &state_.main_module())
    return state_.main_module().find_definition(name);
  else
    return nullptr;
}

value
evaluator::eval_local(local_reference_expression const& ref,
                      frame_ptr const& f) {
  if (value const* v = find_in_frames(f, ref.name()))
    return *v;
  else if (value const* d = find_definition(ref.name()))
    return *d;
  else
    throw make_error("Unbound variable {}", ref.name());
}

value
evaluator::eval_free(free_reference_expression const& ref, frame_ptr const&) {
  std::string const& name = ref.name();
  if (value const* d = find_definition(name))
    return *d;

  for (module_* m : {&mod_, &state_.main_module()})
    if (module_::function const* fn = m->find_function(name)) {
      bool has_nullary = false;
      for (auto const& clause : fn->clauses)
        if (clause->parameters.empty())
          has_nullary = true;

      if (has_nullary)
        return call_named(*m, name, {}, ref.origin_location());
      else
        return value::procedure_ptr{
          std::make_shared<function_reference const>(*m, name)
        };
    }

  if (value const* core = state_.core_module().find_definition(name))
    return *core;

  throw make_error("{}: Undefined variable or function {}",
                   format_location(ref.origin_location()), name);
}

// Call a function of the given module, or a procedure bound by def, by name.
value
evaluator::call_named(module_& m, std::string const& name,
                      std::vector<value> const& args,
                      source_location const& loc) {
  if (module_::function const* fn = m.find_function(name))
    return invoke_clauses(state_, m, name, fn->clauses, {}, args);
  else if (value const* d = m.find_definition(name))
    return state_.call(*d, args);
  else
    throw make_error("{}: Undefined function {}/{}", format_location(loc),
                     name, args.size());
}

value
evaluator::eval_application(application_expression const& app,
                            frame_ptr const& f) {
  std::string const& name = app.name();
  std::vector<value> args = eval_all(app.arguments(), f);

  for (module_* m : {&mod_, &state_.main_module(), &state_.core_module()})
    if (m->find_function(name) || m->find_definition(name))
      return call_named(*m, name, args, app.origin_location());

  throw make_error("{}: Undefined function {}/{}",
                   format_location(app.origin_location()), name, args.size());
}

value
evaluator::eval_qualified_call(qualified_call_expression const& qc,
                               frame_ptr const& f) {
  std::vector<value> args = eval_all(qc.arguments(), f);

  if (qc.module_name() == state_.core_module().name())
    return call_named(state_.core_module(), qc.member(), args,
                      qc.origin_location());

  module_* m = state_.find_module(qc.module_name());
  if (!m)
    throw make_error("{}: Unknown module {}",
                     format_location(qc.origin_location()), qc.module_name());

  module_::function const* fn = m->find_function(qc.member());
  if (!fn)
    throw make_error("{}: Undefined function {}.{}/{}",
                     format_location(qc.origin_location()), qc.module_name(),
                     qc.member(), args.size());
  if (!fn->exported)
    throw make_error("{}: Function {}.{} is private",
                     format_location(qc.origin_location()), qc.module_name(),
                     qc.member());

  return invoke_clauses(state_, *m, qc.member(), fn->clauses, {}, args);
}

value
evaluator::eval_apply(apply_expression const& ap, frame_ptr const& f) {
  value target = eval(ap.target(), f);
  return state_.call(target, eval_all(ap.arguments(), f));
}

value
evaluator::eval_cond(cond_expression const& c, frame_ptr const& f) {
  for (cond_expression::clause const& clause : c.clauses())
    if (truthy(eval(clause.test, f)))
      return eval(clause.result, f);

  throw make_error("{}: No cond clause evaluated to a truthy value",
                   format_location(c.origin_location()));
}

value
evaluator::eval_case(case_expression const& c, frame_ptr const& f) {
  value v = eval(c.scrutinee(), f);
  for (case_expression::clause const& clause : c.clauses())
    if (!clause.pattern || equal(*clause.pattern, v))
      return eval(clause.body, f);

  throw make_error("{}: No case clause matching {}",
                   format_location(c.origin_location()), value_to_string(v));
}

value
evaluator::eval_let(let_expression const& l, frame_ptr const& f) {
  frame_ptr current = f;
  for (let_expression::binding const& b : l.bindings())
    current = extend(current, b.name, eval(b.init, current));
  return eval(l.body(), current);
}

// Inside a procedure, a def binds its name for the rest of the sequence. At
// top level, it defines the name in the module instead.
value
evaluator::eval_sequence(std::vector<expression> const& exprs,
                         frame_ptr const& f, bool top_level) {
  frame_ptr current = f;
  value result = value::nil{};
  for (expression const& e : exprs) {
    auto def = match<definition_expression>(e);
    if (def && !top_level) {
      result = eval(def->value(), current);
      current = extend(current, def->name(), result);
    } else
      result = eval(e, current, top_level);
  }
  return result;
}

value
evaluator::eval_try(try_expression const& t, frame_ptr const& f) {
  try {
    return eval(t.body(), f);
  } catch (std::exception const& e) {
    return make_tuple({make_tag("error"), std::string{e.what()}});
  }
}

value
evaluator::eval_make_list(make_list_expression const& ml, frame_ptr const& f) {
  value_vector result;
  for (std::size_t i = 0; i < ml.elements().size(); ++i) {
    value v = eval(ml.elements()[i], f);
    if (ml.spliced(i)) {
      value_vector const& spliced = list_elements(v);
      result.insert(result.end(), spliced.begin(), spliced.end());
    } else
      result.push_back(std::move(v));
  }
  return make_list(std::move(result));
}

value
evaluator::eval_module(module_definition_expression const& md) {
  evaluator inner{state_, state_.define_module(md.name())};
  inner.eval_sequence(md.body(), {}, true);
  return make_tag(md.name());
}

bool
evaluator::guards_hold(function_clause const& clause, frame_ptr const& f) {
  for (expression const& g : clause.guards) {
    try {
      if (!truthy(eval(g, f)))
        return false;
    } catch (type_error const&) {
      // A guard applied to a value of the wrong kind doesn't hold.
      return false;
    }
  }
  return true;
}

static value
invoke_clauses(vm& state, module_& m, std::string const& name,
               std::vector<std::shared_ptr<function_clause const>> const&
                 clauses,
               frame_ptr const& base, std::vector<value> const& args) {
  vm::call_guard guard{state};
  evaluator ev{state, m};

  for (std::size_t i = 0; i < clauses.size(); ++i) {
    function_clause const& clause = *clauses[i];
    if (clause.parameters.size() != args.size())
      continue;

    frame_ptr f = base;
    bool matched = true;
    for (std::size_t j = 0; j < args.size() && matched; ++j)
      matched = match_pattern(clause.parameters[j], args[j], f);

    if (matched && ev.guards_hold(clause, f))
      return ev.eval(clause.body, f);
  }

  throw make_error("No clause of {}/{} matches arguments ({})", name,
                   args.size(), format_arguments(args));
}

static std::string
join_display(std::vector<value> const& values, std::string_view separator) {
  std::vector<std::string> parts;
  for (value const& v : values)
    parts.push_back(display_string(v));
  return fmt::format("{}", fmt::join(parts, separator));
}

static value
lookup(value const& container, value const& key) {
  if (is<value::nil>(container))
    return value::nil{};
  return map_lookup(expect<value::map>(container), key);
}

value
evaluator::eval_operation(built_in_operation_expression const& op,
                          frame_ptr const& f) {
  std::vector<value> args = eval_all(op.operands(), f);

  switch (op.operation()) {
  case opcode::add:
    return add(args[0], args[1]);
  case opcode::subtract:
    return subtract(args[0], args[1]);
  case opcode::multiply:
    return multiply(args[0], args[1]);
  case opcode::divide:
    return divide(args[0], args[1]);
  case opcode::negate:
    return negate(args[0]);
  case opcode::remainder:
    return remainder(args[0], args[1]);
  case opcode::less:
    return compare(args[0], args[1]) < 0;
  case opcode::greater:
    return compare(args[0], args[1]) > 0;
  case opcode::less_or_equal:
    return compare(args[0], args[1]) <= 0;
  case opcode::greater_or_equal:
    return compare(args[0], args[1]) >= 0;
  case opcode::arith_equal:
    return arith_equal(args[0], args[1]);
  case opcode::arith_not_equal:
    return !arith_equal(args[0], args[1]);
  case opcode::not_:
    return !truthy(args[0]);
  case opcode::car:
    return list_head(args[0]);
  case opcode::cdr:
    return list_tail(args[0]);
  case opcode::cons:
    return list_cons(args[0], args[1]);
  case opcode::is_nil:
    return is<value::nil>(args[0]);
  case opcode::is_empty:
    return is_empty(args[0]);
  case opcode::is_list:
    return is<value::list>(args[0]);
  case opcode::is_atom:
    return is<value::tag>(args[0]) || is<bool>(args[0])
           || is<value::nil>(args[0]);
  case opcode::is_number:
    return is_number(args[0]);
  case opcode::is_string:
    return is<std::string>(args[0]);
  case opcode::str:
    return join_display(args, "");
  case opcode::print:
    state_.output() << join_display(args, " ");
    return make_tag("ok");
  case opcode::println:
    state_.output() << join_display(args, " ") << '\n';
    return make_tag("ok");
  case opcode::lookup:
    return lookup(args[0], args[1]);
  }

  throw std::logic_error{"Unhandled opcode"};
}

vm::call_guard::call_guard(vm& state)
  : state_{state}
{
  if (state_.call_depth_ >= state_.config_.max_call_depth)
    throw make_error("Maximum call depth of {} exceeded",
                     state_.config_.max_call_depth);
  ++state_.call_depth_;
}

vm::call_guard::~call_guard() {
  --state_.call_depth_;
}

vm::vm(vm_config config)
  : config_{config}
{
  export_core_library(core_);
}

value
vm::evaluate(expression const& e) {
  evaluator ev{*this, main_};
  return ev.eval(e, {}, true);
}

value
vm::call(value const& callable, std::vector<value> const& arguments) {
  return expect<value::procedure_ptr>(callable)->call(*this, arguments);
}

module_*
vm::find_module(std::string const& name) {
  if (auto it = modules_.find(name); it != modules_.end())
    return it->second.get();
  else
    return nullptr;
}

module_&
vm::define_module(std::string const& name) {
  auto& m = modules_[name];
  if (!m)
    m = std::make_unique<module_>(name);
  return *m;
}

} // namespace parens
