#include "runtime/module.hpp"

namespace parens {

module_::function const&
module_::add_clauses(
  std::string const& name, bool exported,
  std::vector<std::shared_ptr<function_clause const>> const& clauses
) {
  function& f = functions_[name];
  f.name = name;
  f.exported = f.exported || exported;
  f.clauses.insert(f.clauses.end(), clauses.begin(), clauses.end());
  return f;
}

module_::function const*
module_::find_function(std::string const& name) const {
  if (auto it = functions_.find(name); it != functions_.end())
    return &it->second;
  else
    return nullptr;
}

void
module_::define(std::string const& name, value v) {
  definitions_.insert_or_assign(name, std::move(v));
}

value const*
module_::find_definition(std::string const& name) const {
  if (auto it = definitions_.find(name); it != definitions_.end())
    return &it->second;
  else
    return nullptr;
}

} // namespace parens
