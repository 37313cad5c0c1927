#ifndef PARENS_RUNTIME_MODULE_HPP
#define PARENS_RUNTIME_MODULE_HPP

#include "compiler/ast.hpp"
#include "runtime/value.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace parens {

// A module is a map from names to functions and to def bindings. Functions
// defined with defn are exported and can be called as Module.name from other
// modules; defp functions can only be called from within the module.
class module_ {
public:
  struct function {
    std::string                                         name;
    bool                                                exported = false;
    std::vector<std::shared_ptr<function_clause const>> clauses;
  };

  explicit
  module_(std::string name)
    : name_{std::move(name)}
  { }

  std::string const&
  name() const { return name_; }

  // Append clauses to the named function, creating it if it doesn't exist
  // yet. Earlier clauses take precedence.
  function const&
  add_clauses(std::string const& name, bool exported,
              std::vector<std::shared_ptr<function_clause const>> const&);

  function const*
  find_function(std::string const& name) const;

  void
  define(std::string const& name, value v);

  value const*
  find_definition(std::string const& name) const;

private:
  std::string                               name_;
  std::unordered_map<std::string, function> functions_;
  std::unordered_map<std::string, value>    definitions_;
};

} // namespace parens

#endif
