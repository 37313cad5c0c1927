#ifndef PARENS_COMPILER_BINDING_ENVIRONMENT_HPP
#define PARENS_COMPILER_BINDING_ENVIRONMENT_HPP

#include <memory>
#include <string>
#include <utility>

namespace parens {

// Set of names bound in the current lexical scope. Extending an environment
// leaves the original untouched, so sibling scopes never see each other's
// bindings.
class binding_environment {
public:
  binding_environment() = default;

  [[nodiscard]] binding_environment
  extend(std::string name) const {
    return binding_environment{
      std::make_shared<node const>(node{std::move(name), head_})
    };
  }

  bool
  contains(std::string const& name) const {
    for (node const* n = head_.get(); n; n = n->next.get())
      if (n->name == name)
        return true;
    return false;
  }

private:
  struct node {
    std::string                 name;
    std::shared_ptr<node const> next;
  };

  std::shared_ptr<node const> head_;

  explicit
  binding_environment(std::shared_ptr<node const> head)
    : head_{std::move(head)}
  { }
};

} // namespace parens

#endif
