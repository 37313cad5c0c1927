#ifndef PARENS_VM_VM_HPP
#define PARENS_VM_VM_HPP

#include "compiler/expression.hpp"
#include "runtime/module.hpp"
#include "runtime/value.hpp"

#include <cstddef>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace parens {

struct vm_config {
  // Destination of print and println.
  std::ostream* output = &std::cout;

  // Procedure calls nest at most this deep; deeper calls raise an
  // evaluation_error.
  std::size_t max_call_depth = 1000;
};

class native_procedure final : public procedure {
public:
  using target_type
    = std::function<value(vm&, std::vector<value> const&)>;

  native_procedure(std::string name, target_type f)
    : name_{std::move(name)}
    , target_{std::move(f)}
  { }

  std::string
  name() const override { return name_; }

  value
  call(vm& state, std::vector<value> const& args) const override {
    return target_(state, args);
  }

private:
  std::string name_;
  target_type target_;
};

// Evaluator of the expression trees produced by the transformer. Top-level
// forms are evaluated in the main module; defmodule creates further modules.
// Core library procedures live in the Core module, which every module can
// call into.
class vm {
public:
  explicit
  vm(vm_config config = {});

  vm(vm const&) = delete;
  void operator = (vm const&) = delete;

  // Evaluate a top-level form in the main module.
  value
  evaluate(expression const&);

  // Call a procedure value with the given arguments.
  value
  call(value const& callable, std::vector<value> const& arguments);

  module_&
  main_module() { return main_; }

  module_&
  core_module() { return core_; }

  // Module defined by defmodule, or nullptr.
  module_*
  find_module(std::string const& name);

  module_&
  define_module(std::string const& name);

  std::ostream&
  output() { return *config_.output; }

  vm_config const&
  config() const { return config_; }

  // Counts one level of procedure call for as long as it exists.
  class call_guard {
  public:
    explicit
    call_guard(vm&);

    ~call_guard();

    call_guard(call_guard const&) = delete;
    void operator = (call_guard const&) = delete;

  private:
    vm& state_;
  };

private:
  vm_config                                                 config_;
  module_                                                   main_{"main"};
  module_                                                   core_{"Core"};
  std::unordered_map<std::string, std::unique_ptr<module_>> modules_;
  std::size_t                                               call_depth_ = 0;
};

} // namespace parens

#endif
