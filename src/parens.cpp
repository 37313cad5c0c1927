#include "parens.hpp"

#include "compiler/ast.hpp"
#include "compiler/transformer.hpp"
#include "io/read.hpp"
#include "io/write.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace parens {

value
eval(vm& state, std::string const& source, transform_config const& config,
     std::string const& file_name) {
  value result = value::nil{};
  for (expression const& e
         : transform_program(read_multiple(source, file_name), config))
    result = state.evaluate(e);
  return result;
}

std::vector<sexpr>
parse(std::string const& source, std::string const& file_name) {
  return read_multiple(source, file_name);
}

expression
to_ast(sexpr const& x, transform_config const& config) {
  return transform(x, config);
}

std::string
compile(std::string const& source, transform_config const& config,
        std::string const& file_name) {
  std::vector<std::string> forms;
  for (expression const& e
         : transform_program(read_multiple(source, file_name), config))
    forms.push_back(show(e));
  return fmt::format("{}", fmt::join(forms, "\n"));
}

std::string
pp(sexpr const& x) {
  return format_sexpr(x);
}

} // namespace parens
