#ifndef PARENS_COMPILER_EXPRESSION_HPP
#define PARENS_COMPILER_EXPRESSION_HPP

#include "util/sum_type.hpp"

namespace parens {

using expression = sum_type<
  class literal_expression,
  class local_reference_expression,
  class free_reference_expression,
  class application_expression,
  class qualified_call_expression,
  class apply_expression,
  class built_in_operation_expression,
  class and_expression,
  class or_expression,
  class if_expression,
  class cond_expression,
  class case_expression,
  class let_expression,
  class lambda_expression,
  class function_definition_expression,
  class definition_expression,
  class sequence_expression,
  class try_expression,
  class make_list_expression,
  class make_tuple_expression,
  class module_definition_expression
>;

using pattern = sum_type<
  class variable_pattern,
  class wildcard_pattern,
  class literal_pattern,
  class list_pattern,
  class tuple_pattern
>;

} // namespace parens

#endif
