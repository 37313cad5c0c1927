#ifndef PARENS_COMPILER_OPERATIONS_HPP
#define PARENS_COMPILER_OPERATIONS_HPP

#include "util/symbolic_enum.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <tuple>

namespace parens {

// Head symbols with their own transformation rule.
enum class special_form {
  defn,
  defp,
  def,
  defmodule,
  let,
  if_,
  cond,
  case_,
  lambda,
  do_,
  quote,
  quasiquote,
  unquote,
  unquote_splicing,
  try_,
  and_,
  or_,
  list
};

constexpr symbolic_mapping<special_form, 19>
special_forms{{
  {"defn", special_form::defn},
  {"defp", special_form::defp},
  {"def", special_form::def},
  {"defmodule", special_form::defmodule},
  {"let", special_form::let},
  {"if", special_form::if_},
  {"cond", special_form::cond},
  {"case", special_form::case_},
  {"lambda", special_form::lambda},
  {"fn", special_form::lambda},
  {"do", special_form::do_},
  {"quote", special_form::quote},
  {"quasiquote", special_form::quasiquote},
  {"unquote", special_form::unquote},
  {"unquote-splicing", special_form::unquote_splicing},
  {"try", special_form::try_},
  {"and", special_form::and_},
  {"or", special_form::or_},
  {"list", special_form::list}
}};

// Operations the evaluator performs directly, without a function call.
enum class opcode {
  add,
  subtract,
  multiply,
  divide,
  negate,
  remainder,
  less,
  greater,
  less_or_equal,
  greater_or_equal,
  arith_equal,
  arith_not_equal,
  not_,
  car,
  cdr,
  cons,
  is_nil,
  is_empty,
  is_list,
  is_atom,
  is_number,
  is_string,
  str,
  print,
  println,
  lookup
};

// How many operands an operation takes in source. A fold takes two or more
// and is reduced left to right into binary operations.
enum class operation_arity {
  unary,
  binary,
  fold,
  variadic
};

struct operation_info {
  char const*     name;
  opcode          code;
  operation_arity arity;
};

// Several names may denote the same opcode; the first one listed is the name
// used when showing the operation.
constexpr std::array
operations{
  operation_info{"+", opcode::add, operation_arity::fold},
  operation_info{"-", opcode::subtract, operation_arity::fold},
  operation_info{"*", opcode::multiply, operation_arity::fold},
  operation_info{"/", opcode::divide, operation_arity::fold},
  operation_info{"rem", opcode::remainder, operation_arity::binary},
  operation_info{"mod", opcode::remainder, operation_arity::binary},
  operation_info{"<", opcode::less, operation_arity::binary},
  operation_info{">", opcode::greater, operation_arity::binary},
  operation_info{"<=", opcode::less_or_equal, operation_arity::binary},
  operation_info{">=", opcode::greater_or_equal, operation_arity::binary},
  operation_info{"==", opcode::arith_equal, operation_arity::binary},
  operation_info{"=", opcode::arith_equal, operation_arity::binary},
  operation_info{"!=", opcode::arith_not_equal, operation_arity::binary},
  operation_info{"not", opcode::not_, operation_arity::unary},
  operation_info{"car", opcode::car, operation_arity::unary},
  operation_info{"head", opcode::car, operation_arity::unary},
  operation_info{"first", opcode::car, operation_arity::unary},
  operation_info{"cdr", opcode::cdr, operation_arity::unary},
  operation_info{"tail", opcode::cdr, operation_arity::unary},
  operation_info{"rest", opcode::cdr, operation_arity::unary},
  operation_info{"cons", opcode::cons, operation_arity::binary},
  operation_info{"nil?", opcode::is_nil, operation_arity::unary},
  operation_info{"empty?", opcode::is_empty, operation_arity::unary},
  operation_info{"list?", opcode::is_list, operation_arity::unary},
  operation_info{"atom?", opcode::is_atom, operation_arity::unary},
  operation_info{"number?", opcode::is_number, operation_arity::unary},
  operation_info{"string?", opcode::is_string, operation_arity::unary},
  operation_info{"str", opcode::str, operation_arity::variadic},
  operation_info{"print", opcode::print, operation_arity::variadic},
  operation_info{"println", opcode::println, operation_arity::variadic},
  operation_info{"lookup", opcode::lookup, operation_arity::binary}
};

std::optional<operation_info>
find_operation(std::string_view name);

// Canonical source name of the opcode; negate is shown as "-".
char const*
operation_name(opcode);

} // namespace parens

#endif
