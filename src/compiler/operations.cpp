#include "compiler/operations.hpp"

#include <stdexcept>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace parens {

namespace {
  template <std::size_t N, std::size_t... Is>
  std::unordered_map<std::string_view, operation_info>
  make_names(std::array<operation_info, N> const& ops,
             std::index_sequence<Is...>) {
    std::unordered_map<std::string_view, operation_info> result;
    (result.emplace(ops[Is].name, ops[Is]), ...);
    return result;
  }

  template <std::size_t N>
  std::unordered_map<std::string_view, operation_info>
  make_names(std::array<operation_info, N> const& ops) {
    return make_names(ops, std::make_index_sequence<N>{});
  }
}

static std::unordered_map<std::string_view, operation_info> const
name_map = make_names(operations);

std::optional<operation_info>
find_operation(std::string_view name) {
  if (auto it = name_map.find(name); it != name_map.end())
    return it->second;
  else
    return std::nullopt;
}

char const*
operation_name(opcode code) {
  if (code == opcode::negate)
    return "-";

  for (operation_info const& op : operations)
    if (op.code == code)
      return op.name;

  throw std::logic_error{"Invalid opcode"};
}

} // namespace parens
