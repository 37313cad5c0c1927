#include "compiler/source_location.hpp"

#include <fmt/format.h>

namespace parens {

std::size_t
source_location::hash() const {
  std::size_t result = std::hash<std::string>{}(file_name);
  for (unsigned x : {line, column})
    result = result * 31 + x;
  return result;
}

std::string
format_location(source_location const& loc) {
  return fmt::format("{}:{}:{}",
                     loc.file_name.empty() ? "<unknown>" : loc.file_name,
                     loc.line, loc.column);
}

} // namespace parens
