#include "compiler/compilation_config.hpp"

#include <fmt/format.h>

#include <ostream>

namespace parens {

void
diagnostic_sink::show(source_location const& loc, std::string const& message) {
  if (!emitted_locations_.contains(loc)) {
    output(loc, message);
    emitted_locations_.emplace(loc);
  }
}

void
stream_diagnostic_sink::output(source_location const& loc,
                               std::string const& message) {
  out_ << fmt::format("Warning: {}: {}\n", format_location(loc), message);
}

null_diagnostic_sink
null_diagnostic_sink::instance;

transform_config
transform_config::default_config() {
  return transform_config{null_diagnostic_sink::instance};
}

} // namespace parens
