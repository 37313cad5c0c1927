#ifndef PARENS_COMPILER_COMPILATION_CONFIG_HPP
#define PARENS_COMPILER_COMPILATION_CONFIG_HPP

#include "compiler/source_location.hpp"

#include <iosfwd>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace parens {

// Receiver of warnings produced while transforming. At most one warning is
// shown for any given source location.
class diagnostic_sink {
public:
  virtual
  ~diagnostic_sink() = default;

  void
  show(source_location const& location, std::string const& message);

private:
  std::unordered_set<source_location> emitted_locations_;

  virtual void
  output(source_location const&, std::string const&) = 0;
};

class null_diagnostic_sink final : public diagnostic_sink {
public:
  static null_diagnostic_sink instance;

private:
  void
  output(source_location const&, std::string const&) override { }
};

// Writes "Warning: <location>: <message>" lines to a stream.
class stream_diagnostic_sink final : public diagnostic_sink {
public:
  explicit
  stream_diagnostic_sink(std::ostream& out)
    : out_{out}
  { }

private:
  std::ostream& out_;

  void
  output(source_location const&, std::string const&) override;
};

// Keeps every warning for later inspection.
class collecting_diagnostic_sink final : public diagnostic_sink {
public:
  struct diagnostic {
    source_location location;
    std::string     message;
  };

  std::vector<diagnostic> const&
  diagnostics() const { return diagnostics_; }

private:
  std::vector<diagnostic> diagnostics_;

  void
  output(source_location const& loc, std::string const& msg) override {
    diagnostics_.push_back({loc, msg});
  }
};

struct transform_config {
  diagnostic_sink& diagnostics;

  explicit
  transform_config(diagnostic_sink& diagnostics)
    : diagnostics{diagnostics}
  { }

  static transform_config
  default_config();
};

} // namespace parens

#endif
