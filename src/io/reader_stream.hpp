#ifndef PARENS_IO_READER_STREAM_HPP
#define PARENS_IO_READER_STREAM_HPP

#include "compiler/source_location.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace parens {

// Character cursor over a source string that keeps track of the line and
// column of the next character.
class reader_stream {
public:
  reader_stream(std::string source, std::string file_name);

  std::optional<char>
  read();

  std::optional<char>
  peek() const;

  // Look further ahead without consuming anything; peek_at(0) == peek().
  std::optional<char>
  peek_at(std::size_t offset) const;

  source_location
  location() const { return loc_; }

private:
  std::string     source_;
  std::size_t     position_ = 0;
  source_location loc_;
};

std::optional<char>
advance_and_peek(reader_stream&);

} // namespace parens

#endif
