#include "io/reader_stream.hpp"

namespace parens {

reader_stream::reader_stream(std::string source, std::string file_name)
  : source_{std::move(source)}
  , loc_{std::move(file_name), 1, 1}
{ }

std::optional<char>
reader_stream::read() {
  std::optional<char> c = peek();
  if (c) {
    ++position_;
    loc_.advance(*c);
  }
  return c;
}

std::optional<char>
reader_stream::peek() const {
  return peek_at(0);
}

std::optional<char>
reader_stream::peek_at(std::size_t offset) const {
  if (position_ + offset < source_.size())
    return source_[position_ + offset];
  else
    return {};
}

std::optional<char>
advance_and_peek(reader_stream& stream) {
  stream.read();
  return stream.peek();
}

} // namespace parens
