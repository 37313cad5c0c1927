#include "io/tokenizer.hpp"

#include "io/char_categories.hpp"
#include "io/reader_stream.hpp"

#include <fmt/format.h>

#include <charconv>
#include <optional>
#include <system_error>

namespace parens {

lex_error::lex_error(std::string const& message, source_location const& loc)
  : error{loc, "Lex error: {}", message}
{ }

static std::string
describe_char(char c) {
  if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f)
    return fmt::format("\\x{:02x}", static_cast<unsigned char>(c));
  else
    return std::string(1, c);
}

static void
skip_whitespace(reader_stream& stream) {
  std::optional<char> c = stream.peek();

  while (c && (whitespace(*c) || *c == ';')) {
    while (c && whitespace(*c))
      c = advance_and_peek(stream);

    // The newline ending a comment is left for the whitespace loop above.
    if (c == ';')
      while ((c = stream.peek()) && *c != '\n')
        stream.read();

    c = stream.peek();
  }
}

static std::string
read_until_delimiter(reader_stream& stream) {
  std::string result;
  while (stream.peek() && !delimiter(*stream.peek())) {
    source_location loc = stream.location();
    char c = *stream.read();
    if (unsupported(c))
      throw lex_error{fmt::format("Unsupported character: {}",
                                  describe_char(c)),
                      loc};
    result += c;
  }

  return result;
}

static char
require_char(reader_stream& stream, char const* what,
             source_location const& start) {
  std::optional<char> result = stream.read();
  if (!result)
    throw lex_error{fmt::format("Unterminated {}", what), start};
  return *result;
}

static std::string
read_number_text(reader_stream& stream) {
  // -? digit+ (. digit*)?  A second period ends the literal and starts the
  // next token.

  std::string result;
  if (stream.peek() == '-')
    result += *stream.read();

  bool seen_period = false;
  for (std::optional<char> c = stream.peek(); c; c = stream.peek()) {
    if (digit(*c))
      result += *stream.read();
    else if (*c == '.' && !seen_period) {
      seen_period = true;
      result += *stream.read();
    } else
      break;
  }

  return result;
}

static token::number
parse_number(std::string const& text, source_location const& loc) {
  char const* begin = text.data();
  char const* end = text.data() + text.size();

  if (text.find('.') != std::string::npos) {
    double value{};
    auto [ptr, ec] = std::from_chars(begin, end, value,
                                     std::chars_format::fixed);
    if (ec != std::errc{} || ptr != end)
      throw lex_error{fmt::format("Invalid floating point literal: {}", text),
                      loc};
    return {value};
  } else {
    std::int64_t value{};
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec == std::errc::result_out_of_range)
      throw lex_error{fmt::format("Integer literal out of range: {}", text),
                      loc};
    else if (ec != std::errc{} || ptr != end)
      throw lex_error{fmt::format("Invalid integer literal: {}", text), loc};
    return {value};
  }
}

static token
read_number(reader_stream& stream) {
  source_location loc = stream.location();
  std::string text = read_number_text(stream);
  return {parse_number(text, loc), loc};
}

static char
read_escape(reader_stream& stream, source_location const& start) {
  char escape = require_char(stream, "string", start);
  switch (escape) {
  case 'n': return '\n';
  case 't': return '\t';
  case 'r': return '\r';
  case '"': return '"';
  case '\\': return '\\';
  default: return escape;
  }
}

static token
read_string_literal(reader_stream& stream) {
  source_location loc = stream.location();
  stream.read(); // "

  std::string result;
  while (true) {
    char c = require_char(stream, "string", loc);
    if (c == '"')
      break;

    if (c == '\\') {
      // Unknown escapes keep their backslash.
      std::optional<char> next = stream.peek();
      if (next && *next != 'n' && *next != 't' && *next != 'r'
          && *next != '"' && *next != '\\')
        result += '\\';
      result += read_escape(stream, loc);
    } else
      result += c;
  }

  return {token::string_literal{std::move(result)}, loc};
}

static token
read_interpolation(reader_stream& stream, source_location const& loc) {
  // ~{ was consumed before calling this function.

  std::string name;
  while (true) {
    char c = require_char(stream, "interpolation", loc);
    if (c == '}')
      break;
    name += c;
  }

  if (name.empty())
    throw lex_error{"Empty interpolation", loc};

  return {token::interpolate{std::move(name)}, loc};
}

static token
read_token_after_tilde(reader_stream& stream) {
  source_location loc = stream.location();
  stream.read(); // ~

  std::optional<char> c = stream.peek();
  if (c == '@') {
    stream.read();
    return {token::unquote_splicing{}, loc};
  } else if (c == '{') {
    stream.read();
    return read_interpolation(stream, loc);
  } else
    return {token::unquote{}, loc};
}

static token
read_keyword(reader_stream& stream) {
  source_location loc = stream.location();
  stream.read(); // :

  std::string name = read_until_delimiter(stream);
  if (name.empty())
    throw lex_error{"Empty keyword", loc};

  return {token::keyword{std::move(name)}, loc};
}

static token
read_symbol(reader_stream& stream) {
  source_location loc = stream.location();
  std::string name = read_until_delimiter(stream);

  if (name == "true")
    return {token::boolean_literal{true}, loc};
  else if (name == "false")
    return {token::boolean_literal{false}, loc};
  else if (name == "nil")
    return {token::nil_literal{}, loc};
  else
    return {token::symbol{std::move(name)}, loc};
}

static token
read_single_char_token(reader_stream& stream, token::value_type value) {
  source_location loc = stream.location();
  stream.read();
  return {std::move(value), loc};
}

static std::optional<token>
read_token(reader_stream& stream) {
  skip_whitespace(stream);

  source_location loc = stream.location();
  std::optional<char> c = stream.peek();

  if (!c)
    return {};

  switch (*c) {
  case '(': return read_single_char_token(stream, token::left_paren{});
  case ')': return read_single_char_token(stream, token::right_paren{});
  case '[': return read_single_char_token(stream, token::left_bracket{});
  case ']': return read_single_char_token(stream, token::right_bracket{});
  case '{': return read_single_char_token(stream, token::left_brace{});
  case '}': return read_single_char_token(stream, token::right_brace{});
  case '\'': return read_single_char_token(stream, token::quote{});
  case '`': return read_single_char_token(stream, token::quasiquote{});
  case '~': return read_token_after_tilde(stream);
  case '"': return read_string_literal(stream);
  case ':': return read_keyword(stream);
  default:
    break;
  }

  if (digit(*c)
      || (*c == '-' && stream.peek_at(1) && digit(*stream.peek_at(1))))
    return read_number(stream);
  else if (unsupported(*c))
    throw lex_error{fmt::format("Unsupported character: {}", describe_char(*c)),
                    loc};
  else
    return read_symbol(stream);
}

std::vector<token>
tokenize(std::string const& source, std::string const& file_name) {
  reader_stream stream{source, file_name};

  std::vector<token> result;
  while (std::optional<token> t = read_token(stream))
    result.push_back(std::move(*t));

  return result;
}

namespace {
  struct token_printer {
    std::string
    operator () (token::left_paren) const { return "("; }

    std::string
    operator () (token::right_paren) const { return ")"; }

    std::string
    operator () (token::left_bracket) const { return "["; }

    std::string
    operator () (token::right_bracket) const { return "]"; }

    std::string
    operator () (token::left_brace) const { return "{"; }

    std::string
    operator () (token::right_brace) const { return "}"; }

    std::string
    operator () (token::quote) const { return "'"; }

    std::string
    operator () (token::quasiquote) const { return "`"; }

    std::string
    operator () (token::unquote) const { return "~"; }

    std::string
    operator () (token::unquote_splicing) const { return "~@"; }

    std::string
    operator () (token::interpolate const& i) const {
      return fmt::format("~{{{}}}", i.name);
    }

    std::string
    operator () (token::symbol const& s) const { return s.name; }

    std::string
    operator () (token::number const& n) const {
      return std::visit([] (auto v) { return fmt::format("{}", v); }, n.value);
    }

    std::string
    operator () (token::string_literal const& s) const {
      return fmt::format("\"{}\"", s.value);
    }

    std::string
    operator () (token::keyword const& k) const { return ":" + k.name; }

    std::string
    operator () (token::boolean_literal b) const {
      return b.value ? "true" : "false";
    }

    std::string
    operator () (token::nil_literal) const { return "nil"; }
  };
}

std::string
token_to_string(token const& t) {
  return std::visit(token_printer{}, t.value);
}

} // namespace parens
