#ifndef PARENS_IO_TOKENIZER_HPP
#define PARENS_IO_TOKENIZER_HPP

#include "compiler/source_location.hpp"
#include "util/named_runtime_error.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace parens {

class lex_error : public error {
public:
  lex_error(std::string const& message, source_location const&);
};

struct token {
  struct left_paren {
    bool operator == (left_paren const&) const = default;
  };

  struct right_paren {
    bool operator == (right_paren const&) const = default;
  };

  struct left_bracket {
    bool operator == (left_bracket const&) const = default;
  };

  struct right_bracket {
    bool operator == (right_bracket const&) const = default;
  };

  struct left_brace {
    bool operator == (left_brace const&) const = default;
  };

  struct right_brace {
    bool operator == (right_brace const&) const = default;
  };

  struct quote {
    bool operator == (quote const&) const = default;
  };

  struct quasiquote {
    bool operator == (quasiquote const&) const = default;
  };

  struct unquote {
    bool operator == (unquote const&) const = default;
  };

  struct unquote_splicing {
    bool operator == (unquote_splicing const&) const = default;
  };

  struct interpolate {
    std::string name;
    bool operator == (interpolate const&) const = default;
  };

  struct symbol {
    std::string name;
    bool operator == (symbol const&) const = default;
  };

  struct number {
    std::variant<std::int64_t, double> value;
    bool operator == (number const&) const = default;
  };

  struct string_literal {
    std::string value;
    bool operator == (string_literal const&) const = default;
  };

  struct keyword {
    std::string name;
    bool operator == (keyword const&) const = default;
  };

  struct boolean_literal {
    bool value;
    bool operator == (boolean_literal const&) const = default;
  };

  struct nil_literal {
    bool operator == (nil_literal const&) const = default;
  };

  using value_type = std::variant<
    left_paren,
    right_paren,
    left_bracket,
    right_bracket,
    left_brace,
    right_brace,
    quote,
    quasiquote,
    unquote,
    unquote_splicing,
    interpolate,
    symbol,
    number,
    string_literal,
    keyword,
    boolean_literal,
    nil_literal
  >;

  value_type      value;
  source_location location = source_location::unknown;

  // Tokens compare by value only.
  friend bool
  operator == (token const& lhs, token const& rhs) {
    return lhs.value == rhs.value;
  }
};

// Split the whole source into tokens. Throws lex_error on the first character
// that can't start or continue a token.
std::vector<token>
tokenize(std::string const& source, std::string const& file_name = "<input>");

// Source-like rendering of a token, used in error messages.
std::string
token_to_string(token const&);

} // namespace parens

#endif
