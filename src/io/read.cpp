#include "io/read.hpp"

#include "compiler/source_location.hpp"

#include <fmt/format.h>

#include <optional>
#include <variant>

namespace parens {

parse_error::parse_error(std::string const& message,
                         source_location const& loc)
  : error{loc, "Parse error: {}", message}
{ }

namespace {
  class token_cursor {
  public:
    explicit
    token_cursor(std::vector<token> const& tokens)
      : tokens_{tokens}
    { }

    token const*
    get() const {
      return position_ < tokens_.size() ? &tokens_[position_] : nullptr;
    }

    token const&
    next(source_location const& context_loc) {
      if (position_ >= tokens_.size())
        throw parse_error{"Unexpected end of input", context_loc};
      return tokens_[position_++];
    }

    void
    advance() { ++position_; }

    bool
    at_end() const { return position_ >= tokens_.size(); }

    void
    enter(source_location const& loc) {
      if (depth_ >= max_nesting_depth)
        throw parse_error{fmt::format("Nesting too deep: more than {} levels",
                                      max_nesting_depth),
                          loc};
      ++depth_;
    }

    void
    leave() { --depth_; }

  private:
    std::vector<token> const& tokens_;
    std::size_t               position_ = 0;
    std::size_t               depth_ = 0;
  };

  class nesting_guard {
  public:
    nesting_guard(token_cursor& cursor, source_location const& loc)
      : cursor_{cursor}
    {
      cursor_.enter(loc);
    }

    ~nesting_guard() { cursor_.leave(); }

    nesting_guard(nesting_guard const&) = delete;
    void operator = (nesting_guard const&) = delete;

  private:
    token_cursor& cursor_;
  };
}

static sexpr
read_expression(token_cursor& cursor, source_location const& context_loc);

template <typename Closing>
static std::vector<sexpr>
read_elements(token_cursor& cursor, source_location const& open_loc,
              char const* what, char closing_char) {
  std::vector<sexpr> elements;
  while (true) {
    token const* t = cursor.get();
    if (!t)
      throw parse_error{fmt::format("Unclosed {}: missing {}", what,
                                    closing_char),
                        open_loc};

    if (std::holds_alternative<Closing>(t->value)) {
      cursor.advance();
      return elements;
    }

    elements.push_back(read_expression(cursor, open_loc));
  }
}

template <typename Prefix>
static sexpr
read_prefixed(token_cursor& cursor, source_location const& loc) {
  if (cursor.at_end())
    throw parse_error{"Unexpected end of input", loc};
  return make_prefixed<Prefix>(read_expression(cursor, loc), loc);
}

namespace {
  struct leaf_reader {
    source_location const& loc;

    std::optional<sexpr>
    operator () (token::symbol const& s) const {
      return sexpr{sexpr::atom{s.name}, loc};
    }

    std::optional<sexpr>
    operator () (token::number const& n) const {
      return sexpr{sexpr::number{n.value}, loc};
    }

    std::optional<sexpr>
    operator () (token::string_literal const& s) const {
      return sexpr{sexpr::string_literal{s.value}, loc};
    }

    std::optional<sexpr>
    operator () (token::keyword const& k) const {
      return sexpr{sexpr::keyword{k.name}, loc};
    }

    std::optional<sexpr>
    operator () (token::boolean_literal b) const {
      return sexpr{sexpr::boolean{b.value}, loc};
    }

    std::optional<sexpr>
    operator () (token::nil_literal) const {
      return sexpr{sexpr::nil{}, loc};
    }

    std::optional<sexpr>
    operator () (token::interpolate const& i) const {
      return sexpr{sexpr::interpolate{i.name}, loc};
    }

    template <typename T>
    std::optional<sexpr>
    operator () (T const&) const { return {}; }
  };
}

static sexpr
read_expression(token_cursor& cursor, source_location const& context_loc) {
  token const& t = cursor.next(context_loc);
  source_location const& loc = t.location;
  nesting_guard guard{cursor, loc};

  if (std::holds_alternative<token::left_paren>(t.value))
    return {sexpr::list{read_elements<token::right_paren>(cursor, loc,
                                                          "list", ')')},
            loc};
  else if (std::holds_alternative<token::left_bracket>(t.value))
    return {sexpr::vector{read_elements<token::right_bracket>(cursor, loc,
                                                              "vector", ']')},
            loc};
  else if (std::holds_alternative<token::left_brace>(t.value))
    return {sexpr::tuple{read_elements<token::right_brace>(cursor, loc,
                                                           "tuple", '}')},
            loc};
  else if (std::holds_alternative<token::quote>(t.value))
    return read_prefixed<sexpr::quote>(cursor, loc);
  else if (std::holds_alternative<token::quasiquote>(t.value))
    return read_prefixed<sexpr::quasiquote>(cursor, loc);
  else if (std::holds_alternative<token::unquote>(t.value))
    return read_prefixed<sexpr::unquote>(cursor, loc);
  else if (std::holds_alternative<token::unquote_splicing>(t.value))
    return read_prefixed<sexpr::unquote_splicing>(cursor, loc);
  else if (auto leaf = std::visit(leaf_reader{loc}, t.value))
    return std::move(*leaf);
  else
    throw parse_error{fmt::format("Unexpected token: {}", token_to_string(t)),
                      loc};
}

static bool
is_closing(token const& t) {
  return std::holds_alternative<token::right_paren>(t.value)
         || std::holds_alternative<token::right_bracket>(t.value)
         || std::holds_alternative<token::right_brace>(t.value);
}

static std::string
remaining_tokens_to_string(token_cursor cursor) {
  std::string result;
  for (token const* t = cursor.get(); t; cursor.advance(), t = cursor.get()) {
    if (!result.empty())
      result += ' ';
    result += token_to_string(*t);
  }
  return result;
}

std::vector<sexpr>
read_multiple(std::vector<token> const& tokens) {
  token_cursor cursor{tokens};

  std::vector<sexpr> result;
  while (token const* t = cursor.get()) {
    if (is_closing(*t))
      throw parse_error{fmt::format("Unexpected tokens remaining: {}",
                                    remaining_tokens_to_string(cursor)),
                        t->location};

    result.push_back(read_expression(cursor, t->location));
  }

  return result;
}

std::vector<sexpr>
read_multiple(std::string const& source, std::string const& file_name) {
  return read_multiple(tokenize(source, file_name));
}

sexpr
read(std::vector<token> const& tokens) {
  std::vector<sexpr> forms = read_multiple(tokens);
  if (forms.empty())
    throw parse_error{"Expected an expression, got end of input",
                      source_location::unknown};
  else if (forms.size() > 1)
    throw parse_error{fmt::format("Expected a single expression, got {}",
                                  forms.size()),
                      forms[1].location};
  return std::move(forms.front());
}

sexpr
read(std::string const& source, std::string const& file_name) {
  return read(tokenize(source, file_name));
}

} // namespace parens
