#ifndef PARENS_RUNTIME_SEXPR_HPP
#define PARENS_RUNTIME_SEXPR_HPP

#include "compiler/source_location.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace parens {

// S-expression as produced by the reader. A node owns its children; nodes are
// never modified once the reader has built them.
class sexpr {
public:
  struct nil { };

  struct atom {
    std::string name;
  };

  struct number {
    std::variant<std::int64_t, double> value;
  };

  struct string_literal {
    std::string value;
  };

  struct boolean {
    bool value;
  };

  struct keyword {
    std::string name;
  };

  struct interpolate {
    std::string name;
  };

  struct list {
    std::vector<sexpr> elements;
  };

  struct vector {
    std::vector<sexpr> elements;
  };

  struct tuple {
    std::vector<sexpr> elements;
  };

  struct quote {
    std::shared_ptr<sexpr const> datum;
  };

  struct quasiquote {
    std::shared_ptr<sexpr const> datum;
  };

  struct unquote {
    std::shared_ptr<sexpr const> datum;
  };

  struct unquote_splicing {
    std::shared_ptr<sexpr const> datum;
  };

  using value_type = std::variant<
    nil,
    atom,
    number,
    string_literal,
    boolean,
    keyword,
    interpolate,
    list,
    vector,
    tuple,
    quote,
    quasiquote,
    unquote,
    unquote_splicing
  >;

  value_type      value;
  source_location location = source_location::unknown;

  sexpr() = default;

  template <typename T>
  requires (!std::is_same_v<std::remove_cvref_t<T>, sexpr>
            && std::is_constructible_v<value_type, T&&>)
  sexpr(T&& v, source_location loc = source_location::unknown)
    : value{std::forward<T>(v)}
    , location{std::move(loc)}
  { }

  // Structural equality; source locations are ignored.
  friend bool
  operator == (sexpr const&, sexpr const&);
};

template <typename T>
T const*
match(sexpr const& x) {
  return std::get_if<T>(&x.value);
}

template <typename T>
bool
is(sexpr const& x) {
  return std::holds_alternative<T>(x.value);
}

// Name of the kind of node, for error messages.
char const*
sexpr_kind_name(sexpr const&);

bool
is_symbol(sexpr const&, std::string const& name);

// Elements of a list, vector or tuple; nullptr for any other node.
std::vector<sexpr> const*
sequence_elements(sexpr const&);

template <typename Prefix>
sexpr
make_prefixed(sexpr datum, source_location loc) {
  auto inner = std::make_shared<sexpr const>(std::move(datum));
  return sexpr{Prefix{std::move(inner)}, std::move(loc)};
}

} // namespace parens

#endif
