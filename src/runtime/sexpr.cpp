#include "runtime/sexpr.hpp"

namespace parens {

namespace {
  struct equal_visitor {
    static bool
    equal_sequences(std::vector<sexpr> const& lhs,
                    std::vector<sexpr> const& rhs) {
      if (lhs.size() != rhs.size())
        return false;
      for (std::size_t i = 0; i < lhs.size(); ++i)
        if (!(lhs[i] == rhs[i]))
          return false;
      return true;
    }

    bool
    operator () (sexpr::nil, sexpr::nil) const { return true; }

    bool
    operator () (sexpr::atom const& x, sexpr::atom const& y) const {
      return x.name == y.name;
    }

    bool
    operator () (sexpr::number const& x, sexpr::number const& y) const {
      return x.value == y.value;
    }

    bool
    operator () (sexpr::string_literal const& x,
                 sexpr::string_literal const& y) const {
      return x.value == y.value;
    }

    bool
    operator () (sexpr::boolean x, sexpr::boolean y) const {
      return x.value == y.value;
    }

    bool
    operator () (sexpr::keyword const& x, sexpr::keyword const& y) const {
      return x.name == y.name;
    }

    bool
    operator () (sexpr::interpolate const& x,
                 sexpr::interpolate const& y) const {
      return x.name == y.name;
    }

    template <typename T>
    requires std::is_same_v<T, sexpr::list>
             || std::is_same_v<T, sexpr::vector>
             || std::is_same_v<T, sexpr::tuple>
    bool
    operator () (T const& x, T const& y) const {
      return equal_sequences(x.elements, y.elements);
    }

    template <typename T>
    requires std::is_same_v<T, sexpr::quote>
             || std::is_same_v<T, sexpr::quasiquote>
             || std::is_same_v<T, sexpr::unquote>
             || std::is_same_v<T, sexpr::unquote_splicing>
    bool
    operator () (T const& x, T const& y) const {
      return *x.datum == *y.datum;
    }

    template <typename T, typename U>
    bool
    operator () (T const&, U const&) const { return false; }
  };
}

bool
operator == (sexpr const& lhs, sexpr const& rhs) {
  return std::visit(equal_visitor{}, lhs.value, rhs.value);
}

char const*
sexpr_kind_name(sexpr const& x) {
  static constexpr char const* names[]{
    "nil", "symbol", "number", "string", "boolean", "keyword",
    "interpolation", "list", "vector", "tuple", "quote", "quasiquote",
    "unquote", "unquote-splicing"
  };
  static_assert(std::size(names) == std::variant_size_v<sexpr::value_type>);
  return names[x.value.index()];
}

bool
is_symbol(sexpr const& x, std::string const& name) {
  if (auto a = match<sexpr::atom>(x))
    return a->name == name;
  else
    return false;
}

std::vector<sexpr> const*
sequence_elements(sexpr const& x) {
  if (auto l = match<sexpr::list>(x))
    return &l->elements;
  else if (auto v = match<sexpr::vector>(x))
    return &v->elements;
  else if (auto t = match<sexpr::tuple>(x))
    return &t->elements;
  else
    return nullptr;
}

} // namespace parens
