#ifndef PARENS_RUNTIME_VALUE_HPP
#define PARENS_RUNTIME_VALUE_HPP

#include "runtime/error.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace parens {

class procedure;
class value;
class vm;

using value_vector = std::vector<value>;

// Run-time value of the evaluator. Aggregates share their immutable contents,
// so copying a value is cheap.
class value {
public:
  struct nil { };

  // Interned-name value produced by keywords and quoted symbols.
  struct tag {
    std::string name;
  };

  struct list {
    std::shared_ptr<value_vector const> elements;
  };

  struct tuple {
    std::shared_ptr<value_vector const> elements;
  };

  struct map {
    std::shared_ptr<std::vector<std::pair<value, value>> const> entries;
  };

  using procedure_ptr = std::shared_ptr<procedure const>;

  using value_type = std::variant<
    nil,
    bool,
    std::int64_t,
    double,
    std::string,
    tag,
    list,
    tuple,
    map,
    procedure_ptr
  >;

  value() = default;

  template <typename T>
  requires (!std::is_same_v<std::remove_cvref_t<T>, value>
            && std::is_constructible_v<value_type, T&&>)
  value(T&& v)
    : value_{std::forward<T>(v)}
  { }

  value(char const* s) : value_{std::string{s}} { }

  value(int i) : value_{std::int64_t{i}} { }

  value_type const&
  get() const { return value_; }

private:
  value_type value_;
};

class procedure {
public:
  virtual
  ~procedure() = default;

  virtual std::string
  name() const = 0;

  virtual value
  call(vm&, std::vector<value> const& arguments) const = 0;
};

template <typename T>
T const*
match(value const& v) {
  return std::get_if<T>(&v.get());
}

template <typename T>
bool
is(value const& v) {
  return std::holds_alternative<T>(v.get());
}

char const*
value_type_name(value const&);

template <typename T>
char const*
type_name();

template <> inline char const* type_name<value::nil>() { return "nil"; }
template <> inline char const* type_name<bool>() { return "boolean"; }
template <> inline char const* type_name<std::int64_t>() { return "integer"; }
template <> inline char const* type_name<double>() { return "float"; }
template <> inline char const* type_name<std::string>() { return "string"; }
template <> inline char const* type_name<value::tag>() { return "tag"; }
template <> inline char const* type_name<value::list>() { return "list"; }
template <> inline char const* type_name<value::tuple>() { return "tuple"; }
template <> inline char const* type_name<value::map>() { return "map"; }
template <>
inline char const* type_name<value::procedure_ptr>() { return "procedure"; }

template <typename Expected>
auto
make_type_error(value const& actual) {
  return make_error<type_error>("Invalid type: expected {}, got {}",
                                type_name<Expected>(),
                                value_type_name(actual));
}

template <typename T>
T const&
expect(value const& v) {
  if (auto result = match<T>(v))
    return *result;
  else
    throw make_type_error<T>(v);
}

value
make_tag(std::string name);

value
make_list(value_vector elements);

value
make_tuple(value_vector elements);

value
make_map(std::vector<std::pair<value, value>> entries);

value_vector const&
list_elements(value const&);

// nil and false are the only falsy values.
bool
truthy(value const&);

bool
is_number(value const&);

double
to_double(value const&);

// Structural equality. Integers and floats are never equal to each other.
bool
equal(value const&, value const&);

// Equality used by == and !=: like equal, but 1 == 1.0.
bool
arith_equal(value const&, value const&);

// Ordering for < > <= >=. Numbers compare with numbers, strings with strings.
int
compare(value const&, value const&);

// Value of key in the map, or nil.
value
map_lookup(value::map const&, value const& key);

// First element of a list; nil for the empty list.
value
list_head(value const&);

// All but the first element; the empty list stays empty.
value
list_tail(value const&);

// Prepend to a list. A nil tail is treated as the empty list.
value
list_cons(value const& head, value const& tail);

// True for nil and for empty lists, strings, tuples and maps.
bool
is_empty(value const&);

} // namespace parens

#endif
