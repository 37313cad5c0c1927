#include "runtime/value.hpp"

#include <algorithm>

namespace parens {

char const*
value_type_name(value const& v) {
  return std::visit([] <typename T> (T const&) { return type_name<T>(); },
                    v.get());
}

value
make_tag(std::string name) {
  return value::tag{std::move(name)};
}

value
make_list(value_vector elements) {
  return value::list{
    std::make_shared<value_vector const>(std::move(elements))
  };
}

value
make_tuple(value_vector elements) {
  return value::tuple{
    std::make_shared<value_vector const>(std::move(elements))
  };
}

value
make_map(std::vector<std::pair<value, value>> entries) {
  return value::map{
    std::make_shared<std::vector<std::pair<value, value>> const>(
      std::move(entries)
    )
  };
}

value_vector const&
list_elements(value const& v) {
  return *expect<value::list>(v).elements;
}

bool
truthy(value const& v) {
  if (is<value::nil>(v))
    return false;
  else if (auto b = match<bool>(v))
    return *b;
  else
    return true;
}

bool
is_number(value const& v) {
  return is<std::int64_t>(v) || is<double>(v);
}

double
to_double(value const& v) {
  if (auto i = match<std::int64_t>(v))
    return static_cast<double>(*i);
  else
    return expect<double>(v);
}

template <typename Equal>
static bool
equal_sequences(value_vector const& lhs, value_vector const& rhs,
                Equal const& eq) {
  return std::ranges::equal(lhs, rhs, eq);
}

template <typename Equal>
static bool
structurally_equal(value const& lhs, value const& rhs, Equal const& eq) {
  if (lhs.get().index() != rhs.get().index())
    return false;

  if (auto l = match<value::list>(lhs))
    return equal_sequences(*l->elements, list_elements(rhs), eq);
  else if (auto t = match<value::tuple>(lhs))
    return equal_sequences(*t->elements,
                           *expect<value::tuple>(rhs).elements, eq);
  else if (auto m = match<value::map>(lhs)) {
    auto const& other = *expect<value::map>(rhs).entries;
    if (m->entries->size() != other.size())
      return false;
    for (auto const& [k, v] : *m->entries)
      if (!eq(map_lookup(expect<value::map>(rhs), k), v))
        return false;
    return true;
  } else if (auto tg = match<value::tag>(lhs))
    return tg->name == expect<value::tag>(rhs).name;
  else if (is<value::nil>(lhs))
    return true;
  else if (auto b = match<bool>(lhs))
    return *b == expect<bool>(rhs);
  else if (auto i = match<std::int64_t>(lhs))
    return *i == expect<std::int64_t>(rhs);
  else if (auto d = match<double>(lhs))
    return *d == expect<double>(rhs);
  else if (auto s = match<std::string>(lhs))
    return *s == expect<std::string>(rhs);
  else
    return expect<value::procedure_ptr>(lhs)
           == expect<value::procedure_ptr>(rhs);
}

bool
equal(value const& lhs, value const& rhs) {
  return structurally_equal(lhs, rhs, [] (value const& x, value const& y) {
    return equal(x, y);
  });
}

bool
arith_equal(value const& lhs, value const& rhs) {
  if (is_number(lhs) && is_number(rhs)) {
    if (is<std::int64_t>(lhs) && is<std::int64_t>(rhs))
      return *match<std::int64_t>(lhs) == *match<std::int64_t>(rhs);
    else
      return to_double(lhs) == to_double(rhs);
  }

  return structurally_equal(lhs, rhs, [] (value const& x, value const& y) {
    return arith_equal(x, y);
  });
}

int
compare(value const& lhs, value const& rhs) {
  if (is_number(lhs) && is_number(rhs)) {
    if (is<std::int64_t>(lhs) && is<std::int64_t>(rhs)) {
      auto x = *match<std::int64_t>(lhs);
      auto y = *match<std::int64_t>(rhs);
      return x < y ? -1 : (x > y ? 1 : 0);
    }

    double x = to_double(lhs);
    double y = to_double(rhs);
    return x < y ? -1 : (x > y ? 1 : 0);
  } else if (auto s = match<std::string>(lhs))
    return s->compare(expect<std::string>(rhs)) < 0
             ? -1
             : (*s == expect<std::string>(rhs) ? 0 : 1);
  else if (is_number(lhs))
    throw make_error<type_error>("Can't compare {} with {}",
                                 value_type_name(lhs), value_type_name(rhs));
  else
    throw make_error<type_error>("Can't order values of type {}",
                                 value_type_name(lhs));
}

value
map_lookup(value::map const& m, value const& key) {
  for (auto const& [k, v] : *m.entries)
    if (equal(k, key))
      return v;
  return value::nil{};
}

value
list_head(value const& v) {
  value_vector const& elements = list_elements(v);
  return elements.empty() ? value{value::nil{}} : elements.front();
}

value
list_tail(value const& v) {
  value_vector const& elements = list_elements(v);
  if (elements.empty())
    return v;
  return make_list(value_vector(elements.begin() + 1, elements.end()));
}

value
list_cons(value const& head, value const& tail) {
  value_vector result{head};
  if (!is<value::nil>(tail)) {
    value_vector const& rest = list_elements(tail);
    result.insert(result.end(), rest.begin(), rest.end());
  }
  return make_list(std::move(result));
}

bool
is_empty(value const& v) {
  if (is<value::nil>(v))
    return true;
  else if (auto l = match<value::list>(v))
    return l->elements->empty();
  else if (auto s = match<std::string>(v))
    return s->empty();
  else if (auto t = match<value::tuple>(v))
    return t->elements->empty();
  else
    return expect<value::map>(v).entries->empty();
}

} // namespace parens
