#include "runtime/core_library.hpp"

#include "io/write.hpp"
#include "runtime/error.hpp"
#include "runtime/module.hpp"
#include "runtime/numeric.hpp"
#include "runtime/value.hpp"
#include "util/define_procedure.hpp"
#include "vm/vm.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <system_error>
#include <utility>

namespace parens {

static value
call(vm& state, value::procedure_ptr const& f, std::vector<value> const& args) {
  return f->call(state, args);
}

static std::int64_t
length(value_vector const& list) {
  return static_cast<std::int64_t>(list.size());
}

static value
first(vm&, value const& list) {
  return list_head(list);
}

static value
rest(vm&, value const& list) {
  return list_tail(list);
}

static value
cons(vm&, value const& head, value const& tail) {
  return list_cons(head, tail);
}

static value
second(vm&, value const& list) {
  return list_head(list_tail(list));
}

static value
third(vm&, value const& list) {
  return list_head(list_tail(list_tail(list)));
}

static value
nth(vm&, value_vector const& list, std::int64_t n) {
  if (n < 0)
    throw make_error("nth: Index must be non-negative, got {}", n);
  if (n >= length(list))
    return value::nil{};
  return list[n];
}

static std::uint64_t
magnitude(std::int64_t n) {
  return n < 0 ? std::uint64_t{0} - static_cast<std::uint64_t>(n)
               : static_cast<std::uint64_t>(n);
}

// |n|, capped at the length of the list.
static std::int64_t
clamped_count(value_vector const& list, std::int64_t n) {
  return static_cast<std::int64_t>(
    std::min(magnitude(n), static_cast<std::uint64_t>(list.size()))
  );
}

// A negative count takes from the end of the list.
static value_vector
take(vm&, value_vector const& list, std::int64_t n) {
  std::int64_t count = clamped_count(list, n);
  if (n >= 0)
    return value_vector(list.begin(), list.begin() + count);
  else
    return value_vector(list.end() - count, list.end());
}

// A negative count drops from the end of the list.
static value_vector
drop(vm&, value_vector const& list, std::int64_t n) {
  std::int64_t count = clamped_count(list, n);
  if (n >= 0)
    return value_vector(list.begin() + count, list.end());
  else
    return value_vector(list.begin(), list.end() - count);
}

static value
last(vm&, value_vector const& list) {
  return list.empty() ? value{value::nil{}} : list.back();
}

static value_vector
reverse_proc(vm&, value_vector list) {
  std::reverse(list.begin(), list.end());
  return list;
}

static value_vector
append_proc(vm&, value_vector lhs, value_vector const& rhs) {
  lhs.insert(lhs.end(), rhs.begin(), rhs.end());
  return lhs;
}

static std::int64_t
list_length(vm&, value_vector const& list) {
  return length(list);
}

static value_vector
map_proc(vm& state,
         value::procedure_ptr const& f, value_vector const& list) {
  value_vector result;
  result.reserve(list.size());
  for (value const& x : list)
    result.push_back(call(state, f, {x}));
  return result;
}

static value_vector
filter_proc(vm& state,
            value::procedure_ptr const& pred, value_vector const& list) {
  value_vector result;
  for (value const& x : list)
    if (truthy(call(state, pred, {x})))
      result.push_back(x);
  return result;
}

// The function receives the element first and the accumulator second.
static value
reduce(vm& state, value::procedure_ptr const& f, value const& initial,
       value_vector const& list) {
  value acc = initial;
  for (value const& x : list)
    acc = call(state, f, {x, acc});
  return acc;
}

static value
foldr(vm& state, value::procedure_ptr const& f, value const& initial,
      value_vector const& list) {
  value acc = initial;
  for (auto x = list.rbegin(); x != list.rend(); ++x)
    acc = call(state, f, {*x, acc});
  return acc;
}

static value
apply_proc(vm& state,
           value::procedure_ptr const& f, value_vector const& args) {
  return call(state, f, args);
}

static value::procedure_ptr
compose(vm&, value::procedure_ptr const& f, value::procedure_ptr const& g) {
  return std::make_shared<native_procedure const>(
    "compose",
    [f, g] (vm& state, std::vector<value> const& args) {
      return call(state, f, {call(state, g, args)});
    }
  );
}

static value::procedure_ptr
partial(vm&, value::procedure_ptr const& f, value const& arg) {
  return std::make_shared<native_procedure const>(
    "partial",
    [f, arg] (vm& state, std::vector<value> const& args) {
      std::vector<value> full_args{arg};
      full_args.insert(full_args.end(), args.begin(), args.end());
      return call(state, f, full_args);
    }
  );
}

static value
identity(vm&, value const& x) {
  return x;
}

static value::procedure_ptr
constantly(vm&, value const& x) {
  return std::make_shared<native_procedure const>(
    "constantly",
    [x] (vm&, std::vector<value> const&) { return x; }
  );
}

// Both ends are included. The range counts down when start is greater than
// stop.
static value_vector
range_proc(vm&, std::int64_t start, std::int64_t stop) {
  value_vector result;
  if (start <= stop)
    for (std::int64_t i = start; ; ++i) {
      result.emplace_back(i);
      if (i == stop)
        break;
    }
  else
    for (std::int64_t i = start; ; --i) {
      result.emplace_back(i);
      if (i == stop)
        break;
    }
  return result;
}

static value_vector
repeat(vm&, value const& x, std::int64_t n) {
  if (n < 0)
    throw make_error("repeat: Count must be non-negative, got {}", n);
  return value_vector(static_cast<std::size_t>(n), x);
}

static value_vector
zip(vm&, value_vector const& lhs, value_vector const& rhs) {
  value_vector result;
  for (std::size_t i = 0; i < std::min(lhs.size(), rhs.size()); ++i)
    result.push_back(make_tuple({lhs[i], rhs[i]}));
  return result;
}

static void
flatten_into(value_vector& result, value_vector const& list) {
  for (value const& x : list)
    if (auto l = match<value::list>(x))
      flatten_into(result, *l->elements);
    else
      result.push_back(x);
}

static value_vector
flatten(vm&, value_vector const& list) {
  value_vector result;
  flatten_into(result, list);
  return result;
}

static value_vector
distinct(vm&, value_vector const& list) {
  value_vector result;
  for (value const& x : list)
    if (std::none_of(result.begin(), result.end(),
                     [&] (value const& y) { return equal(x, y); }))
      result.push_back(x);
  return result;
}

static value_vector
sort_proc(vm&, value_vector list) {
  std::stable_sort(list.begin(), list.end(),
                   [] (value const& x, value const& y) {
                     return compare(x, y) < 0;
                   });
  return list;
}

static bool
all_proc(vm& state,
         value::procedure_ptr const& pred, value_vector const& list) {
  return std::all_of(list.begin(), list.end(),
                     [&] (value const& x) {
                       return truthy(call(state, pred, {x}));
                     });
}

static bool
any_proc(vm& state,
         value::procedure_ptr const& pred, value_vector const& list) {
  return std::any_of(list.begin(), list.end(),
                     [&] (value const& x) {
                       return truthy(call(state, pred, {x}));
                     });
}

static value
find_proc(vm& state,
          value::procedure_ptr const& pred, value_vector const& list) {
  for (value const& x : list)
    if (truthy(call(state, pred, {x})))
      return x;
  return value::nil{};
}

// A list of two lists: the elements satisfying the predicate and the rest.
static value_vector
partition_proc(vm& state, value::procedure_ptr const& pred,
          value_vector const& list) {
  value_vector yes;
  value_vector no;
  for (value const& x : list)
    if (truthy(call(state, pred, {x})))
      yes.push_back(x);
    else
      no.push_back(x);
  return {make_list(std::move(yes)), make_list(std::move(no))};
}

static value_vector
interleave(vm&, value_vector const& lhs, value_vector const& rhs) {
  value_vector result;
  std::size_t common = std::min(lhs.size(), rhs.size());
  for (std::size_t i = 0; i < common; ++i) {
    result.push_back(lhs[i]);
    result.push_back(rhs[i]);
  }
  result.insert(result.end(), lhs.begin() + common, lhs.end());
  result.insert(result.end(), rhs.begin() + common, rhs.end());
  return result;
}

static value
sum_proc(vm&, value_vector const& list) {
  value result = 0;
  for (value const& x : list)
    result = add(result, x);
  return result;
}

static value
product(vm&, value_vector const& list) {
  value result = 1;
  for (value const& x : list)
    result = multiply(result, x);
  return result;
}

static value
inc(vm&, value const& n) {
  return add(n, 1);
}

static value
dec(vm&, value const& n) {
  return subtract(n, 1);
}

static value
square(vm&, value const& n) {
  return multiply(n, n);
}

static value
cube(vm&, value const& n) {
  return multiply(multiply(n, n), n);
}

static double
pow_proc(vm&, double base, double exponent) {
  return std::pow(base, exponent);
}

static double
sqrt_proc(vm&, double n) {
  if (n < 0.0)
    throw make_error("sqrt: Argument must be non-negative, got {}",
                     number_to_string(n));
  return std::sqrt(n);
}

static value
abs_proc(vm&, value const& n) {
  if (auto d = match<double>(n))
    return std::fabs(*d);
  else if (expect<std::int64_t>(n) < 0)
    return negate(n);
  else
    return n;
}

static value
max_proc(vm&, value const& x, value const& y) {
  return compare(x, y) < 0 ? y : x;
}

static value
min_proc(vm&, value const& x, value const& y) {
  return compare(y, x) < 0 ? y : x;
}

static std::int64_t
gcd(vm&, std::int64_t x, std::int64_t y) {
  std::uint64_t a = magnitude(x);
  std::uint64_t b = magnitude(y);
  while (b != 0)
    a = std::exchange(b, a % b);

  if (a > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
    throw make_error("Integer overflow");
  return static_cast<std::int64_t>(a);
}

static bool
is_even(vm&, std::int64_t n) {
  return n % 2 == 0;
}

static bool
is_odd(vm&, std::int64_t n) {
  return n % 2 != 0;
}

static bool
is_zero(vm&, double n) {
  return n == 0.0;
}

static bool
is_positive(vm&, double n) {
  return n > 0.0;
}

static bool
is_negative(vm&, double n) {
  return n < 0.0;
}

static bool
is_function(vm&, value const& x) {
  return is<value::procedure_ptr>(x);
}

static bool
is_nil(vm&, value const& x) {
  return is<value::nil>(x);
}

static bool
is_empty_proc(vm&, value const& x) {
  return is_empty(x);
}

static bool
is_list(vm&, value const& x) {
  return is<value::list>(x);
}

static bool
is_atom(vm&, value const& x) {
  return is<value::tag>(x) || is<bool>(x) || is<value::nil>(x);
}

static bool
is_number_proc(vm&, value const& x) {
  return is_number(x);
}

static bool
is_string(vm&, value const& x) {
  return is<std::string>(x);
}

static std::string
to_string(vm&, value const& x) {
  return display_string(x);
}

static std::int64_t
parse_integer(std::string const& s) {
  std::int64_t result{};
  auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
  if (ec != std::errc{} || end != s.data() + s.size())
    throw make_error("to-integer: Invalid integer {}", quote_string(s));
  return result;
}

static std::int64_t
to_integer(vm&, value const& x) {
  if (auto s = match<std::string>(x))
    return parse_integer(*s);
  else if (auto d = match<double>(x)) {
    double truncated = std::trunc(*d);
    if (!(truncated >= -9223372036854775808.0
          && truncated < 9223372036854775808.0))
      throw make_error("to-integer: {} is out of range",
                       number_to_string(*d));
    return static_cast<std::int64_t>(truncated);
  } else
    return expect<std::int64_t>(x);
}

static double
parse_float(std::string const& s) {
  double result{};
  auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
  if (ec != std::errc{} || end != s.data() + s.size())
    throw make_error("to-float: Invalid number {}", quote_string(s));
  return result;
}

static double
to_float(vm&, value const& x) {
  if (auto s = match<std::string>(x))
    return parse_float(*s);
  else if (is_number(x))
    return to_double(x);
  else
    throw make_type_error<double>(x);
}

// Length in code points of a UTF-8 string.
static std::int64_t
string_length(vm&, std::string const& s) {
  return std::count_if(s.begin(), s.end(),
                       [] (char c) {
                         return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
                       });
}

static std::vector<std::pair<value, value>>
put_entry(std::vector<std::pair<value, value>> entries, value const& key,
          value const& v) {
  for (auto& entry : entries)
    if (equal(entry.first, key)) {
      entry.second = v;
      return entries;
    }
  entries.emplace_back(key, v);
  return entries;
}

// (hash-map k1 v1 k2 v2 ...). A later entry for a key replaces an earlier
// one.
static value
hash_map(vm&, std::vector<value> const& args) {
  if (args.size() % 2 != 0)
    throw make_error("hash-map: Expected an even number of arguments, got {}",
                     args.size());

  std::vector<std::pair<value, value>> entries;
  for (std::size_t i = 0; i < args.size(); i += 2)
    entries = put_entry(std::move(entries), args[i], args[i + 1]);
  return make_map(std::move(entries));
}

static value
get_proc(vm&, value const& m, value const& key) {
  if (is<value::nil>(m))
    return value::nil{};
  return map_lookup(expect<value::map>(m), key);
}

static value
put_proc(vm&, value::map const& m, value const& key, value const& v) {
  return make_map(put_entry(*m.entries, key, v));
}

static value_vector
keys_proc(vm&, value::map const& m) {
  value_vector result;
  for (auto const& entry : *m.entries)
    result.push_back(entry.first);
  return result;
}

void
export_core_library(module_& result) {
  define_procedure<first>(result, "car");
  define_procedure<rest>(result, "cdr");
  define_procedure<cons>(result, "cons");
  define_procedure<first>(result, "first");
  define_procedure<rest>(result, "rest");
  define_procedure<first>(result, "head");
  define_procedure<rest>(result, "tail");
  define_procedure<second>(result, "second");
  define_procedure<third>(result, "third");
  define_procedure<nth>(result, "nth");
  define_procedure<take>(result, "take");
  define_procedure<drop>(result, "drop");
  define_procedure<last>(result, "last");
  define_procedure<reverse_proc>(result, "reverse");
  define_procedure<append_proc>(result, "append");
  define_procedure<list_length>(result, "length");

  define_procedure<map_proc>(result, "map");
  define_procedure<filter_proc>(result, "filter");
  define_procedure<reduce>(result, "reduce");
  define_procedure<reduce>(result, "foldl");
  define_procedure<foldr>(result, "foldr");
  define_procedure<apply_proc>(result, "apply");
  define_procedure<compose>(result, "compose");
  define_procedure<partial>(result, "partial");
  define_procedure<identity>(result, "identity");
  define_procedure<constantly>(result, "constantly");

  define_procedure<range_proc>(result, "range");
  define_procedure<repeat>(result, "repeat");
  define_procedure<zip>(result, "zip");
  define_procedure<flatten>(result, "flatten");
  define_procedure<distinct>(result, "distinct");
  define_procedure<sort_proc>(result, "sort");
  define_procedure<all_proc>(result, "all?");
  define_procedure<any_proc>(result, "any?");
  define_procedure<find_proc>(result, "find");
  define_procedure<partition_proc>(result, "partition");
  define_procedure<interleave>(result, "interleave");

  define_procedure<sum_proc>(result, "sum");
  define_procedure<product>(result, "product");
  define_procedure<inc>(result, "inc");
  define_procedure<dec>(result, "dec");
  define_procedure<square>(result, "square");
  define_procedure<cube>(result, "cube");
  define_procedure<pow_proc>(result, "pow");
  define_procedure<sqrt_proc>(result, "sqrt");
  define_procedure<abs_proc>(result, "abs");
  define_procedure<max_proc>(result, "max");
  define_procedure<min_proc>(result, "min");
  define_procedure<gcd>(result, "gcd");

  define_procedure<is_even>(result, "even?");
  define_procedure<is_odd>(result, "odd?");
  define_procedure<is_zero>(result, "zero?");
  define_procedure<is_positive>(result, "positive?");
  define_procedure<is_negative>(result, "negative?");
  define_procedure<is_function>(result, "function?");
  define_procedure<is_nil>(result, "nil?");
  define_procedure<is_empty_proc>(result, "empty?");
  define_procedure<is_list>(result, "list?");
  define_procedure<is_atom>(result, "atom?");
  define_procedure<is_number_proc>(result, "number?");
  define_procedure<is_string>(result, "string?");

  define_procedure<to_string>(result, "to-string");
  define_procedure<to_integer>(result, "to-integer");
  define_procedure<to_float>(result, "to-float");
  define_procedure<string_length>(result, "str-length");

  define_raw_procedure<hash_map>(result, "hash-map");
  define_procedure<get_proc>(result, "get");
  define_procedure<put_proc>(result, "put");
  define_procedure<keys_proc>(result, "keys");
}

} // namespace parens
