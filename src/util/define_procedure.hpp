#ifndef PARENS_UTIL_DEFINE_PROCEDURE_HPP
#define PARENS_UTIL_DEFINE_PROCEDURE_HPP

#include "runtime/error.hpp"
#include "runtime/module.hpp"
#include "runtime/value.hpp"
#include "vm/vm.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace parens {

// Conversion of procedure arguments from run-time values to the C++ parameter
// types of a native procedure.
template <typename T>
struct from_value_converter;

template <>
struct from_value_converter<value> {
  static value
  convert(value const& v) { return v; }
};

template <>
struct from_value_converter<std::int64_t> {
  static std::int64_t
  convert(value const& v) { return expect<std::int64_t>(v); }
};

// Integers are accepted where a float is expected.
template <>
struct from_value_converter<double> {
  static double
  convert(value const& v) {
    if (!is_number(v))
      throw make_type_error<double>(v);
    return to_double(v);
  }
};

template <>
struct from_value_converter<std::string> {
  static std::string
  convert(value const& v) { return expect<std::string>(v); }
};

template <>
struct from_value_converter<value_vector> {
  static value_vector
  convert(value const& v) { return list_elements(v); }
};

template <>
struct from_value_converter<value::procedure_ptr> {
  static value::procedure_ptr
  convert(value const& v) { return expect<value::procedure_ptr>(v); }
};

template <>
struct from_value_converter<value::map> {
  static value::map
  convert(value const& v) { return expect<value::map>(v); }
};

template <typename T>
T
from_value(value const& v) {
  return from_value_converter<T>::convert(v);
}

template <typename T>
value
to_value(T&& x) {
  if constexpr (std::is_same_v<std::remove_cvref_t<T>, value_vector>)
    return make_list(std::forward<T>(x));
  else
    return value{std::forward<T>(x)};
}

namespace detail {
  template <auto Callable, typename FunctionType>
  struct make_native_procedure_object;

  template <auto Callable, typename R, typename... Args>
  struct make_native_procedure_object<Callable, R(vm&, Args...)> {
    static void
    check_args_size(std::string const& name, std::vector<value> const& args) {
      if (args.size() != sizeof...(Args))
        throw make_error("{}: Wrong number of arguments, expected {}, got {}",
                         name, sizeof...(Args), args.size());
    }

    template <std::size_t... Is>
    static value
    call(vm& state, std::vector<value> const& args,
         std::index_sequence<Is...>) {
      return to_value(
        Callable(state, from_value<std::remove_cvref_t<Args>>(args[Is])...)
      );
    }

    static std::shared_ptr<native_procedure const>
    make(std::string name) {
      return std::make_shared<native_procedure const>(
        name,
        [name] (vm& state, std::vector<value> const& args) {
          check_args_size(name, args);
          return call(state, args, std::index_sequence_for<Args...>{});
        }
      );
    }
  };
}

// Define a native procedure in the module. The callable takes the vm followed
// by its arguments, each converted with from_value; its result is converted
// with to_value.
template <auto Callable>
void
define_procedure(module_& m, std::string const& name) {
  using function_type = std::remove_pointer_t<decltype(Callable)>;
  m.define(
    name,
    value::procedure_ptr{
      detail::make_native_procedure_object<Callable, function_type>::make(name)
    }
  );
}

// Define a native procedure that receives its arguments unconverted, for
// procedures taking any number of arguments.
template <auto Callable>
void
define_raw_procedure(module_& m, std::string const& name) {
  m.define(name,
           value::procedure_ptr{
             std::make_shared<native_procedure const>(name, Callable)
           });
}

} // namespace parens

#endif
