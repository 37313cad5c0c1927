#include "io/write.hpp"

#include "runtime/sexpr.hpp"
#include "runtime/value.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <string>
#include <vector>

namespace parens {

std::string
quote_string(std::string const& s) {
  std::string result = "\"";
  for (char c : s)
    if (c == '"')
      result += R"(\")";
    else if (c == '\\')
      result += R"(\\)";
    else if (c == '\n')
      result += R"(\n)";
    else if (c == '\t')
      result += R"(\t)";
    else if (c == '\r')
      result += R"(\r)";
    else
      result += c;
  result += '"';
  return result;
}

std::string
number_to_string(double d) {
  std::string result = fmt::format("{}", d);
  if (auto e = result.find('e'); e != std::string::npos) {
    // Fixed notation with as many fraction digits as the shortest form
    // carries, so the text reads back as the same double.
    int exponent = std::stoi(result.substr(e + 1));
    std::string mantissa = result.substr(0, e);
    auto point = mantissa.find('.');
    int fraction_digits
      = point == std::string::npos
          ? 0
          : static_cast<int>(mantissa.size() - point - 1);
    result = fmt::format("{:.{}f}", d, std::max(1, fraction_digits - exponent));
  }
  if (result.find_first_of(".na") == std::string::npos)
    result += ".0";
  return result;
}

static std::string
number_to_string(std::variant<std::int64_t, double> const& n) {
  if (auto i = std::get_if<std::int64_t>(&n))
    return fmt::format("{}", *i);
  else
    return number_to_string(std::get<double>(n));
}

namespace {
  struct sexpr_writer {
    unsigned indent;
    bool     pretty;

    std::string
    write(sexpr const& x) const {
      return std::visit(*this, x.value);
    }

    std::string
    write_sequence(std::vector<sexpr> const& elements,
                   char open, char close) const {
      std::string result{open};
      bool first = true;
      for (sexpr const& e : elements) {
        if (!first)
          result += ' ';
        result += write(e);
        first = false;
      }
      result += close;
      return result;
    }

    std::string
    operator () (sexpr::nil) const { return "nil"; }

    std::string
    operator () (sexpr::atom const& a) const { return a.name; }

    std::string
    operator () (sexpr::number const& n) const {
      return number_to_string(n.value);
    }

    std::string
    operator () (sexpr::string_literal const& s) const {
      return quote_string(s.value);
    }

    std::string
    operator () (sexpr::boolean b) const { return b.value ? "true" : "false"; }

    std::string
    operator () (sexpr::keyword const& k) const { return ":" + k.name; }

    std::string
    operator () (sexpr::interpolate const& i) const {
      return "~{" + i.name + "}";
    }

    std::string
    operator () (sexpr::list const& l) const {
      if (!pretty || is_simple(l.elements))
        return write_sequence(l.elements, '(', ')');

      std::string padding(indent * 2, ' ');
      sexpr_writer inner{indent + 1, pretty};
      std::string result = "(\n";
      for (sexpr const& e : l.elements)
        result += padding + "  " + inner.write(e) + "\n";
      result += padding + ")";
      return result;
    }

    std::string
    operator () (sexpr::vector const& v) const {
      return write_sequence(v.elements, '[', ']');
    }

    std::string
    operator () (sexpr::tuple const& t) const {
      return write_sequence(t.elements, '{', '}');
    }

    std::string
    operator () (sexpr::quote const& q) const { return "'" + write(*q.datum); }

    std::string
    operator () (sexpr::quasiquote const& q) const {
      return "`" + write(*q.datum);
    }

    std::string
    operator () (sexpr::unquote const& u) const {
      return "~" + write(*u.datum);
    }

    std::string
    operator () (sexpr::unquote_splicing const& u) const {
      return "~@" + write(*u.datum);
    }

    static bool
    is_simple(std::vector<sexpr> const& elements) {
      return elements.size() <= 3
             && std::ranges::none_of(elements, [] (sexpr const& e) {
                  return sequence_elements(e) != nullptr;
                });
    }
  };
}

std::string
sexpr_to_string(sexpr const& x) {
  return sexpr_writer{0, false}.write(x);
}

std::string
format_sexpr(sexpr const& x, unsigned indent) {
  return sexpr_writer{indent, true}.write(x);
}

namespace {
  struct value_writer {
    bool display;

    std::string
    write_elements(value_vector const& elements) const {
      std::string result;
      bool first = true;
      for (value const& e : elements) {
        if (!first)
          result += ' ';
        result += value_to_string(e);
        first = false;
      }
      return result;
    }

    std::string
    operator () (value::nil) const { return display ? "" : "nil"; }

    std::string
    operator () (bool b) const { return b ? "true" : "false"; }

    std::string
    operator () (std::int64_t i) const { return fmt::format("{}", i); }

    std::string
    operator () (double d) const { return number_to_string(d); }

    std::string
    operator () (std::string const& s) const {
      return display ? s : quote_string(s);
    }

    std::string
    operator () (value::tag const& t) const {
      return display ? t.name : ":" + t.name;
    }

    std::string
    operator () (value::list const& l) const {
      return "(" + write_elements(*l.elements) + ")";
    }

    std::string
    operator () (value::tuple const& t) const {
      return "{" + write_elements(*t.elements) + "}";
    }

    std::string
    operator () (value::map const& m) const {
      std::string result = "%{";
      bool first = true;
      for (auto const& [k, v] : *m.entries) {
        if (!first)
          result += ", ";
        result += value_to_string(k) + " " + value_to_string(v);
        first = false;
      }
      result += "}";
      return result;
    }

    std::string
    operator () (value::procedure_ptr const& p) const {
      return fmt::format("<procedure {}>", p->name());
    }
  };
}

std::string
value_to_string(value const& v) {
  return std::visit(value_writer{false}, v.get());
}

std::string
display_string(value const& v) {
  return std::visit(value_writer{true}, v.get());
}

} // namespace parens
