#include "io/read.hpp"
#include "io/write.hpp"
#include "runtime/value.hpp"

#include <gtest/gtest.h>

using namespace parens;

TEST(write, sexpr_to_string_is_canonical) {
  EXPECT_EQ(sexpr_to_string(read("(  a   b\n c )")), "(a b c)");
  EXPECT_EQ(sexpr_to_string(read(R"(["x\n" :k 1.5 -2 nil])")),
            R"(["x\n" :k 1.5 -2 nil])");
  EXPECT_EQ(sexpr_to_string(read("'(a ~b ~@c `d)")), "'(a ~b ~@c `d)");
  EXPECT_EQ(sexpr_to_string(read("~{x}")), "~{x}");
}

TEST(write, floats_keep_their_period) {
  EXPECT_EQ(sexpr_to_string(read("2.0")), "2.0");
  EXPECT_EQ(number_to_string(0.5), "0.5");
  EXPECT_EQ(number_to_string(100.0), "100.0");
}

TEST(write, tiny_and_huge_floats_keep_their_digits) {
  EXPECT_EQ(number_to_string(1e-7), "0.0000001");
  EXPECT_EQ(number_to_string(1.5e-10), "0.00000000015");
  EXPECT_EQ(number_to_string(-2.5e-8), "-0.000000025");
  EXPECT_EQ(number_to_string(1e20), "100000000000000000000.0");
}

TEST(write, short_flat_lists_stay_on_one_line) {
  EXPECT_EQ(format_sexpr(read("(+ 1 2)")), "(+ 1 2)");
}

TEST(write, long_lists_are_broken_over_lines) {
  EXPECT_EQ(format_sexpr(read("(+ 1 2 3)")),
            "(\n"
            "  +\n"
            "  1\n"
            "  2\n"
            "  3\n"
            ")");
}

TEST(write, nested_lists_are_indented) {
  EXPECT_EQ(format_sexpr(read("(defn f [x] (* x 2))")),
            "(\n"
            "  defn\n"
            "  f\n"
            "  [x]\n"
            "  (* x 2)\n"
            ")");

  EXPECT_EQ(format_sexpr(read("(a (b c d e))")),
            "(\n"
            "  a\n"
            "  (\n"
            "    b\n"
            "    c\n"
            "    d\n"
            "    e\n"
            "  )\n"
            ")");
}

TEST(write, formatted_text_reads_back_equal) {
  for (char const* source : {"(defn fact [n] (if (<= n 1) 1 (* n (fact (- n 1)))))",
                             "(let [x 10 y (* x 2)] {x y \"s\"})",
                             "(case x (1 :one) (_ :other))",
                             "'(quote (a b c d e f))",
                             "0.0000001",
                             "[0.00000000015 -0.000000025]"}) {
    sexpr x = read(source);
    EXPECT_EQ(read(format_sexpr(x)), x) << source;
    EXPECT_EQ(read(sexpr_to_string(x)), x) << source;
  }
}

TEST(write, value_representation) {
  EXPECT_EQ(value_to_string(value::nil{}), "nil");
  EXPECT_EQ(value_to_string(true), "true");
  EXPECT_EQ(value_to_string(42), "42");
  EXPECT_EQ(value_to_string(1.0), "1.0");
  EXPECT_EQ(value_to_string("a\"b"), R"("a\"b")");
  EXPECT_EQ(value_to_string(make_tag("ok")), ":ok");
  EXPECT_EQ(value_to_string(make_list({1, make_list({2, 3})})), "(1 (2 3))");
  EXPECT_EQ(value_to_string(make_tuple({make_tag("error"), "boom"})),
            R"({:error "boom"})");
  EXPECT_EQ(value_to_string(make_map({{make_tag("a"), 1}})), "%{:a 1}");
}

TEST(write, display_representation) {
  EXPECT_EQ(display_string(value::nil{}), "");
  EXPECT_EQ(display_string("text"), "text");
  EXPECT_EQ(display_string(make_tag("ok")), "ok");
  EXPECT_EQ(display_string(2.5), "2.5");
}
