#include "parens_fixture.hpp"

#include "runtime/error.hpp"

#include <string>

using namespace parens;

struct modules : parens_fixture { };

TEST_F(modules, defmodule_evaluates_to_its_name) {
  EXPECT_TRUE(equal(eval("(defmodule M (defn f [] 1))"), make_tag("M")));
  EXPECT_NE(state.find_module("M"), nullptr);
  EXPECT_EQ(state.find_module("N"), nullptr);
}

TEST_F(modules, qualified_call) {
  eval_module(R"(
    (defmodule Math
      (defn square [x] (* x x))
      (defn cube [x] (* x (square x))))
  )");
  EXPECT_TRUE(equal(eval("(Math.square 4)"), 16));
  EXPECT_TRUE(equal(eval("(Math.cube 3)"), 27));
}

TEST_F(modules, module_definitions_are_visible_to_its_functions) {
  eval_module(R"(
    (defmodule Geometry
      (def scale 3)
      (defn scaled [x] (* x scale)))
  )");
  EXPECT_TRUE(equal(eval("(Geometry.scaled 5)"), 15));
}

TEST_F(modules, module_functions_are_not_global) {
  eval_module("(defmodule M (defn hidden [] 1))");
  EXPECT_THROW(eval("(hidden)"), evaluation_error);
}

TEST_F(modules, unknown_module) {
  try {
    eval("(Nowhere.f 1)");
    FAIL() << "Expected evaluation_error";
  } catch (evaluation_error const& e) {
    EXPECT_NE(std::string{e.what()}.find("Unknown module Nowhere"),
              std::string::npos);
  }
}

TEST_F(modules, unknown_member) {
  eval_module("(defmodule M (defn f [] 1))");
  try {
    eval("(M.g 1 2)");
    FAIL() << "Expected evaluation_error";
  } catch (evaluation_error const& e) {
    EXPECT_NE(std::string{e.what()}.find("Undefined function M.g/2"),
              std::string::npos);
  }
}

TEST_F(modules, private_functions) {
  eval_module(R"(
    (defmodule Counter
      (defp step [x] (+ x 1))
      (defn twice [x] (step (step x))))
  )");
  EXPECT_TRUE(equal(eval("(Counter.twice 1)"), 3));

  try {
    eval("(Counter.step 1)");
    FAIL() << "Expected evaluation_error";
  } catch (evaluation_error const& e) {
    EXPECT_NE(std::string{e.what()}.find("Function Counter.step is private"),
              std::string::npos);
  }
}

TEST_F(modules, core_is_callable_by_qualified_name) {
  EXPECT_TRUE(equal(eval("(Core.inc 41)"), 42));
  EXPECT_TRUE(has_repr(eval("(Core.reverse [1 2 3])"), "(3 2 1)"));
  EXPECT_THROW(eval("(Core.no-such-thing 1)"), evaluation_error);
}

TEST_F(modules, clauses_accumulate_across_definitions) {
  eval_module(R"(
    (defmodule Shape
      (defn area [{:square s}] (* s s))
      (defn area [{:rect w h}] (* w h)))
  )");
  EXPECT_TRUE(equal(eval("(Shape.area {:square 3})"), 9));
  EXPECT_TRUE(equal(eval("(Shape.area {:rect 2 5})"), 10));
}

TEST_F(modules, reopening_a_module_adds_to_it) {
  eval_module("(defmodule M (defn a [] 1))");
  eval_module("(defmodule M (defn b [] 2))");
  EXPECT_TRUE(equal(eval("(+ (M.a) (M.b))"), 3));
}

TEST_F(modules, module_functions_can_call_main_module_functions) {
  eval_module(R"(
    (defn helper [x] (* x 10))
    (defmodule M (defn f [x] (helper x)))
  )");
  EXPECT_TRUE(equal(eval("(M.f 4)"), 40));
}

TEST_F(modules, module_functions_as_values) {
  eval_module(R"(
    (defmodule M
      (defn inc2 [x] (+ x 2))
      (defn all-inc [xs] (map inc2 xs)))
  )");
  EXPECT_TRUE(has_repr(eval("(M.all-inc [1 2])"), "(3 4)"));
}

TEST_F(modules, functions_reach_main_module_definitions) {
  eval_module(R"(
    (def limit 3)
    (defn over? [x] (> x limit))
  )");
  EXPECT_TRUE(equal(eval("(over? 5)"), true));
  EXPECT_TRUE(equal(eval("(over? 1)"), false));
}
