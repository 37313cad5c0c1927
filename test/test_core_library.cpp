#include "parens_fixture.hpp"

#include "runtime/error.hpp"

using namespace parens;

struct core_library : parens_fixture { };

TEST_F(core_library, list_accessors) {
  EXPECT_TRUE(equal(eval("(second [1 2 3])"), 2));
  EXPECT_TRUE(equal(eval("(third [1 2 3])"), 3));
  EXPECT_TRUE(equal(eval("(third [1 2])"), value::nil{}));
  EXPECT_TRUE(equal(eval("(last [1 2 3])"), 3));
  EXPECT_TRUE(equal(eval("(last [])"), value::nil{}));
  EXPECT_TRUE(equal(eval("(length [1 2 3])"), 3));
  EXPECT_TRUE(equal(eval("(length [])"), 0));
}

TEST_F(core_library, nth) {
  EXPECT_TRUE(equal(eval("(nth [:a :b :c] 1)"), make_tag("b")));
  EXPECT_TRUE(equal(eval("(nth [:a :b :c] 3)"), value::nil{}));
  EXPECT_THROW(eval("(nth [:a] -1)"), evaluation_error);
}

TEST_F(core_library, take_and_drop) {
  EXPECT_TRUE(has_repr(eval("(take [1 2 3 4] 2)"), "(1 2)"));
  EXPECT_TRUE(has_repr(eval("(take [1 2 3 4] 10)"), "(1 2 3 4)"));
  EXPECT_TRUE(has_repr(eval("(take [1 2 3 4] -1)"), "(4)"));
  EXPECT_TRUE(has_repr(eval("(drop [1 2 3 4] 1)"), "(2 3 4)"));
  EXPECT_TRUE(has_repr(eval("(drop [1 2 3 4] -3)"), "(1)"));
  EXPECT_TRUE(has_repr(eval("(drop [1 2] 5)"), "()"));
}

TEST_F(core_library, take_and_drop_with_most_negative_count) {
  EXPECT_TRUE(has_repr(eval("(take [1 2] (- 0 9223372036854775807 1))"),
                       "(1 2)"));
  EXPECT_TRUE(has_repr(eval("(drop [1 2] (- 0 9223372036854775807 1))"),
                       "()"));
}

TEST_F(core_library, reverse_and_append) {
  EXPECT_TRUE(has_repr(eval("(reverse [1 2 3])"), "(3 2 1)"));
  EXPECT_TRUE(has_repr(eval("(append [1 2] [3])"), "(1 2 3)"));
  EXPECT_TRUE(has_repr(eval("(append [] [])"), "()"));
}

TEST_F(core_library, operations_are_values) {
  EXPECT_TRUE(has_repr(eval("(map first [[1 2] [3 4]])"), "(1 3)"));
  EXPECT_TRUE(has_repr(eval("(map rest [[1 2] [3 4]])"), "((2) (4))"));
  EXPECT_TRUE(has_repr(eval("(filter nil? [1 nil 2])"), "(nil)"));
  EXPECT_TRUE(has_repr(eval("(filter number? [1 :a 2.5])"), "(1 2.5)"));
}

TEST_F(core_library, map_and_filter) {
  EXPECT_TRUE(has_repr(eval("(map inc [1 2 3])"), "(2 3 4)"));
  EXPECT_TRUE(has_repr(eval("(map (fn [x] (* x x)) [])"), "()"));
  EXPECT_TRUE(has_repr(eval("(filter even? (range 1 6))"), "(2 4 6)"));
}

TEST_F(core_library, folds) {
  EXPECT_TRUE(equal(eval("(reduce (fn [x acc] (+ x acc)) 0 [1 2 3])"), 6));
  EXPECT_TRUE(has_repr(eval("(foldl cons (list) [1 2 3])"), "(3 2 1)"));
  EXPECT_TRUE(has_repr(eval("(foldr cons (list) [1 2 3])"), "(1 2 3)"));
  EXPECT_TRUE(equal(eval("(foldl (fn [x acc] (- x acc)) 0 [1 2 3])"), 2));
}

TEST_F(core_library, apply) {
  EXPECT_TRUE(equal(eval("(apply max [3 9])"), 9));
  EXPECT_TRUE(has_repr(eval("(apply cons [1 [2]])"), "(1 2)"));
}

TEST_F(core_library, combinators) {
  EXPECT_TRUE(equal(eval("((compose inc square) 3)"), 10));
  EXPECT_TRUE(equal(eval("((partial max 10) 4)"), 10));
  EXPECT_TRUE(equal(eval("(identity :x)"), make_tag("x")));
  EXPECT_TRUE(has_repr(eval("(map (constantly 0) [1 2])"), "(0 0)"));
  EXPECT_TRUE(equal(eval("(function? inc)"), true));
  EXPECT_TRUE(equal(eval("(function? (fn [x] x))"), true));
  EXPECT_TRUE(equal(eval("(function? 1)"), false));
}

TEST_F(core_library, range) {
  EXPECT_TRUE(has_repr(eval("(range 1 5)"), "(1 2 3 4 5)"));
  EXPECT_TRUE(has_repr(eval("(range 3 1)"), "(3 2 1)"));
  EXPECT_TRUE(has_repr(eval("(range 2 2)"), "(2)"));
}

TEST_F(core_library, sequence_tools) {
  EXPECT_TRUE(has_repr(eval("(repeat :a 3)"), "(:a :a :a)"));
  EXPECT_THROW(eval("(repeat :a -1)"), evaluation_error);
  EXPECT_TRUE(has_repr(eval("(zip [1 2 3] [:a :b])"), "({1 :a} {2 :b})"));
  EXPECT_TRUE(has_repr(eval("(flatten [1 [2 [3 4]] []])"), "(1 2 3 4)"));
  EXPECT_TRUE(has_repr(eval("(distinct [1 2 1 3 2])"), "(1 2 3)"));
  EXPECT_TRUE(has_repr(eval("(distinct [1 1.0])"), "(1 1.0)"));
  EXPECT_TRUE(has_repr(eval("(interleave [1 2 3] [:a])"), "(1 :a 2 3)"));
}

TEST_F(core_library, sort) {
  EXPECT_TRUE(has_repr(eval("(sort [3 1.5 2])"), "(1.5 2 3)"));
  EXPECT_TRUE(has_repr(eval(R"((sort ["b" "a"]))"), R"(("a" "b"))"));
  EXPECT_THROW(eval("(sort [1 :a])"), type_error);
}

TEST_F(core_library, searching) {
  EXPECT_TRUE(equal(eval("(all? even? [2 4])"), true));
  EXPECT_TRUE(equal(eval("(all? even? [])"), true));
  EXPECT_TRUE(equal(eval("(any? odd? [2 4])"), false));
  EXPECT_TRUE(equal(eval("(find odd? [2 3 5])"), 3));
  EXPECT_TRUE(equal(eval("(find odd? [2])"), value::nil{}));
  EXPECT_TRUE(has_repr(eval("(partition even? (range 1 5))"),
                       "((2 4) (1 3 5))"));
}

TEST_F(core_library, arithmetic) {
  EXPECT_TRUE(equal(eval("(sum [1 2 3])"), 6));
  EXPECT_TRUE(equal(eval("(sum [])"), 0));
  EXPECT_TRUE(equal(eval("(sum [1 0.5])"), 1.5));
  EXPECT_TRUE(equal(eval("(product [2 3 4])"), 24));
  EXPECT_TRUE(equal(eval("(inc 1)"), 2));
  EXPECT_TRUE(equal(eval("(dec 1.5)"), 0.5));
  EXPECT_TRUE(equal(eval("(square -3)"), 9));
  EXPECT_TRUE(equal(eval("(cube 2)"), 8));
  EXPECT_TRUE(equal(eval("(pow 2 10)"), 1024.0));
  EXPECT_TRUE(equal(eval("(sqrt 16)"), 4.0));
  EXPECT_THROW(eval("(sqrt -1)"), evaluation_error);
  EXPECT_TRUE(equal(eval("(abs -5)"), 5));
  EXPECT_TRUE(equal(eval("(abs -2.5)"), 2.5));
  EXPECT_TRUE(equal(eval("(max 1 2.5)"), 2.5));
  EXPECT_TRUE(equal(eval("(min 1 2.5)"), 1));
  EXPECT_TRUE(equal(eval("(gcd 12 -18)"), 6));
  EXPECT_TRUE(equal(eval("(gcd 0 0)"), 0));
  EXPECT_THROW(eval("(inc 9223372036854775807)"), evaluation_error);
}

TEST_F(core_library, number_predicates) {
  EXPECT_TRUE(equal(eval("(even? 4)"), true));
  EXPECT_TRUE(equal(eval("(odd? -3)"), true));
  EXPECT_TRUE(equal(eval("(zero? 0.0)"), true));
  EXPECT_TRUE(equal(eval("(positive? 0)"), false));
  EXPECT_TRUE(equal(eval("(negative? -0.5)"), true));
  EXPECT_THROW(eval("(even? 1.5)"), type_error);
}

TEST_F(core_library, conversions) {
  EXPECT_TRUE(equal(eval("(to-string :a)"), "a"));
  EXPECT_TRUE(equal(eval("(to-string [1 \"b\"])"), R"((1 "b"))"));
  EXPECT_TRUE(equal(eval(R"((to-integer "42"))"), 42));
  EXPECT_TRUE(equal(eval("(to-integer -2.7)"), -2));
  EXPECT_THROW(eval(R"((to-integer "4x"))"), evaluation_error);
  EXPECT_THROW(eval("(to-integer (pow 10 20))"), evaluation_error);
  EXPECT_TRUE(equal(eval(R"((to-float "2.5"))"), 2.5));
  EXPECT_TRUE(equal(eval("(to-float 2)"), 2.0));
  EXPECT_THROW(eval("(to-float :a)"), type_error);
  EXPECT_TRUE(equal(eval(R"((str-length "héllo"))"), 5));
}

TEST_F(core_library, maps) {
  EXPECT_TRUE(equal(eval("(get (hash-map :a 1 :b 2) :b)"), 2));
  EXPECT_TRUE(equal(eval("(get (hash-map :a 1) :z)"), value::nil{}));
  EXPECT_TRUE(equal(eval("(get nil :a)"), value::nil{}));
  EXPECT_TRUE(equal(eval("(get (hash-map :a 1 :a 2) :a)"), 2));
  EXPECT_TRUE(equal(eval("(get (put (hash-map :a 1) :a 5) :a)"), 5));
  EXPECT_TRUE(has_repr(eval("(keys (put (hash-map :a 1) :b 2))"), "(:a :b)"));
  EXPECT_THROW(eval("(hash-map :a)"), evaluation_error);
}

TEST_F(core_library, wrong_number_of_arguments) {
  try {
    eval("(inc 1 2)");
    FAIL() << "Expected evaluation_error";
  } catch (evaluation_error const& e) {
    EXPECT_EQ(std::string{e.what()},
              "inc: Wrong number of arguments, expected 1, got 2");
  }
}

TEST_F(core_library, wrong_argument_type) {
  EXPECT_THROW(eval("(map 1 [1])"), type_error);
  EXPECT_THROW(eval("(length 5)"), type_error);
  EXPECT_THROW(eval(R"((str-length :a))"), type_error);
}

TEST_F(core_library, user_functions_shadow_core) {
  eval_module("(defn inc [x] (+ x 100))");
  EXPECT_TRUE(equal(eval("(inc 1)"), 101));
  EXPECT_TRUE(equal(eval("(Core.inc 1)"), 2));
}
