#include "parens_fixture.hpp"

#include "runtime/error.hpp"

using namespace parens;

struct interpreter : parens_fixture { };

TEST_F(interpreter, arithmetic) {
  EXPECT_TRUE(equal(eval("(+ 1 2 3)"), 6));
  EXPECT_TRUE(equal(eval("(* (+ 1 2) 3)"), 9));
  EXPECT_TRUE(equal(eval("(- 10 4 3)"), 3));
  EXPECT_TRUE(equal(eval("(- 5)"), -5));
  EXPECT_TRUE(equal(eval("(+ 1 2.5)"), 3.5));
}

TEST_F(interpreter, division_gives_float) {
  EXPECT_TRUE(equal(eval("(/ 10 4)"), 2.5));
  EXPECT_TRUE(equal(eval("(/ 4 2)"), 2.0));
  EXPECT_THROW(eval("(/ 1 0)"), evaluation_error);
}

TEST_F(interpreter, remainder) {
  EXPECT_TRUE(equal(eval("(rem 7 3)"), 1));
  EXPECT_TRUE(equal(eval("(rem -7 3)"), -1));
  EXPECT_TRUE(equal(eval("(mod 7 3)"), 1));
  EXPECT_THROW(eval("(rem 7 0)"), evaluation_error);
  EXPECT_THROW(eval("(rem 7.0 2)"), type_error);
}

TEST_F(interpreter, integer_overflow_is_error) {
  EXPECT_THROW(eval("(* 9223372036854775807 2)"), evaluation_error);
  EXPECT_THROW(eval("(+ 9223372036854775807 1)"), evaluation_error);
  EXPECT_THROW(eval("(- -9223372036854775807 2)"), evaluation_error);
}

TEST_F(interpreter, arithmetic_on_non_numbers_is_type_error) {
  EXPECT_THROW(eval(R"((+ 1 "a"))"), type_error);
  EXPECT_THROW(eval("(- :a)"), type_error);
}

TEST_F(interpreter, comparisons) {
  EXPECT_TRUE(equal(eval("(< 1 2)"), true));
  EXPECT_TRUE(equal(eval("(>= 1 2)"), false));
  EXPECT_TRUE(equal(eval("(== 1 1.0)"), true));
  EXPECT_TRUE(equal(eval("(= :a :a)"), true));
  EXPECT_TRUE(equal(eval("(!= (list 1 2) (list 1 2))"), false));
  EXPECT_TRUE(equal(eval(R"((< "apple" "banana"))"), true));
  EXPECT_THROW(eval(R"((< 1 "a"))"), type_error);
}

TEST_F(interpreter, let_is_sequential) {
  EXPECT_TRUE(equal(eval("(let [x 10 y (* x 2) z (+ x y)] (* z 3))"), 90));
}

TEST_F(interpreter, let_shadows_outer_binding) {
  EXPECT_TRUE(equal(eval("(let [x 1] (let [x 2] x))"), 2));
  EXPECT_TRUE(equal(eval("(let [x 1] (do (let [x 2] x) x))"), 1));
}

TEST_F(interpreter, if_and_truthiness) {
  EXPECT_TRUE(equal(eval("(if nil 1 2)"), 2));
  EXPECT_TRUE(equal(eval("(if false 1 2)"), 2));
  EXPECT_TRUE(equal(eval("(if 0 1 2)"), 1));
  EXPECT_TRUE(equal(eval("(if (list) 1 2)"), 1));
  EXPECT_TRUE(equal(eval("(if false 1)"), value::nil{}));
}

TEST_F(interpreter, boolean_operators_short_circuit) {
  EXPECT_TRUE(equal(eval("(and false (car 1))"), false));
  EXPECT_TRUE(equal(eval("(or 1 (car 1))"), 1));
  EXPECT_TRUE(equal(eval("(and 1 2 3)"), 3));
  EXPECT_TRUE(equal(eval("(or nil false)"), false));
  EXPECT_TRUE(equal(eval("(not nil)"), true));
  EXPECT_TRUE(equal(eval("(not 0)"), false));
}

TEST_F(interpreter, cond_selects_first_true_clause) {
  EXPECT_TRUE(equal(eval("(cond [(> 1 2) :a] [(> 2 1) :b] [true :c])"),
                    make_tag("b")));
  EXPECT_TRUE(equal(eval("(cond ((> 1 2) :a) (true :c))"), make_tag("c")));
}

TEST_F(interpreter, cond_without_match_is_error) {
  EXPECT_THROW(eval("(cond [false 1] [nil 2])"), evaluation_error);
}

TEST_F(interpreter, case_matches_structurally) {
  EXPECT_TRUE(equal(eval("(case :b (:a 1) (:b 2) (_ 3))"), 2));
  EXPECT_TRUE(equal(eval("(case 7 (:a 1) (_ 3))"), 3));
  EXPECT_TRUE(equal(eval("(case (list 1 2) ('(1 2) :yes) (_ :no))"),
                    make_tag("yes")));
  EXPECT_TRUE(equal(eval("(case 1.0 (1 :int) (_ :other))"),
                    make_tag("other")));
  EXPECT_THROW(eval("(case 5 (1 :one))"), evaluation_error);
}

TEST_F(interpreter, car_and_cdr_of_empty_list) {
  EXPECT_TRUE(equal(eval("(car (list))"), value::nil{}));
  EXPECT_TRUE(equal(eval("(first (list))"), value::nil{}));
  EXPECT_TRUE(has_repr(eval("(cdr (list))"), "()"));
  EXPECT_TRUE(has_repr(eval("(tail (list))"), "()"));
}

TEST_F(interpreter, list_operations) {
  EXPECT_TRUE(equal(eval("(head (list 1 2 3))"), 1));
  EXPECT_TRUE(has_repr(eval("(rest (list 1 2 3))"), "(2 3)"));
  EXPECT_TRUE(has_repr(eval("(cons 1 (list 2 3))"), "(1 2 3)"));
  EXPECT_TRUE(has_repr(eval("(cons 1 nil)"), "(1)"));
  EXPECT_TRUE(has_repr(eval("[1 (+ 1 1) [3]]"), "(1 2 (3))"));
  EXPECT_THROW(eval("(car 1)"), type_error);
}

TEST_F(interpreter, predicates) {
  EXPECT_TRUE(equal(eval("(nil? nil)"), true));
  EXPECT_TRUE(equal(eval("(nil? false)"), false));
  EXPECT_TRUE(equal(eval("(empty? (list))"), true));
  EXPECT_TRUE(equal(eval(R"((empty? ""))"), true));
  EXPECT_TRUE(equal(eval("(empty? nil)"), true));
  EXPECT_TRUE(equal(eval("(empty? [1])"), false));
  EXPECT_TRUE(equal(eval("(list? [1])"), true));
  EXPECT_TRUE(equal(eval("(list? {1})"), false));
  EXPECT_TRUE(equal(eval("(atom? :a)"), true));
  EXPECT_TRUE(equal(eval("(atom? 1)"), false));
  EXPECT_TRUE(equal(eval("(number? 1.5)"), true));
  EXPECT_TRUE(equal(eval(R"((string? "s"))"), true));
  EXPECT_TRUE(equal(eval("(string? 1)"), false));
}

TEST_F(interpreter, str_joins_without_separator) {
  EXPECT_TRUE(equal(eval(R"((str "a" 1 :b nil 2.5))"), "a1b2.5"));
  EXPECT_TRUE(equal(eval("(str)"), ""));
}

TEST_F(interpreter, print_writes_to_output) {
  EXPECT_TRUE(equal(eval(R"((println "x" 1 :ok))"), make_tag("ok")));
  eval(R"((print "a" "b"))");
  EXPECT_EQ(output.str(), "x 1 ok\na b");
}

TEST_F(interpreter, tuples) {
  EXPECT_TRUE(has_repr(eval("{:ok (+ 1 2)}"), "{:ok 3}"));
}

TEST_F(interpreter, field_lookup) {
  EXPECT_TRUE(equal(eval(R"((:name (hash-map :name "Ann")))"), "Ann"));
  EXPECT_TRUE(equal(eval(R"((:age (hash-map :name "Ann")))"), value::nil{}));
  EXPECT_TRUE(equal(eval("(:age nil)"), value::nil{}));
  EXPECT_THROW(eval("(:age 1)"), type_error);
}

TEST_F(interpreter, quote_gives_data) {
  EXPECT_TRUE(equal(eval("'(+ 1 2)"), make_list({make_tag("+"), 1, 2})));
  EXPECT_TRUE(has_repr(eval("'[a {b \"c\"}]"), R"((:a {:b "c"}))"));
}

TEST_F(interpreter, quasiquote_evaluates_unquoted_parts) {
  EXPECT_TRUE(has_repr(eval("(let [x 1 ys (list 2 3)] `(a ~x ~@ys))"),
                       "(:a 1 2 3)"));
  EXPECT_TRUE(has_repr(eval("(let [x 1] `{:ok ~x})"), "{:ok 1}"));
  EXPECT_THROW(eval("(let [x 1] `(a ~@x))"), type_error);
}

TEST_F(interpreter, interpolation) {
  EXPECT_TRUE(has_repr(eval(R"((let [name "Bob"] `(hello ~{name})))"),
                       R"((:hello "Bob"))"));
}

TEST_F(interpreter, lambda_and_closures) {
  EXPECT_TRUE(equal(eval("((fn [x] (* x x)) 7)"), 49));
  EXPECT_TRUE(equal(eval("(let [f (fn [x] (* x 2))] (f 21))"), 42));
  EXPECT_TRUE(equal(eval("(let [n 5 f (fn [x] (+ x n)) n 100] (f 1))"), 6));
}

TEST_F(interpreter, lambda_guard) {
  EXPECT_TRUE(equal(eval("((fn [x] :when (> x 0) x) 3)"), 3));
  EXPECT_THROW(eval("((fn [x] :when (> x 0) x) -1)"), evaluation_error);
}

TEST_F(interpreter, apply_of_non_procedure_is_type_error) {
  EXPECT_THROW(eval("(let [f 1] (f 2))"), type_error);
}

TEST_F(interpreter, defn_and_call) {
  EXPECT_TRUE(equal(eval_module(R"(
    (defn square [x] (* x x))
    (square 12)
  )"), 144));
}

TEST_F(interpreter, recursion_with_clauses) {
  EXPECT_TRUE(equal(eval_module(R"(
    (defn fact [[0] 1] [[n] (* n (fact (- n 1)))])
    (fact 10)
  )"), 3628800));
}

TEST_F(interpreter, guard_clause_selection) {
  eval_module(R"(
    (defn classify [n] :when (> n 0) "positive")
    (defn classify [n] "non-positive")
  )");
  EXPECT_TRUE(equal(eval("(classify 5)"), "positive"));
  EXPECT_TRUE(equal(eval("(classify 0)"), "non-positive"));
  EXPECT_TRUE(equal(eval("(classify -3)"), "non-positive"));
}

TEST_F(interpreter, guard_raising_type_error_does_not_hold) {
  eval_module(R"(
    (defn sign [x] :when (> x 0) :pos)
    (defn sign [x] :other)
  )");
  EXPECT_TRUE(equal(eval(R"((sign "s"))"), make_tag("other")));
}

TEST_F(interpreter, list_patterns) {
  eval_module(R"(
    (defn sum-list [[[]] 0] [[[h | t]] (+ h (sum-list t))])
    (defn pair? [[[_ _]] true] [[_] false])
  )");
  EXPECT_TRUE(equal(eval("(sum-list (list 1 2 3 4))"), 10));
  EXPECT_TRUE(equal(eval("(pair? [1 2])"), true));
  EXPECT_TRUE(equal(eval("(pair? [1 2 3])"), false));
}

TEST_F(interpreter, tuple_and_literal_patterns) {
  eval_module(R"(
    (defn unwrap [{:ok v}] v)
    (defn describe [[0] :zero] [[:none] :nothing] [[x] x])
  )");
  EXPECT_TRUE(equal(eval("(unwrap {:ok 5})"), 5));
  EXPECT_THROW(eval("(unwrap {:error 1})"), evaluation_error);
  EXPECT_TRUE(equal(eval("(describe 0)"), make_tag("zero")));
  EXPECT_TRUE(equal(eval("(describe :none)"), make_tag("nothing")));
  EXPECT_TRUE(equal(eval("(describe 2)"), 2));
}

TEST_F(interpreter, pattern_guard) {
  eval_module(R"(
    (defn small [[(when x (< x 10))] :yes] [[_] :no])
  )");
  EXPECT_TRUE(equal(eval("(small 3)"), make_tag("yes")));
  EXPECT_TRUE(equal(eval("(small 30)"), make_tag("no")));
}

TEST_F(interpreter, arity_selects_clause) {
  eval_module(R"(
    (defn greet [[] "hello"] [[name] (str "hello " name)])
  )");
  EXPECT_TRUE(equal(eval("(greet)"), "hello"));
  EXPECT_TRUE(equal(eval(R"((greet "Ann"))"), "hello Ann"));
  EXPECT_THROW(eval("(greet 1 2)"), evaluation_error);
}

TEST_F(interpreter, closures_returned_from_functions) {
  EXPECT_TRUE(equal(eval_module(R"(
    (defn make-adder [n] (fn [x] (+ x n)))
    ((make-adder 1) 2)
  )"), 3));
}

TEST_F(interpreter, functions_as_values) {
  EXPECT_TRUE(has_repr(eval_module(R"(
    (defn double [x] (* x 2))
    (map double [1 2 3])
  )"), "(2 4 6)"));
}

TEST_F(interpreter, nullary_function_called_by_free_reference) {
  eval_module("(defn answer [] 42)");
  EXPECT_TRUE(equal(eval("answer"), 42));
  EXPECT_TRUE(equal(eval("(answer)"), 42));
}

TEST_F(interpreter, top_level_def) {
  EXPECT_TRUE(equal(eval_module("(def x 10) (+ x 1)"), 11));
  EXPECT_TRUE(equal(eval("x"), 10));
}

TEST_F(interpreter, def_inside_function_is_local) {
  EXPECT_TRUE(equal(eval_module(R"(
    (defn f [] (do (def y 2) (* y 3)))
    (f)
  )"), 6));
  EXPECT_THROW(eval("y"), evaluation_error);
}

TEST_F(interpreter, do_yields_last_value) {
  EXPECT_TRUE(equal(eval("(do 1 2 3)"), 3));
  EXPECT_TRUE(equal(eval("(do)"), value::nil{}));
}

TEST_F(interpreter, try_returns_value_or_error_tuple) {
  EXPECT_TRUE(equal(eval("(try (+ 2 3))"), 5));
  EXPECT_TRUE(has_repr(eval("(try (/ 1 0))"), R"({:error "Division by zero"})"));
  EXPECT_TRUE(has_repr(eval(R"((try (+ 1 "a")))"),
                       R"({:error "Invalid type: expected float, got string"})"));
}

TEST_F(interpreter, try_catches_errors_from_called_functions) {
  eval_module("(defn boom [x] (car x))");
  value result = eval("(try (boom 1))");
  auto t = match<value::tuple>(result);
  ASSERT_TRUE(t);
  EXPECT_TRUE(equal((*t->elements)[0], make_tag("error")));
}

TEST_F(interpreter, try_catches_library_exceptions_outside_the_error_hierarchy) {
  // A count this large makes the vector constructor throw std::length_error.
  value result = eval("(try (repeat 1 1000000000000000000))");
  auto t = match<value::tuple>(result);
  ASSERT_TRUE(t);
  ASSERT_EQ(t->elements->size(), 2u);
  EXPECT_TRUE(equal((*t->elements)[0], make_tag("error")));
  EXPECT_TRUE(match<std::string>((*t->elements)[1]));
}

TEST_F(interpreter, list_shaped_clauses_select_by_arity) {
  eval_module("(defn f ((x) x) ((x y) (+ x y)))");
  EXPECT_TRUE(equal(eval("(f 1 2)"), 3));
  EXPECT_TRUE(equal(eval("(f 7)"), 7));
}

TEST_F(interpreter, undefined_names_are_errors) {
  EXPECT_THROW(eval("(nope 1)"), evaluation_error);
  EXPECT_THROW(eval("nope"), evaluation_error);
}

TEST_F(interpreter, undefined_name_error_has_location) {
  try {
    eval("nope");
    FAIL() << "Expected evaluation_error";
  } catch (evaluation_error const& e) {
    EXPECT_NE(std::string{e.what()}.find("<unit test>:1:1"), std::string::npos);
    EXPECT_NE(std::string{e.what()}.find("nope"), std::string::npos);
  }
}

TEST_F(interpreter, no_matching_clause_names_arguments) {
  eval_module("(defn only-zero [[0] :zero])");
  try {
    eval("(only-zero 5)");
    FAIL() << "Expected evaluation_error";
  } catch (evaluation_error const& e) {
    EXPECT_EQ(std::string{e.what()},
              "No clause of only-zero/1 matches arguments (5)");
  }
}

TEST_F(interpreter, call_depth_is_limited) {
  eval_module("(defn forever [n] (forever (+ n 1)))");
  EXPECT_THROW(eval("(forever 0)"), evaluation_error);
  EXPECT_TRUE(has_repr(eval("(try (forever 0))"),
                       R"({:error "Maximum call depth of 1000 exceeded"})"));
}

TEST_F(interpreter, deep_recursion_within_limit) {
  eval_module(R"(
    (defn count-down [[0] :done] [[n] (count-down (- n 1))])
  )");
  EXPECT_TRUE(equal(eval("(count-down 500)"), make_tag("done")));
}

TEST(vm_config, call_depth_is_configurable) {
  vm_config config;
  config.max_call_depth = 10;
  vm state{config};

  parens::eval(state, "(defn down [[0] :done] [[n] (down (- n 1))])");
  EXPECT_TRUE(equal(parens::eval(state, "(down 5)"), make_tag("done")));
  EXPECT_THROW(parens::eval(state, "(down 20)"), evaluation_error);
}

TEST(embedding, parse_gives_sexprs_without_transforming) {
  std::vector<sexpr> forms = parse("(+ 1 2) (undefined-thing)");
  ASSERT_EQ(forms.size(), 2u);
  EXPECT_EQ(pp(forms[0]), "(+ 1 2)");
}

TEST(embedding, eval_of_empty_source_is_nil) {
  vm state;
  EXPECT_TRUE(is<value::nil>(parens::eval(state, "")));
}

TEST(embedding, to_ast_transforms_one_form) {
  expression e = to_ast(parens::read("(+ 1 2)"));
  EXPECT_TRUE(is<built_in_operation_expression>(e));
}
