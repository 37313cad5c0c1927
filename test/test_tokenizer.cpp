#include "io/tokenizer.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace parens;

TEST(tokenizer, empty_input_gives_no_tokens) {
  EXPECT_TRUE(tokenize("").empty());
  EXPECT_TRUE(tokenize("   ").empty());
  EXPECT_TRUE(tokenize(" \t\r\n ").empty());
}

TEST(tokenizer, tokenizes_parens) {
  std::vector<token> expected{{token::left_paren{}}, {token::right_paren{}}};
  EXPECT_EQ(tokenize("()"), expected);
}

TEST(tokenizer, tokenizes_delimiters) {
  std::vector<token> expected{
    {token::left_bracket{}}, {token::right_bracket{}},
    {token::left_brace{}}, {token::right_brace{}}
  };
  EXPECT_EQ(tokenize("[ ] { }"), expected);
}

TEST(tokenizer, tokenizes_numbers) {
  std::vector<token> expected{
    {token::left_paren{}},
    {token::symbol{"+"}},
    {token::number{3.14}},
    {token::number{-2.5}},
    {token::right_paren{}}
  };
  EXPECT_EQ(tokenize("(+ 3.14 -2.5)"), expected);
}

TEST(tokenizer, integers_and_floats_are_distinguished) {
  std::vector<token> expected{
    {token::number{std::int64_t{42}}},
    {token::number{42.0}},
    {token::number{std::int64_t{-7}}}
  };
  EXPECT_EQ(tokenize("42 42.0 -7"), expected);
}

TEST(tokenizer, second_period_starts_new_token) {
  std::vector<token> tokens = tokenize("1.2.3");
  ASSERT_EQ(tokens.size(), 2u);
  EXPECT_EQ(tokens[0], token{token::number{1.2}});
  EXPECT_EQ(tokens[1], token{token::symbol{".3"}});
}

TEST(tokenizer, lone_minus_is_symbol) {
  std::vector<token> expected{
    {token::left_paren{}},
    {token::symbol{"-"}},
    {token::symbol{"x"}},
    {token::right_paren{}}
  };
  EXPECT_EQ(tokenize("(- x)"), expected);
}

TEST(tokenizer, minus_followed_by_digit_is_number) {
  EXPECT_EQ(tokenize("-5"),
            std::vector<token>{{token::number{std::int64_t{-5}}}});
}

TEST(tokenizer, symbol_names_keep_hyphens) {
  EXPECT_EQ(tokenize("str-length"),
            std::vector<token>{{token::symbol{"str-length"}}});
}

TEST(tokenizer, reserved_words) {
  std::vector<token> expected{
    {token::boolean_literal{true}},
    {token::boolean_literal{false}},
    {token::nil_literal{}},
    {token::symbol{"nil?"}}
  };
  EXPECT_EQ(tokenize("true false nil nil?"), expected);
}

TEST(tokenizer, keywords) {
  std::vector<token> expected{
    {token::keyword{"ok"}},
    {token::keyword{"when"}}
  };
  EXPECT_EQ(tokenize(":ok :when"), expected);
}

TEST(tokenizer, empty_keyword_is_error) {
  EXPECT_THROW(tokenize(": x"), lex_error);
}

TEST(tokenizer, strings_with_escapes) {
  EXPECT_EQ(tokenize(R"("a\"b\n\t\\")"),
            std::vector<token>{{token::string_literal{"a\"b\n\t\\"}}});
}

TEST(tokenizer, unterminated_string_is_error) {
  EXPECT_THROW(tokenize(R"("abc)"), lex_error);
}

TEST(tokenizer, quote_prefixes) {
  std::vector<token> expected{
    {token::quote{}}, {token::symbol{"a"}},
    {token::quasiquote{}}, {token::symbol{"b"}},
    {token::unquote_splicing{}}, {token::symbol{"c"}},
    {token::unquote{}}, {token::symbol{"d"}}
  };
  EXPECT_EQ(tokenize("'a `b ~@c ~d"), expected);
}

TEST(tokenizer, interpolation) {
  EXPECT_EQ(tokenize("~{name}"),
            std::vector<token>{{token::interpolate{"name"}}});
}

TEST(tokenizer, unterminated_interpolation_is_error) {
  EXPECT_THROW(tokenize("~{name"), lex_error);
}

TEST(tokenizer, comments_are_skipped) {
  std::vector<token> expected{
    {token::number{std::int64_t{1}}},
    {token::number{std::int64_t{2}}}
  };
  EXPECT_EQ(tokenize("1 ; one\n2 ; two"), expected);
}

TEST(tokenizer, unsupported_character_is_named_in_error) {
  try {
    tokenize("(+ 1 #)");
    FAIL() << "Expected lex_error";
  } catch (lex_error const& e) {
    EXPECT_NE(std::string{e.what()}.find('#'), std::string::npos);
  }
}

TEST(tokenizer, unsupported_character_inside_symbol) {
  EXPECT_THROW(tokenize("ab$c"), lex_error);
}

TEST(tokenizer, tokens_carry_locations) {
  std::vector<token> tokens = tokenize("(a\n  b)", "file.lisp");
  ASSERT_EQ(tokens.size(), 4u);
  EXPECT_EQ(tokens[0].location.line, 1u);
  EXPECT_EQ(tokens[0].location.column, 1u);
  EXPECT_EQ(tokens[2].location.line, 2u);
  EXPECT_EQ(tokens[2].location.column, 3u);
  EXPECT_EQ(tokens[2].location.file_name, "file.lisp");
}

TEST(tokenizer, token_to_string_gives_source_text) {
  EXPECT_EQ(token_to_string({token::unquote_splicing{}}), "~@");
  EXPECT_EQ(token_to_string({token::keyword{"ok"}}), ":ok");
  EXPECT_EQ(token_to_string({token::interpolate{"x"}}), "~{x}");
}
