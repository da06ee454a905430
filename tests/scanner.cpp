#include "scanner.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_vector.hpp>
#include <string>
#include <vector>

#include "token.hpp"

using namespace bacon;

using Catch::Matchers::Equals;

// NOLINTBEGIN(readability-function-cognitive-complexity)
// NOLINTBEGIN(modernize-use-designated-initializers)

TEST_CASE("empty or whitespace input", "[scanner]") {
    SECTION("empty input") {
        auto tokens = tokenize("");

        REQUIRE(tokens.size() == 1);
        REQUIRE(tokens.at(0) == Token{TokenType::Eof, "", {0, 0}});
    }

    SECTION("only whitespace") {
        auto tokens = tokenize("           \t  \n  \r\n");

        REQUIRE(tokens.size() == 1);
        REQUIRE(tokens.at(0) == Token{TokenType::Eof, "", {19, 19}});
    }
}

TEST_CASE("single character tokens", "[scanner]") {
    auto tokens = tokenize("=+(){},;");

    std::vector<Token> expected{
        {  TokenType::Equal, "=", {0, 1}},
        {   TokenType::Plus, "+", {1, 2}},
        { TokenType::Lparen, "(", {2, 3}},
        { TokenType::Rparen, ")", {3, 4}},
        { TokenType::Lbrace, "{", {4, 5}},
        { TokenType::Rbrace, "}", {5, 6}},
        {  TokenType::Comma, ",", {6, 7}},
        {   TokenType::Semi, ";", {7, 8}},
        {    TokenType::Eof,  "", {8, 8}},
    };

    REQUIRE_THAT(tokens, Equals(expected));
}

TEST_CASE("operators", "[scanner]") {
    SECTION("single character") {
        auto tokens = tokenize("!-/*5 < 10 > 5");

        std::vector<Token> expected{
            {   TokenType::Bang,  "!",   {0, 1}},
            {  TokenType::Minus,  "-",   {1, 2}},
            {  TokenType::Slash,  "/",   {2, 3}},
            {   TokenType::Star,  "*",   {3, 4}},
            {    TokenType::Int,  "5",   {4, 5}},
            {   TokenType::Less,  "<",   {6, 7}},
            {    TokenType::Int, "10",   {8, 10}},
            {TokenType::Greater,  ">", {11, 12}},
            {    TokenType::Int,  "5", {13, 14}},
            {    TokenType::Eof,   "", {14, 14}},
        };

        REQUIRE_THAT(tokens, Equals(expected));
    }

    SECTION("two characters") {
        auto tokens = tokenize("10 == 10; 10 != 9;");

        std::vector<Token> expected{
            {       TokenType::Int, "10",   {0, 2}},
            {TokenType::EqualEqual, "==",   {3, 5}},
            {       TokenType::Int, "10",   {6, 8}},
            {      TokenType::Semi,  ";",   {8, 9}},
            {       TokenType::Int, "10", {10, 12}},
            { TokenType::BangEqual, "!=", {13, 15}},
            {       TokenType::Int,  "9", {16, 17}},
            {      TokenType::Semi,  ";", {17, 18}},
            {       TokenType::Eof,   "", {18, 18}},
        };

        REQUIRE_THAT(tokens, Equals(expected));
    }

    SECTION("lookahead falls back to a single character") {
        auto tokens = tokenize("= =!= !");

        std::vector<Token> expected{
            {    TokenType::Equal,  "=", {0, 1}},
            {    TokenType::Equal,  "=", {2, 3}},
            {TokenType::BangEqual, "!=", {3, 5}},
            {     TokenType::Bang,  "!", {6, 7}},
            {      TokenType::Eof,   "", {7, 7}},
        };

        REQUIRE_THAT(tokens, Equals(expected));
    }
}

TEST_CASE("identifiers and keywords", "[scanner]") {
    SECTION("keywords") {
        auto tokens = tokenize("fn let true false if else return");

        std::vector<Token> expected{
            {    TokenType::KwFn,     "fn",   {0, 2}},
            {   TokenType::KwLet,    "let",   {3, 6}},
            {  TokenType::KwTrue,   "true",  {7, 11}},
            { TokenType::KwFalse,  "false", {12, 17}},
            {    TokenType::KwIf,     "if", {18, 20}},
            {  TokenType::KwElse,   "else", {21, 25}},
            {TokenType::KwReturn, "return", {26, 32}},
            {     TokenType::Eof,       "", {32, 32}},
        };

        REQUIRE_THAT(tokens, Equals(expected));
    }

    SECTION("keyword lookup is case sensitive and whole word") {
        auto tokens = tokenize("Let lets _if fn_ iff");

        std::vector<Token> expected{
            {TokenType::Id,  "Let",   {0, 3}},
            {TokenType::Id, "lets",   {4, 8}},
            {TokenType::Id,  "_if",  {9, 12}},
            {TokenType::Id,  "fn_", {13, 16}},
            {TokenType::Id,  "iff", {17, 20}},
            {TokenType::Eof,    "", {20, 20}},
        };

        REQUIRE_THAT(tokens, Equals(expected));
    }

    SECTION("digits end an identifier") {
        auto tokens = tokenize("abc123");

        std::vector<Token> expected{
            { TokenType::Id, "abc", {0, 3}},
            {TokenType::Int, "123", {3, 6}},
            {TokenType::Eof,    "", {6, 6}},
        };

        REQUIRE_THAT(tokens, Equals(expected));
    }
}

TEST_CASE("illegal characters", "[scanner]") {
    auto tokens = tokenize("a @ b $");

    std::vector<Token> expected{
        {     TokenType::Id, "a", {0, 1}},
        {TokenType::Illegal, "@", {2, 3}},
        {     TokenType::Id, "b", {4, 5}},
        {TokenType::Illegal, "$", {6, 7}},
        {    TokenType::Eof,  "", {7, 7}},
    };

    REQUIRE_THAT(tokens, Equals(expected));
}

TEST_CASE("bytes outside of ascii", "[scanner]") {
    auto tokens = tokenize("\x80\xff");

    std::vector<Token> expected{
        {TokenType::Illegal, "\x80", {0, 1}},
        {TokenType::Illegal, "\xff", {1, 2}},
        {    TokenType::Eof,     "", {2, 2}},
    };

    REQUIRE_THAT(tokens, Equals(expected));
}

TEST_CASE("negative numbers are two tokens", "[scanner]") {
    auto tokens = tokenize("-15");

    std::vector<Token> expected{
        {TokenType::Minus,  "-", {0, 1}},
        {  TokenType::Int, "15", {1, 3}},
        {  TokenType::Eof,   "", {3, 3}},
    };

    REQUIRE_THAT(tokens, Equals(expected));
}

TEST_CASE("a whole program", "[scanner]") {
    auto source = std::string{R"(let five = 5;
let add = fn(x, y) {
  x + y;
};
let result = add(five, 10);
if (5 < 10) { return true; } else { return false; }
)"};

    auto tokens = tokenize(source);

    std::vector<TokenType> types;
    for (auto const& t : tokens) {
        types.push_back(t.type);

        // the text is always exactly what the span covers
        if (!t.is_eof()) REQUIRE(t.text == t.span.str(source));
    }

    std::vector<TokenType> expected{
        TokenType::KwLet,    TokenType::Id,      TokenType::Equal,
        TokenType::Int,      TokenType::Semi,

        TokenType::KwLet,    TokenType::Id,      TokenType::Equal,
        TokenType::KwFn,     TokenType::Lparen,  TokenType::Id,
        TokenType::Comma,    TokenType::Id,      TokenType::Rparen,
        TokenType::Lbrace,   TokenType::Id,      TokenType::Plus,
        TokenType::Id,       TokenType::Semi,    TokenType::Rbrace,
        TokenType::Semi,

        TokenType::KwLet,    TokenType::Id,      TokenType::Equal,
        TokenType::Id,       TokenType::Lparen,  TokenType::Id,
        TokenType::Comma,    TokenType::Int,     TokenType::Rparen,
        TokenType::Semi,

        TokenType::KwIf,     TokenType::Lparen,  TokenType::Int,
        TokenType::Less,     TokenType::Int,     TokenType::Rparen,
        TokenType::Lbrace,   TokenType::KwReturn, TokenType::KwTrue,
        TokenType::Semi,     TokenType::Rbrace,  TokenType::KwElse,
        TokenType::Lbrace,   TokenType::KwReturn, TokenType::KwFalse,
        TokenType::Semi,     TokenType::Rbrace,

        TokenType::Eof,
    };

    REQUIRE_THAT(types, Equals(expected));
}

TEST_CASE("end of input is sticky", "[scanner]") {
    auto scanner = Scanner{"x"};

    REQUIRE(scanner.next_token() == Token{TokenType::Id, "x", {0, 1}});

    for (int i = 0; i < 3; i++) {
        REQUIRE(scanner.next_token() == Token{TokenType::Eof, "", {1, 1}});
    }
}

TEST_CASE("scanning is deterministic", "[scanner]") {
    auto source = "let x = fn(a) { a * -2 } (3) != !true; @";

    auto first = tokenize(source);
    auto second = tokenize(source);

    REQUIRE_THAT(second, Equals(first));
}

TEST_CASE("a nul byte ends the input", "[scanner]") {
    auto source = std::string{"a\0b", 3};
    auto tokens = tokenize(source);

    std::vector<Token> expected{
        { TokenType::Id, "a", {0, 1}},
        {TokenType::Eof,  "", {1, 1}},
    };

    REQUIRE_THAT(tokens, Equals(expected));
}

TEST_CASE("keyword table", "[scanner]") {
    CHECK(lookup_identifier("fn") == TokenType::KwFn);
    CHECK(lookup_identifier("let") == TokenType::KwLet);
    CHECK(lookup_identifier("true") == TokenType::KwTrue);
    CHECK(lookup_identifier("false") == TokenType::KwFalse);
    CHECK(lookup_identifier("if") == TokenType::KwIf);
    CHECK(lookup_identifier("else") == TokenType::KwElse);
    CHECK(lookup_identifier("return") == TokenType::KwReturn);
    CHECK(lookup_identifier("foobar") == TokenType::Id);
    CHECK(lookup_identifier("RETURN") == TokenType::Id);
}

// NOLINTEND(modernize-use-designated-initializers)
// NOLINTEND(readability-function-cognitive-complexity)
