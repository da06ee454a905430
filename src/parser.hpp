#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ast.hpp"
#include "error_reporter.hpp"
#include "macros.hpp"
#include "scanner.hpp"
#include "token.hpp"

namespace bacon {

// Binding strength of operators, from loosest to tightest.
enum class Precedence : uint8_t {
    Lowest,
    Equals,       // == !=
    LessGreater,  // < >
    Sum,          // + -
    Product,      // * /
    Prefix,       // !x -x
    Call,         // f(x)
};

// Precedence of `tt` when used as an infix operator, `Lowest` for anything
// that is not one.
[[nodiscard]] constexpr auto precedence_of(TokenType tt) -> Precedence {
    switch (tt) {
        case TokenType::EqualEqual:
        case TokenType::BangEqual: return Precedence::Equals;
        case TokenType::Less:
        case TokenType::Greater: return Precedence::LessGreater;
        case TokenType::Plus:
        case TokenType::Minus: return Precedence::Sum;
        case TokenType::Star:
        case TokenType::Slash: return Precedence::Product;
        case TokenType::Lparen: return Precedence::Call;
        default: return Precedence::Lowest;
    }
}

struct ParseOptions {
    // emit a debug diagnostic for each parsing step
    bool verbose{};
};

// Pratt parser over the tokens of a `Scanner`.
//
// Errors never stop the parse: they are reported to `er`, the statement that
// failed is dropped and parsing resumes after it. Check `er.had_error()` (or
// `errors()`) after `parse_program()`.
class Parser {
    using PrefixParseFn = ast::ExpressionPtr (Parser::*)();
    using InfixParseFn = ast::ExpressionPtr (Parser::*)(ast::ExpressionPtr);

public:
    Parser(Scanner& scanner, ErrorReporter& er, ParseOptions const& opt = {});

    [[nodiscard]] auto parse_program() -> ast::Program;

    // Messages of all errors reported so far, in order.
    [[nodiscard]] auto errors() const -> std::vector<std::string> {
        return er.errors();
    }

private:
    void register_prefix(TokenType tt, PrefixParseFn fn) {
        prefix_fns[token_type_index(tt)] = fn;
    }

    void register_infix(TokenType tt, InfixParseFn fn) {
        infix_fns[token_type_index(tt)] = fn;
    }

    // ------------------------------------------------------------------------

    [[nodiscard]] auto parse_statement() -> std::optional<ast::Statement>;
    [[nodiscard]] auto parse_let_statement() -> std::optional<ast::Statement>;
    [[nodiscard]] auto parse_return_statement()
        -> std::optional<ast::Statement>;
    [[nodiscard]] auto parse_expression_statement()
        -> std::optional<ast::Statement>;
    [[nodiscard]] auto parse_block_statement()
        -> std::optional<ast::BlockStatement>;

    [[nodiscard]] auto parse_expression(Precedence precedence)
        -> ast::ExpressionPtr;

    [[nodiscard]] auto parse_identifier() -> ast::ExpressionPtr;
    [[nodiscard]] auto parse_integer_literal() -> ast::ExpressionPtr;
    [[nodiscard]] auto parse_boolean_literal() -> ast::ExpressionPtr;
    [[nodiscard]] auto parse_prefix_expression() -> ast::ExpressionPtr;
    [[nodiscard]] auto parse_grouped_expression() -> ast::ExpressionPtr;
    [[nodiscard]] auto parse_if_expression() -> ast::ExpressionPtr;
    [[nodiscard]] auto parse_function_literal() -> ast::ExpressionPtr;

    [[nodiscard]] auto parse_function_parameters()
        -> std::optional<std::vector<ast::Identifier>>;

    [[nodiscard]] auto parse_infix_expression(ast::ExpressionPtr left)
        -> ast::ExpressionPtr;
    [[nodiscard]] auto parse_call_expression(ast::ExpressionPtr callee)
        -> ast::ExpressionPtr;

    [[nodiscard]] auto parse_call_arguments()
        -> std::optional<std::vector<ast::Expression>>;

    // ------------------------------------------------------------------------

    // Skip the rest of a statement that failed to parse.
    void recover();

    // Advance in case the next token has type `tt`, otherwise report an error
    // and stay where we are.
    [[nodiscard]] auto expect_peek(TokenType tt) -> bool;

    void advance() {
        cur = std::move(peek);
        peek = scanner.next_token();
    }

    [[nodiscard]] auto cur_precedence() const -> Precedence {
        return precedence_of(cur.type);
    }

    [[nodiscard]] auto peek_precedence() const -> Precedence {
        return precedence_of(peek.type);
    }

    // ------------------------------------------------------------------------

    Scanner&       scanner;
    ErrorReporter& er;
    ParseOptions   opt;

    Token cur;
    Token peek;

    std::array<PrefixParseFn, token_type_count> prefix_fns{};
    std::array<InfixParseFn, token_type_count>  infix_fns{};
};

// Scan and parse all of `source`.
[[nodiscard]] auto parse(std::string_view source, ErrorReporter& er,
                         ParseOptions const& opt = {}) -> ast::Program;

}  // namespace bacon

bacon_define_formatter(bacon::Precedence);
