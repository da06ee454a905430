#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "macros.hpp"
#include "token.hpp"

namespace bacon::ast {

// The AST is a tree of two closed sets of nodes: statements and expressions.
// Each set is a `std::variant` of plain node structs, every node keeps the
// token it started from. Nodes own their children, there is no sharing.

struct Expression;
struct Statement;

using ExpressionPtr = std::unique_ptr<Expression>;

// ----------------------------------------------------------------------------
// Expressions

struct Identifier {
    Token       token;
    std::string value;
};

struct IntegerLiteral {
    Token   token;
    int64_t value;
};

struct BooleanLiteral {
    Token token;
    bool  value;
};

// `<op><right>`, where op is one of `!` or `-`.
struct PrefixExpression {
    Token         token;
    std::string   op;
    ExpressionPtr right;
};

// `<left> <op> <right>`
struct InfixExpression {
    Token         token;
    ExpressionPtr left;
    std::string   op;
    ExpressionPtr right;
};

// `{ <statements> }`. This is a statement, but `if` and `fn` need it complete
// here.
struct BlockStatement {
    Token                  token;
    std::vector<Statement> statements;
};

struct IfExpression {
    Token                         token;
    ExpressionPtr                 condition;
    BlockStatement                consequence;
    std::optional<BlockStatement> alternative;
};

struct FunctionLiteral {
    Token                   token;
    std::vector<Identifier> parameters;
    BlockStatement          body;
};

// `<callee>(<arguments>)`, the token is the `(`.
struct CallExpression {
    Token                   token;
    ExpressionPtr           callee;
    std::vector<Expression> arguments;
};

struct Expression {
    using Node =
        std::variant<Identifier, IntegerLiteral, BooleanLiteral,
                     PrefixExpression, InfixExpression, IfExpression,
                     FunctionLiteral, CallExpression>;

    Node node;

    [[nodiscard]] auto token() const -> Token const&;
    [[nodiscard]] auto token_literal() const -> std::string_view {
        return token().text;
    }

    // Render as source text. Prefix and infix expressions are always wrapped
    // in parenthesis, so the result parses back into the same tree.
    [[nodiscard]] auto to_string() const -> std::string;

    template <typename T>
    [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(node);
    }

    // Get the node as `T`, or null in case it holds something else.
    template <typename T>
    [[nodiscard]] auto as() const -> T const* {
        return std::get_if<T>(&node);
    }
};

template <typename T>
[[nodiscard]] auto make_expression(T&& node) -> ExpressionPtr {
    return std::make_unique<Expression>(Expression{std::forward<T>(node)});
}

// ----------------------------------------------------------------------------
// Statements

// `let <name> = <value>;`
struct LetStatement {
    Token         token;
    Identifier    name;
    ExpressionPtr value;
};

// `return <value>;`
struct ReturnStatement {
    Token         token;
    ExpressionPtr value;
};

// An expression used as a statement, the token is the first token of the
// expression.
struct ExpressionStatement {
    Token         token;
    ExpressionPtr value;
};

struct Statement {
    using Node = std::variant<LetStatement, ReturnStatement,
                              ExpressionStatement, BlockStatement>;

    Node node;

    [[nodiscard]] auto token() const -> Token const&;
    [[nodiscard]] auto token_literal() const -> std::string_view {
        return token().text;
    }

    [[nodiscard]] auto to_string() const -> std::string;

    template <typename T>
    [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(node);
    }

    template <typename T>
    [[nodiscard]] auto as() const -> T const* {
        return std::get_if<T>(&node);
    }
};

// ----------------------------------------------------------------------------

// The root of the tree: all top-level statements in source order.
struct Program {
    std::vector<Statement> statements;

    // Literal of the first token, or empty for an empty program.
    [[nodiscard]] auto token_literal() const -> std::string_view;
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto empty() const -> bool { return statements.empty(); }
    [[nodiscard]] auto size() const -> std::size_t {
        return statements.size();
    }
};

[[nodiscard]] auto to_string(BlockStatement const& block) -> std::string;

void to_json(nlohmann::json& j, Expression const& e);
void to_json(nlohmann::json& j, Statement const& s);
void to_json(nlohmann::json& j, BlockStatement const& b);
void to_json(nlohmann::json& j, Program const& p);

}  // namespace bacon::ast

bacon_define_formatter(bacon::ast::Expression);
bacon_define_formatter(bacon::ast::Statement);
bacon_define_formatter(bacon::ast::Program);
