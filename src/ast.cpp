#include "ast.hpp"

#include <fmt/ranges.h>

#include <libassert/assert.hpp>
#include <nlohmann/json.hpp>
#include <span>

#include "utils.hpp"

using json = nlohmann::json;

namespace bacon::ast {

namespace {

auto render(ExpressionPtr const& e) -> std::string {
    ASSERT(e != nullptr, "missing child expression");
    return e->to_string();
}

// Statements are separated by spaces. An expression statement that is
// followed by another one needs a `;`, otherwise `a (b)` would read back as a
// call.
auto render_statements(std::span<Statement const> stmts) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < stmts.size(); i++) {
        if (i > 0) out += ' ';
        out += stmts[i].to_string();

        if (i + 1 < stmts.size() && stmts[i].is<ExpressionStatement>())
            out += ';';
    }

    return out;
}

void child_to_json(json& j, ExpressionPtr const& e) {
    if (e == nullptr) {
        j = nullptr;
        return;
    }

    to_json(j, *e);
}

}  // namespace

auto to_string(BlockStatement const& block) -> std::string {
    if (block.statements.empty()) return "{ }";
    return fmt::format("{{ {} }}", render_statements(block.statements));
}

auto Expression::token() const -> Token const& {
    return std::visit([](auto const& n) -> Token const& { return n.token; },
                      node);
}

auto Expression::to_string() const -> std::string {
    return std::visit(
        Overload{
            [](Identifier const& n) { return n.value; },
            [](IntegerLiteral const& n) { return n.token.text; },
            [](BooleanLiteral const& n) { return n.token.text; },
            [](PrefixExpression const& n) {
                return fmt::format("({}{})", n.op, render(n.right));
            },
            [](InfixExpression const& n) {
                return fmt::format("({} {} {})", render(n.left), n.op,
                                   render(n.right));
            },
            [](IfExpression const& n) {
                auto s = fmt::format("if ({}) {}", render(n.condition),
                                     ast::to_string(n.consequence));
                if (n.alternative)
                    s += fmt::format(" else {}",
                                     ast::to_string(*n.alternative));
                return s;
            },
            [](FunctionLiteral const& n) {
                std::vector<std::string_view> params;
                for (auto const& p : n.parameters) params.push_back(p.value);

                return fmt::format("fn({}) {}", fmt::join(params, ", "),
                                   ast::to_string(n.body));
            },
            [](CallExpression const& n) {
                std::vector<std::string> args;
                for (auto const& a : n.arguments)
                    args.push_back(a.to_string());

                return fmt::format("{}({})", render(n.callee),
                                   fmt::join(args, ", "));
            },
        },
        node);
}

auto Statement::token() const -> Token const& {
    return std::visit([](auto const& n) -> Token const& { return n.token; },
                      node);
}

auto Statement::to_string() const -> std::string {
    return std::visit(
        Overload{
            [](LetStatement const& n) {
                return fmt::format("let {} = {};", n.name.value,
                                   render(n.value));
            },
            [](ReturnStatement const& n) {
                return fmt::format("return {};", render(n.value));
            },
            [](ExpressionStatement const& n) { return render(n.value); },
            [](BlockStatement const& n) { return ast::to_string(n); },
        },
        node);
}

auto Program::token_literal() const -> std::string_view {
    if (statements.empty()) return "";
    return statements.front().token_literal();
}

auto Program::to_string() const -> std::string {
    return render_statements(statements);
}

// ============================================================================

void to_json(json& j, BlockStatement const& b) {
    j = json{
        {"kind", "BlockStatement"},
        {"token", b.token},
    };

    auto& stmts = j["statements"] = json::array();
    for (auto const& s : b.statements) to_json(stmts.emplace_back(), s);
}

void to_json(json& j, Expression const& e) {
    std::visit(
        Overload{
            [&](Identifier const& n) {
                j = json{
                    {"kind", "Identifier"},
                    {"token", n.token},
                    {"value", n.value},
                };
            },
            [&](IntegerLiteral const& n) {
                j = json{
                    {"kind", "IntegerLiteral"},
                    {"token", n.token},
                    {"value", n.value},
                };
            },
            [&](BooleanLiteral const& n) {
                j = json{
                    {"kind", "BooleanLiteral"},
                    {"token", n.token},
                    {"value", n.value},
                };
            },
            [&](PrefixExpression const& n) {
                j = json{
                    {"kind", "PrefixExpression"},
                    {"token", n.token},
                    {"op", n.op},
                };
                child_to_json(j["right"], n.right);
            },
            [&](InfixExpression const& n) {
                j = json{
                    {"kind", "InfixExpression"},
                    {"token", n.token},
                    {"op", n.op},
                };
                child_to_json(j["left"], n.left);
                child_to_json(j["right"], n.right);
            },
            [&](IfExpression const& n) {
                j = json{
                    {"kind", "IfExpression"},
                    {"token", n.token},
                };
                child_to_json(j["condition"], n.condition);
                to_json(j["consequence"], n.consequence);
                if (n.alternative)
                    to_json(j["alternative"], *n.alternative);
                else
                    j["alternative"] = nullptr;
            },
            [&](FunctionLiteral const& n) {
                j = json{
                    {"kind", "FunctionLiteral"},
                    {"token", n.token},
                };

                auto& params = j["parameters"] = json::array();
                for (auto const& p : n.parameters) params.push_back(p.value);

                to_json(j["body"], n.body);
            },
            [&](CallExpression const& n) {
                j = json{
                    {"kind", "CallExpression"},
                    {"token", n.token},
                };
                child_to_json(j["callee"], n.callee);

                auto& args = j["arguments"] = json::array();
                for (auto const& a : n.arguments)
                    to_json(args.emplace_back(), a);
            },
        },
        e.node);
}

void to_json(json& j, Statement const& s) {
    std::visit(Overload{
                   [&](LetStatement const& n) {
                       j = json{
                           {"kind", "LetStatement"},
                           {"token", n.token},
                           {"name", n.name.value},
                       };
                       child_to_json(j["value"], n.value);
                   },
                   [&](ReturnStatement const& n) {
                       j = json{
                           {"kind", "ReturnStatement"},
                           {"token", n.token},
                       };
                       child_to_json(j["value"], n.value);
                   },
                   [&](ExpressionStatement const& n) {
                       j = json{
                           {"kind", "ExpressionStatement"},
                           {"token", n.token},
                       };
                       child_to_json(j["value"], n.value);
                   },
                   [&](BlockStatement const& n) { to_json(j, n); },
               },
               s.node);
}

void to_json(json& j, Program const& p) {
    j = json{{"kind", "Program"}};

    auto& stmts = j["statements"] = json::array();
    for (auto const& s : p.statements) to_json(stmts.emplace_back(), s);
}

}  // namespace bacon::ast

auto fmt::formatter<bacon::ast::Expression>::format(
    bacon::ast::Expression const& p, format_context& ctx) const
    -> format_context::iterator {
    return formatter<string_view>::format(p.to_string(), ctx);
}

auto fmt::formatter<bacon::ast::Statement>::format(
    bacon::ast::Statement const& p, format_context& ctx) const
    -> format_context::iterator {
    return formatter<string_view>::format(p.to_string(), ctx);
}

auto fmt::formatter<bacon::ast::Program>::format(bacon::ast::Program const& p,
                                                 format_context& ctx) const
    -> format_context::iterator {
    return formatter<string_view>::format(p.to_string(), ctx);
}
