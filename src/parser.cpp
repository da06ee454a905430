#include "parser.hpp"

#include <charconv>
#include <libassert/assert.hpp>
#include <system_error>

namespace bacon {

Parser::Parser(Scanner& scanner, ErrorReporter& er, ParseOptions const& opt)
    : scanner{scanner},
      er{er},
      opt{opt},
      cur{scanner.next_token()},
      peek{scanner.next_token()} {
    register_prefix(TokenType::Id, &Parser::parse_identifier);
    register_prefix(TokenType::Int, &Parser::parse_integer_literal);
    register_prefix(TokenType::KwTrue, &Parser::parse_boolean_literal);
    register_prefix(TokenType::KwFalse, &Parser::parse_boolean_literal);
    register_prefix(TokenType::Bang, &Parser::parse_prefix_expression);
    register_prefix(TokenType::Minus, &Parser::parse_prefix_expression);
    register_prefix(TokenType::Lparen, &Parser::parse_grouped_expression);
    register_prefix(TokenType::KwIf, &Parser::parse_if_expression);
    register_prefix(TokenType::KwFn, &Parser::parse_function_literal);

    register_infix(TokenType::Plus, &Parser::parse_infix_expression);
    register_infix(TokenType::Minus, &Parser::parse_infix_expression);
    register_infix(TokenType::Star, &Parser::parse_infix_expression);
    register_infix(TokenType::Slash, &Parser::parse_infix_expression);
    register_infix(TokenType::EqualEqual, &Parser::parse_infix_expression);
    register_infix(TokenType::BangEqual, &Parser::parse_infix_expression);
    register_infix(TokenType::Less, &Parser::parse_infix_expression);
    register_infix(TokenType::Greater, &Parser::parse_infix_expression);
    register_infix(TokenType::Lparen, &Parser::parse_call_expression);
}

auto Parser::parse_program() -> ast::Program {
    ast::Program program;

    while (!cur.is_eof()) {
        if (auto stmt = parse_statement())
            program.statements.push_back(std::move(*stmt));
        else
            recover();

        advance();
    }

    return program;
}

// ============================================================================

auto Parser::parse_statement() -> std::optional<ast::Statement> {
    if (opt.verbose) {
        er.report_debug(cur.span, "parse_statement() got {}", cur);
    }

    switch (cur.type) {
        case TokenType::KwLet: return parse_let_statement();
        case TokenType::KwReturn: return parse_return_statement();
        default: return parse_expression_statement();
    }
}

auto Parser::parse_let_statement() -> std::optional<ast::Statement> {
    auto token = cur;

    if (!expect_peek(TokenType::Id)) return std::nullopt;
    auto name = ast::Identifier{.token = cur, .value = cur.text};

    if (!expect_peek(TokenType::Equal)) return std::nullopt;
    advance();

    auto value = parse_expression(Precedence::Lowest);
    if (!value) return std::nullopt;

    if (peek.is(TokenType::Semi)) advance();

    return ast::Statement{ast::LetStatement{.token = std::move(token),
                                            .name = std::move(name),
                                            .value = std::move(value)}};
}

auto Parser::parse_return_statement() -> std::optional<ast::Statement> {
    auto token = cur;
    advance();

    auto value = parse_expression(Precedence::Lowest);
    if (!value) return std::nullopt;

    if (peek.is(TokenType::Semi)) advance();

    return ast::Statement{ast::ReturnStatement{.token = std::move(token),
                                               .value = std::move(value)}};
}

auto Parser::parse_expression_statement() -> std::optional<ast::Statement> {
    auto token = cur;

    auto value = parse_expression(Precedence::Lowest);
    if (!value) return std::nullopt;

    // the semicolon is optional, so that `5 + 5` works on the REPL
    if (peek.is(TokenType::Semi)) advance();

    return ast::Statement{ast::ExpressionStatement{
        .token = std::move(token), .value = std::move(value)}};
}

auto Parser::parse_block_statement() -> std::optional<ast::BlockStatement> {
    if (opt.verbose) {
        er.report_debug(cur.span, "parse_block_statement() got {}", cur);
    }

    ASSERT(cur.is(TokenType::Lbrace));
    auto token = cur;
    advance();

    std::vector<ast::Statement> statements;
    while (!cur.is(TokenType::Rbrace)) {
        if (cur.is_eof()) {
            er.report_error(cur.span, "expected {} to close block, got {}",
                            TokenType::Rbrace, cur.type);
            er.report_note(token.span, "block starts here");
            return std::nullopt;
        }

        if (auto stmt = parse_statement()) {
            statements.push_back(std::move(*stmt));
        } else {
            recover();

            // never step over the closing brace of this block
            if (cur.is(TokenType::Rbrace) || cur.is_eof()) continue;
        }

        advance();
    }

    return ast::BlockStatement{.token = std::move(token),
                               .statements = std::move(statements)};
}

// ============================================================================

auto Parser::parse_expression(Precedence precedence) -> ast::ExpressionPtr {
    if (opt.verbose) {
        er.report_debug(cur.span, "parse_expression({}) got {}", precedence,
                        cur);
    }

    auto prefix = prefix_fns[token_type_index(cur.type)];
    if (prefix == nullptr) {
        er.report_error(cur.span, "no prefix parse function for {} found",
                        cur.type);
        if (cur.is_illegal()) {
            er.report_note(cur.span, "'{}' does not start any token",
                           cur.text);
        }

        return nullptr;
    }

    auto left = (this->*prefix)();
    if (!left) return nullptr;

    while (!peek.is(TokenType::Semi) && precedence < peek_precedence()) {
        auto infix = infix_fns[token_type_index(peek.type)];
        if (infix == nullptr) return left;

        advance();

        left = (this->*infix)(std::move(left));
        if (!left) return nullptr;
    }

    return left;
}

auto Parser::parse_identifier() -> ast::ExpressionPtr {
    return ast::make_expression(
        ast::Identifier{.token = cur, .value = cur.text});
}

auto Parser::parse_integer_literal() -> ast::ExpressionPtr {
    auto const& text = cur.text;

    int64_t value{};
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        er.report_error(cur.span, "could not parse \"{}\" as integer", text);
        return nullptr;
    }

    return ast::make_expression(
        ast::IntegerLiteral{.token = cur, .value = value});
}

auto Parser::parse_boolean_literal() -> ast::ExpressionPtr {
    return ast::make_expression(ast::BooleanLiteral{
        .token = cur, .value = cur.is(TokenType::KwTrue)});
}

auto Parser::parse_prefix_expression() -> ast::ExpressionPtr {
    auto token = cur;
    auto op = cur.text;
    advance();

    auto right = parse_expression(Precedence::Prefix);
    if (!right) return nullptr;

    return ast::make_expression(
        ast::PrefixExpression{.token = std::move(token),
                              .op = std::move(op),
                              .right = std::move(right)});
}

auto Parser::parse_grouped_expression() -> ast::ExpressionPtr {
    advance();

    auto inner = parse_expression(Precedence::Lowest);
    if (!inner) return nullptr;

    if (!expect_peek(TokenType::Rparen)) return nullptr;

    return inner;
}

auto Parser::parse_if_expression() -> ast::ExpressionPtr {
    auto token = cur;

    if (!expect_peek(TokenType::Lparen)) return nullptr;
    advance();

    auto condition = parse_expression(Precedence::Lowest);
    if (!condition) return nullptr;

    if (!expect_peek(TokenType::Rparen)) return nullptr;
    if (!expect_peek(TokenType::Lbrace)) return nullptr;

    auto consequence = parse_block_statement();
    if (!consequence) return nullptr;

    std::optional<ast::BlockStatement> alternative;
    if (peek.is(TokenType::KwElse)) {
        advance();

        if (!expect_peek(TokenType::Lbrace)) return nullptr;

        alternative = parse_block_statement();
        if (!alternative) return nullptr;
    }

    return ast::make_expression(
        ast::IfExpression{.token = std::move(token),
                          .condition = std::move(condition),
                          .consequence = std::move(*consequence),
                          .alternative = std::move(alternative)});
}

auto Parser::parse_function_literal() -> ast::ExpressionPtr {
    auto token = cur;

    if (!expect_peek(TokenType::Lparen)) return nullptr;

    auto parameters = parse_function_parameters();
    if (!parameters) return nullptr;

    if (!expect_peek(TokenType::Lbrace)) return nullptr;

    auto body = parse_block_statement();
    if (!body) return nullptr;

    return ast::make_expression(
        ast::FunctionLiteral{.token = std::move(token),
                             .parameters = std::move(*parameters),
                             .body = std::move(*body)});
}

auto Parser::parse_function_parameters()
    -> std::optional<std::vector<ast::Identifier>> {
    std::vector<ast::Identifier> parameters;

    if (peek.is(TokenType::Rparen)) {
        advance();
        return parameters;
    }

    if (!expect_peek(TokenType::Id)) return std::nullopt;
    parameters.push_back(
        ast::Identifier{.token = cur, .value = cur.text});

    while (peek.is(TokenType::Comma)) {
        advance();

        if (!expect_peek(TokenType::Id)) return std::nullopt;
        parameters.push_back(
        ast::Identifier{.token = cur, .value = cur.text});
    }

    if (!expect_peek(TokenType::Rparen)) return std::nullopt;

    return parameters;
}

auto Parser::parse_infix_expression(ast::ExpressionPtr left)
    -> ast::ExpressionPtr {
    if (opt.verbose) {
        er.report_debug(cur.span, "parse_infix_expression() got {}", cur);
    }

    auto token = cur;
    auto op = cur.text;
    auto precedence = cur_precedence();
    advance();

    // using the same precedence for the right side makes operators left
    // associative
    auto right = parse_expression(precedence);
    if (!right) return nullptr;

    return ast::make_expression(
        ast::InfixExpression{.token = std::move(token),
                             .left = std::move(left),
                             .op = std::move(op),
                             .right = std::move(right)});
}

auto Parser::parse_call_expression(ast::ExpressionPtr callee)
    -> ast::ExpressionPtr {
    auto token = cur;

    auto arguments = parse_call_arguments();
    if (!arguments) return nullptr;

    return ast::make_expression(
        ast::CallExpression{.token = std::move(token),
                            .callee = std::move(callee),
                            .arguments = std::move(*arguments)});
}

auto Parser::parse_call_arguments()
    -> std::optional<std::vector<ast::Expression>> {
    std::vector<ast::Expression> arguments;

    if (peek.is(TokenType::Rparen)) {
        advance();
        return arguments;
    }

    advance();
    auto arg = parse_expression(Precedence::Lowest);
    if (!arg) return std::nullopt;
    arguments.push_back(std::move(*arg));

    while (peek.is(TokenType::Comma)) {
        advance();
        advance();

        arg = parse_expression(Precedence::Lowest);
        if (!arg) return std::nullopt;
        arguments.push_back(std::move(*arg));
    }

    if (!expect_peek(TokenType::Rparen)) return std::nullopt;

    return arguments;
}

// ============================================================================

void Parser::recover() {
    while (!cur.is(TokenType::Semi) && !cur.is(TokenType::Rbrace) &&
           !cur.is_eof() && !peek.is(TokenType::Rbrace)) {
        advance();
    }
}

auto Parser::expect_peek(TokenType tt) -> bool {
    if (peek.is(tt)) {
        advance();
        return true;
    }

    er.report_error(peek.span, "expected next token to be {}, got {} instead",
                    tt, peek.type);
    return false;
}

// ----------------------------------------------------------------------------

auto parse(std::string_view source, ErrorReporter& er, ParseOptions const& opt)
    -> ast::Program {
    auto scanner = Scanner{source};
    auto p = Parser{scanner, er, opt};
    return p.parse_program();
}

}  // namespace bacon

auto fmt::formatter<bacon::Precedence>::format(bacon::Precedence const& p,
                                               format_context& ctx) const
    -> format_context::iterator {
    string_view name = "unknown";
    switch (p) {
        case bacon::Precedence::Lowest: name = "Lowest"; break;
        case bacon::Precedence::Equals: name = "Equals"; break;
        case bacon::Precedence::LessGreater: name = "LessGreater"; break;
        case bacon::Precedence::Sum: name = "Sum"; break;
        case bacon::Precedence::Product: name = "Product"; break;
        case bacon::Precedence::Prefix: name = "Prefix"; break;
        case bacon::Precedence::Call: name = "Call"; break;
    }
    return formatter<string_view>::format(name, ctx);
}
