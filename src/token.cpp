#include "token.hpp"

#include <array>
#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::json;

namespace bacon {

auto lookup_identifier(std::string_view literal) -> TokenType {
    static constexpr std::array keywords{
        std::pair<std::string_view, TokenType>{"fn", TokenType::KwFn},
        std::pair<std::string_view, TokenType>{"let", TokenType::KwLet},
        std::pair<std::string_view, TokenType>{"true", TokenType::KwTrue},
        std::pair<std::string_view, TokenType>{"false", TokenType::KwFalse},
        std::pair<std::string_view, TokenType>{"if", TokenType::KwIf},
        std::pair<std::string_view, TokenType>{"else", TokenType::KwElse},
        std::pair<std::string_view, TokenType>{"return", TokenType::KwReturn},
    };

    for (auto const& [kw, tt] : keywords) {
        if (kw == literal) return tt;
    }

    return TokenType::Id;
}

void to_json(json& j, TokenType const& tt) { j = fmt::format("{}", tt); }

void to_json(json& j, Token const& t) {
    j = json{
        {"type", t.type},
        {"text", t.text},
        {"span", t.span},
    };
}

}  // namespace bacon

auto fmt::formatter<bacon::TokenType>::format(bacon::TokenType const& p,
                                              format_context&         ctx) const
    -> format_context::iterator {
    string_view name = "unknown";
    switch (p) {
        case bacon::TokenType::Illegal: name = "Illegal"; break;
        case bacon::TokenType::Id: name = "Id"; break;
        case bacon::TokenType::Int: name = "Int"; break;
        case bacon::TokenType::Equal: name = "Equal"; break;
        case bacon::TokenType::EqualEqual: name = "EqualEqual"; break;
        case bacon::TokenType::Bang: name = "Bang"; break;
        case bacon::TokenType::BangEqual: name = "BangEqual"; break;
        case bacon::TokenType::Plus: name = "Plus"; break;
        case bacon::TokenType::Minus: name = "Minus"; break;
        case bacon::TokenType::Star: name = "Star"; break;
        case bacon::TokenType::Slash: name = "Slash"; break;
        case bacon::TokenType::Less: name = "Less"; break;
        case bacon::TokenType::Greater: name = "Greater"; break;
        case bacon::TokenType::Comma: name = "Comma"; break;
        case bacon::TokenType::Semi: name = "Semi"; break;
        case bacon::TokenType::Lparen: name = "Lparen"; break;
        case bacon::TokenType::Rparen: name = "Rparen"; break;
        case bacon::TokenType::Lbrace: name = "Lbrace"; break;
        case bacon::TokenType::Rbrace: name = "Rbrace"; break;
        case bacon::TokenType::KwFn: name = "KwFn"; break;
        case bacon::TokenType::KwLet: name = "KwLet"; break;
        case bacon::TokenType::KwTrue: name = "KwTrue"; break;
        case bacon::TokenType::KwFalse: name = "KwFalse"; break;
        case bacon::TokenType::KwIf: name = "KwIf"; break;
        case bacon::TokenType::KwElse: name = "KwElse"; break;
        case bacon::TokenType::KwReturn: name = "KwReturn"; break;
        case bacon::TokenType::Eof: name = "EOF"; break;
    }
    return formatter<string_view>::format(name, ctx);
}

auto fmt::formatter<bacon::Token>::format(bacon::Token const& p,
                                          format_context&     ctx) const
    -> format_context::iterator {
    return fmt::format_to(ctx.out(), "{{{}, \"{}\", {}}}", p.type, p.text,
                          p.span);
}
