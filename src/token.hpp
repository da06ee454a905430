#pragma once

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <string_view>

#include "location.hpp"
#include "macros.hpp"

namespace bacon {

enum class TokenType : uint8_t {
    Illegal,

    Id,
    Int,

    Equal,
    EqualEqual,
    Bang,
    BangEqual,
    Plus,
    Minus,
    Star,
    Slash,
    Less,
    Greater,

    Comma,
    Semi,
    Lparen,
    Rparen,
    Lbrace,
    Rbrace,

    KwFn,
    KwLet,
    KwTrue,
    KwFalse,
    KwIf,
    KwElse,
    KwReturn,

    Eof,
};

// Number of `TokenType` values, for tables indexed by token type.
inline constexpr std::size_t token_type_count =
    static_cast<std::size_t>(TokenType::Eof) + 1;

[[nodiscard]] constexpr auto token_type_index(TokenType tt) -> std::size_t {
    return static_cast<std::size_t>(tt);
}

// Map the literal of an identifier-like run to its token type: either one of
// the keywords or `TokenType::Id`. Case-sensitive, whole-word only.
[[nodiscard]] auto lookup_identifier(std::string_view literal) -> TokenType;

struct Token {
    TokenType   type;
    std::string text;
    Span        span;

    [[nodiscard]] constexpr auto is(TokenType tt) const -> bool {
        return type == tt;
    }

    [[nodiscard]] constexpr auto is_eof() const -> bool {
        return type == TokenType::Eof;
    }

    [[nodiscard]] constexpr auto is_illegal() const -> bool {
        return type == TokenType::Illegal;
    }

    auto operator==(Token const& o) const -> bool = default;
};

void to_json(nlohmann::json& j, TokenType const& tt);
void to_json(nlohmann::json& j, Token const& t);

}  // namespace bacon

bacon_define_formatter(bacon::TokenType);
bacon_define_formatter(bacon::Token);
