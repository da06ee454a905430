#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "token.hpp"

namespace bacon {

// Pull-based tokenizer. Each call to `next_token` produces exactly one token,
// once the end of the input is reached, every further call returns another
// `Eof` token. There is no way to rewind, create a new scanner to scan the
// same text again.
//
// The scanner never fails: bytes that do not start any token are returned as
// `Illegal` tokens holding that byte.
class Scanner {
public:
    explicit Scanner(std::string_view source) : source{source} { read_char(); }

    [[nodiscard]] auto next_token() -> Token;

    [[nodiscard]] constexpr auto get_source() const -> std::string_view {
        return source;
    }

private:
    constexpr void read_char() {
        if (read_position >= source.size())
            ch = 0;
        else
            ch = source[read_position];

        position = read_position;
        read_position++;
    }

    [[nodiscard]] constexpr auto match(uint8_t c) -> bool {
        if (ch != c) return false;

        read_char();
        return true;
    }

    constexpr void skip_whitespace() {
        while (is_whitespace(ch)) read_char();
    }

    [[nodiscard]] auto scan_identifier(uint32_t start) -> Token;
    [[nodiscard]] auto scan_number(uint32_t start) -> Token;

    [[nodiscard]] auto mkt(TokenType tt, uint32_t start) const -> Token;

    // ------------------------------------------------------------------------

    constexpr static auto is_letter(uint8_t c) -> bool {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    }

    constexpr static auto is_digit(uint8_t c) -> bool {
        return c >= '0' && c <= '9';
    }

    constexpr static auto is_whitespace(uint8_t c) -> bool {
        return c == '\n' || c == '\r' || c == '\t' || c == ' ';
    }

    // ------------------------------------------------------------------------

    std::string_view source;

    // index of `ch` in `source`
    uint32_t position{};

    // index of the character after `ch`
    uint32_t read_position{};

    // the character being looked at, `0` when at the end of the input
    uint8_t ch{};
};

// Scan all of `source`, the returned tokens always end with a single `Eof`.
[[nodiscard]] auto tokenize(std::string_view source) -> std::vector<Token>;

}  // namespace bacon
