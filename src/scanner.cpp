#include "scanner.hpp"

#include <string>
#include <utility>

namespace bacon {

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
auto Scanner::next_token() -> Token {
    skip_whitespace();

    auto start = position;
    if (ch == 0) return mkt(TokenType::Eof, start);

    auto c = ch;
    read_char();

    switch (c) {
        case '=':
            if (match('=')) return mkt(TokenType::EqualEqual, start);
            return mkt(TokenType::Equal, start);
        case '!':
            if (match('=')) return mkt(TokenType::BangEqual, start);
            return mkt(TokenType::Bang, start);
        case '+': return mkt(TokenType::Plus, start);
        case '-': return mkt(TokenType::Minus, start);
        case '*': return mkt(TokenType::Star, start);
        case '/': return mkt(TokenType::Slash, start);
        case '<': return mkt(TokenType::Less, start);
        case '>': return mkt(TokenType::Greater, start);
        case ',': return mkt(TokenType::Comma, start);
        case ';': return mkt(TokenType::Semi, start);
        case '(': return mkt(TokenType::Lparen, start);
        case ')': return mkt(TokenType::Rparen, start);
        case '{': return mkt(TokenType::Lbrace, start);
        case '}': return mkt(TokenType::Rbrace, start);
        case 'a' ... 'z':
        case 'A' ... 'Z':
        case '_': return scan_identifier(start);
        case '0' ... '9': return scan_number(start);
        default: return mkt(TokenType::Illegal, start);
    }
}

auto Scanner::scan_identifier(uint32_t start) -> Token {
    while (is_letter(ch)) read_char();

    auto literal = source.substr(start, position - start);
    return mkt(lookup_identifier(literal), start);
}

auto Scanner::scan_number(uint32_t start) -> Token {
    while (is_digit(ch)) read_char();

    return mkt(TokenType::Int, start);
}

auto Scanner::mkt(TokenType tt, uint32_t start) const -> Token {
    auto span = Span{.begin = start, .end = position};
    return {.type = tt, .text = std::string{span.str(source)}, .span = span};
}

// ----------------------------------------------------------------------------

auto tokenize(std::string_view source) -> std::vector<Token> {
    std::vector<Token> tokens;

    auto scanner = Scanner{source};
    while (true) {
        auto t = scanner.next_token();
        auto is_eof = t.is_eof();

        tokens.push_back(std::move(t));
        if (is_eof) break;
    }

    return tokens;
}

}  // namespace bacon
