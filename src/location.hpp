#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string_view>

#include "macros.hpp"

namespace bacon {

// A half-open byte range `[begin, end)` into the source text.
struct Span {
    uint32_t begin;
    uint32_t end;

    [[nodiscard]] constexpr auto size() const -> uint32_t {
        return end - begin;
    }

    [[nodiscard]] constexpr auto empty() const -> bool { return begin == end; }

    [[nodiscard]] constexpr auto str(std::string_view source) const
        -> std::string_view {
        return source.substr(begin, size());
    }

    constexpr auto operator==(Span const &o) const -> bool = default;
};

// Row and column of a byte offset, both one based.
struct RowCol {
    uint32_t row;
    uint32_t col;

    constexpr auto operator==(RowCol const &o) const -> bool = default;
};

[[nodiscard]] auto find_rowcol(std::string_view source, uint32_t offset)
    -> RowCol;

// Get the span of the line containing `offset`, without the line break.
[[nodiscard]] auto find_line(std::string_view source, uint32_t offset)
    -> Span;

void to_json(nlohmann::json &j, Span const &span);

}  // namespace bacon

bacon_define_formatter(bacon::Span);
