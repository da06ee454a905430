#include "location.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <nlohmann/json.hpp>

namespace bacon {

auto find_rowcol(std::string_view source, uint32_t offset) -> RowCol {
    uint32_t row = 1;
    uint32_t col = 1;

    auto count = std::min(offset, static_cast<uint32_t>(source.size()));
    for (uint32_t i = 0; i < count; i++) {
        if (source[i] == '\n') {
            row++;
            col = 1;
        } else {
            col++;
        }
    }

    return {.row = row, .col = col};
}

auto find_line(std::string_view source, uint32_t offset) -> Span {
    auto size = static_cast<uint32_t>(source.size());
    offset = std::min(offset, size);

    uint32_t line_start = offset;
    while (line_start > 0 && source[line_start - 1] != '\n') line_start--;

    uint32_t line_end = offset;
    while (line_end < size && source[line_end] != '\n') line_end++;

    // drop the '\r' of CRLF line endings
    if (line_end > line_start && source[line_end - 1] == '\r') line_end--;

    return {.begin = line_start, .end = line_end};
}

void to_json(nlohmann::json &j, Span const &span) {
    j = nlohmann::json::array({span.begin, span.end});
}

}  // namespace bacon

// ============================================================================

auto fmt::formatter<bacon::Span>::format(bacon::Span const &p,
                                         format_context    &ctx) const
    -> format_context::iterator {
    return fmt::format_to(ctx.out(), "{}-{}", p.begin, p.end);
}
