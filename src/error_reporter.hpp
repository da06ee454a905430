#pragma once

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstdint>
#include <cstdio>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <string_view>
#include <vector>

#include "location.hpp"
#include "macros.hpp"

namespace bacon {

enum class Severity : uint8_t {
    Error,
    Warn,
    Note,
    Debug,
    Bug,
};

enum class ErrorReporterFormat : uint8_t {
    Pretty,
    Json,
};

struct Diagnostic {
    Severity    severity;
    Span        span;
    std::string message;

    [[nodiscard]] constexpr auto is_error() const -> bool {
        return severity == Severity::Error || severity == Severity::Bug;
    }
};

// Collects the diagnostics of a single source text. This is the context of a
// parse session: the parser reports everything that goes wrong here and keeps
// going.
//
// All diagnostics are stored in the order they were reported. In case `out`
// is not null, each one is also printed as soon as it is reported.
class ErrorReporter {
    static constexpr auto const error_style = fmt::fg(fmt::color::red);
    static constexpr auto const warn_style = fmt::fg(fmt::color::yellow);
    static constexpr auto const note_style = fmt::fg(fmt::color::cyan);
    static constexpr auto const debug_style =
        fmt::fg(fmt::color::medium_purple);
    static constexpr auto const bug_style = fmt::bg(fmt::color::crimson) |
                                            fmt::fg(fmt::color::white) |
                                            fmt::emphasis::bold;

public:
    ErrorReporter(std::string_view source, std::string_view path, FILE* out,
                  ErrorReporterFormat format = ErrorReporterFormat::Pretty)
        : source{source}, path{path}, out{out}, format{format} {}

    template <typename... T>
    void report_error(Span s, fmt::format_string<T...> fmt, T&&... args) {
        vreport_error(s, fmt, fmt::make_format_args(args...));
    }

    template <typename... T>
    void report_warn(Span s, fmt::format_string<T...> fmt, T&&... args) {
        vreport_warn(s, fmt, fmt::make_format_args(args...));
    }

    template <typename... T>
    void report_note(Span s, fmt::format_string<T...> fmt, T&&... args) {
        vreport_note(s, fmt, fmt::make_format_args(args...));
    }

    template <typename... T>
    void report_debug(Span s, fmt::format_string<T...> fmt, T&&... args) {
        vreport_debug(s, fmt, fmt::make_format_args(args...));
    }

    template <typename... T>
    void report_bug(Span s, fmt::format_string<T...> fmt, T&&... args) {
        vreport_bug(s, fmt, fmt::make_format_args(args...));
    }

    void vreport_error(Span s, fmt::string_view fmt, fmt::format_args args);
    void vreport_warn(Span s, fmt::string_view fmt, fmt::format_args args);
    void vreport_note(Span s, fmt::string_view fmt, fmt::format_args args);
    void vreport_debug(Span s, fmt::string_view fmt, fmt::format_args args);
    void vreport_bug(Span s, fmt::string_view fmt, fmt::format_args args);

    // -----------------------------------------------------------------------

    [[nodiscard]] constexpr auto had_error() const -> bool {
        return error_count > 0;
    }

    [[nodiscard]] constexpr auto get_error_count() const -> uint32_t {
        return error_count;
    }

    [[nodiscard]] constexpr auto get_diagnostics() const
        -> std::vector<Diagnostic> const& {
        return diagnostics;
    }

    // The messages of all errors (and bugs) reported so far, in order.
    [[nodiscard]] auto errors() const -> std::vector<std::string>;

    [[nodiscard]] constexpr auto get_source() const -> std::string_view {
        return source;
    }

    [[nodiscard]] constexpr auto get_path() const -> std::string_view {
        return path;
    }

private:
    [[nodiscard]] static auto style_of(Severity severity) -> fmt::text_style;

    void add(Severity severity, Span s, fmt::string_view fmt,
             fmt::format_args args);

    void print_pretty(Diagnostic const& d, uint32_t context = 1) const;
    void print_json(Diagnostic const& d) const;

    std::string_view source;
    std::string_view path;

    FILE*               out;
    ErrorReporterFormat format;

    std::vector<Diagnostic> diagnostics;
    uint32_t                error_count{};
};

void to_json(nlohmann::json& j, Severity const& s);
void to_json(nlohmann::json& j, Diagnostic const& d);

}  // namespace bacon

bacon_define_formatter(bacon::Severity);
