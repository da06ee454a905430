#include "error_reporter.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <libassert/assert.hpp>
#include <nlohmann/json.hpp>
#include <string_view>

#include "utils.hpp"

namespace bacon {

void ErrorReporter::vreport_error(Span s, fmt::string_view fmt,
                                  fmt::format_args args) {
    error_count++;
    add(Severity::Error, s, fmt, args);
}

void ErrorReporter::vreport_warn(Span s, fmt::string_view fmt,
                                 fmt::format_args args) {
    add(Severity::Warn, s, fmt, args);
}

void ErrorReporter::vreport_note(Span s, fmt::string_view fmt,
                                 fmt::format_args args) {
    add(Severity::Note, s, fmt, args);
}

void ErrorReporter::vreport_debug(Span s, fmt::string_view fmt,
                                  fmt::format_args args) {
    add(Severity::Debug, s, fmt, args);
}

void ErrorReporter::vreport_bug(Span s, fmt::string_view fmt,
                                fmt::format_args args) {
    error_count++;
    add(Severity::Bug, s, fmt, args);
}

auto ErrorReporter::style_of(Severity severity) -> fmt::text_style {
    switch (severity) {
        case Severity::Error: return error_style;
        case Severity::Warn: return warn_style;
        case Severity::Note: return note_style;
        case Severity::Debug: return debug_style;
        case Severity::Bug: return bug_style;
    }

    UNREACHABLE("invalid severity", static_cast<int>(severity));
}

auto ErrorReporter::errors() const -> std::vector<std::string> {
    std::vector<std::string> messages;
    for (auto const& d : diagnostics) {
        if (d.is_error()) messages.push_back(d.message);
    }

    return messages;
}

void ErrorReporter::add(Severity severity, Span s, fmt::string_view fmt,
                        fmt::format_args args) {
    ASSERT(s.begin <= s.end);

    auto const& d = diagnostics.emplace_back(Diagnostic{
        .severity = severity,
        .span = s,
        .message = fmt::vformat(fmt, args),
    });

    if (out == nullptr) return;

    switch (format) {
        case ErrorReporterFormat::Pretty: print_pretty(d); break;
        case ErrorReporterFormat::Json: print_json(d); break;
    }
}

void ErrorReporter::print_pretty(Diagnostic const& d, uint32_t context) const {
    auto color = style_of(d.severity);
    auto [row, col] = find_rowcol(source, d.span.begin);
    auto is_tty = isatty(fileno(out)) != 0;

    fmt::print(out, "{}:{}:{}: ", path, row, col);
    if (is_tty) {
        fmt::print(out, color, "{}", d.severity);
        fmt::print(out, ": {}\n", d.message);
    } else {
        fmt::print(out, "{}: {}\n", d.severity, d.message);
    }

    auto [ls, le] = find_line(source, d.span.begin);

    // print `context` lines from before the line with the error
    std::vector<Span> before;
    for (auto ils = ls; before.size() < context && ils > 0;) {
        auto prev = find_line(source, ils - 1);
        before.push_back(prev);
        ils = prev.begin;
    }

    for (auto i = before.size(); i > 0; i--) {
        auto line = before[i - 1];
        fmt::print(out, "  {:04} | {}\n", row - i, line.str(source));
    }

    auto line = Span{.begin = ls, .end = le}.str(source);
    if (is_tty) {
        fmt::print(out, color, ">");
        fmt::print(out, " {:04} | {}\n", row, line);
    } else {
        fmt::print(out, "> {:04} | {}\n", row, line);
    }

    // the marker is at least one character wide, even for empty spans (like
    // the end of the input)
    auto pad = 2 + 4 + 3 + (d.span.begin - ls);
    auto end = std::max(std::min(d.span.end, le), d.span.begin);
    auto len = std::max<uint32_t>(end - d.span.begin, 1);
    auto marker = fmt::format("^{:~<{}}", "", len - 1);
    if (is_tty) {
        fmt::print(out, "{: <{}}", "", pad);
        fmt::print(out, color, "{}", marker);
        fmt::print(out, "\n");
    } else {
        fmt::print(out, "{: <{}}{}\n", "", pad, marker);
    }

    // print `context` lines from after the line with the error
    auto ile = le;
    for (uint32_t i = 0; i < context; i++) {
        while (ile < source.size() && source[ile] != '\n') ile++;
        if (ile + 1 >= source.size()) break;

        auto next = find_line(source, ile + 1);
        ile = next.end;

        fmt::print(out, "  {:04} | {}\n", row + i + 1, next.str(source));
    }
}

void ErrorReporter::print_json(Diagnostic const& d) const {
    auto [row, col] = find_rowcol(source, d.span.begin);

    nlohmann::json j = d;
    j["path"] = std::string{path};
    j["row"] = row;
    j["col"] = col;

    fmt::print(out, "{}\n", dump_json(j));
}

// ============================================================================

void to_json(nlohmann::json& j, Severity const& s) { j = fmt::format("{}", s); }

void to_json(nlohmann::json& j, Diagnostic const& d) {
    j = nlohmann::json{
        {"severity", d.severity},
        { "message",  d.message},
        {    "span",     d.span},
    };
}

}  // namespace bacon

auto fmt::formatter<bacon::Severity>::format(bacon::Severity const& p,
                                             format_context&        ctx) const
    -> format_context::iterator {
    string_view name = "unknown";
    switch (p) {
        case bacon::Severity::Error: name = "error"; break;
        case bacon::Severity::Warn: name = "warn"; break;
        case bacon::Severity::Note: name = "note"; break;
        case bacon::Severity::Debug: name = "debug"; break;
        case bacon::Severity::Bug: name = "bug"; break;
    }
    return formatter<string_view>::format(name, ctx);
}
