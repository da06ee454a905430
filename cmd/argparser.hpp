#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>

#include "error_reporter.hpp"
#include "macros.hpp"

namespace bacon::cli {

struct DumpStep {
    enum Step : uint8_t {
        None = 0,
        Tokens = 1 << 0,
        Ast = 1 << 1,
    };

#define define_with(_type, _name, _enum_case)                   \
    [[nodiscard]] constexpr auto with_##_name() const->_type { \
        return {static_cast<Step>(value | _enum_case)};        \
    }

#define define_has(_name, _enum_case)                        \
    [[nodiscard]] constexpr auto has_##_name() const->bool { \
        return (value & _enum_case) != 0;                    \
    }

#define define_parts(_type, _name, _enum_case) \
    define_with(_type, _name, _enum_case) define_has(_name, _enum_case)

    define_parts(DumpStep, tokens, Tokens);
    define_parts(DumpStep, ast, Ast);

    [[nodiscard]] constexpr auto has(Step step) const -> bool {
        return (value & step) != 0;
    }

    [[nodiscard]] constexpr auto has_any() const -> bool {
        return value != None;
    }

    Step value{None};
};

struct VerboseStep {
    enum Step : uint8_t {
        None = 0,
        Exe = 1 << 0,
        Parser = 1 << 1,
    };

    define_parts(VerboseStep, exe, Exe);
    define_parts(VerboseStep, parser, Parser);

#undef define_with
#undef define_has
#undef define_parts

    [[nodiscard]] constexpr auto has(Step step) const -> bool {
        return (value & step) != 0;
    }

    Step value{None};
};

struct Args {
    // path to the program, empty for the REPL
    std::string program;

    // source given with `--eval`
    std::string eval;
    bool        has_eval = false;

    DumpStep    dump{};
    VerboseStep verbose{};

    ErrorReporterFormat error_format = ErrorReporterFormat::Pretty;
};

[[nodiscard]] auto argparse(int argc, char** argv) -> Args;

// ============================================================================

auto format_as(DumpStep::Step step) -> std::string_view;
auto format_as(VerboseStep::Step step) -> std::string_view;

}  // namespace bacon::cli

// ============================================================================

bacon_define_formatter(bacon::cli::DumpStep);
bacon_define_formatter(bacon::cli::VerboseStep);
bacon_define_formatter(bacon::cli::Args);
