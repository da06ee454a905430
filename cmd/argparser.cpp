#include "argparser.hpp"

#include <fmt/ranges.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <ranges>
#include <string_view>
#include <vector>

#include "bacon.hpp"
#include "error_reporter.hpp"
#include "utils.hpp"

namespace rv = std::ranges::views;

namespace bacon::cli {
using fmt::print;

void print_usage(std::string_view self) {
    print(stderr, "usage: {} [options] [program]\n", self);
}

void print_version() { print(stderr, "bacon: {}\n", get_version()); }

void print_help(std::string_view self) {
    print_usage(self);

    // clang-format off
    print(stderr, "\n");
    print(stderr, "Without a program (and without --eval) an interactive prompt is started.\n");
    print(stderr, "\n");
    print(stderr, "options:\n");
    print(stderr, "    -h,--help: show this message and exit.\n");
    print(stderr, "    --usage: show usage and exit.\n");
    print(stderr, "    --version: print the version.\n");
    print(stderr, "    --verbose <steps>: show more output (on stderr) for each step. This option\n");
    print(stderr, "        accepts a list of steps separated by commas: step1,step2. The option can\n");
    print(stderr, "        also be passed multiple times: --verbose step1 --verbose step2\n");
    print(stderr, "        available steps:\n");
    print(stderr, "            exe: make the driver itself more verbose.\n");
    print(stderr, "            parser: trace each parsing step.\n");
    print(stderr, "    --dump <steps>: dump the result of a step as json. This option accepts a\n");
    print(stderr, "        list of steps separated by commas: step1,step2. The option can also be\n");
    print(stderr, "        passed multiple times: --dump step1 --dump step2\n");
    print(stderr, "        available steps:\n");
    print(stderr, "            tokens: dump the scanned tokens.\n");
    print(stderr, "            ast: dump the parsed program.\n");
    print(stderr, "    -e,--eval <source>: parse the given source instead of a file.\n");
    print(stderr, "    --error-format <format>: change how errors are formatted.\n");
    print(stderr, "        available formats:\n");
    print(stderr, "            pretty: show the error message and context information in a readable way (default).\n");
    print(stderr, "            json: all data in the report is given in a json format.\n");
    // clang-format on
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
auto argparse(int argc, char** argv) -> Args {
    auto it = ArgIterator{.argc = argc, .argv = argv};

    std::string_view self;
    if (!it.next(self)) self = "bacon";

    Args args;

    std::string_view arg;
    while (it.next(arg)) {
        if (arg == "-h" || arg == "--help") {
            print_help(self);
            std::exit(0);
        }

        if (arg == "--usage") {
            print_usage(self);
            std::exit(0);
        }

        if (arg == "--version") {
            print_version();
            std::exit(0);
        }

        if (arg == "--verbose") {
            if (!it.next(arg)) {
                print(stderr, "error: missing argument for --verbose.\n");
                std::exit(1);
            }

            for (auto it : rv::split(arg, ',')) {
                std::string_view part{it};

                if (part == "exe") {
                    args.verbose = args.verbose.with_exe();
                } else if (part == "parser") {
                    args.verbose = args.verbose.with_parser();
                } else {
                    print(stderr, "error: unknown verbose step: '{}'\n", part);
                }
            }
        }

        else if (arg == "--dump") {
            if (!it.next(arg)) {
                print(stderr, "error: missing argument for --dump.\n");
                std::exit(1);
            }

            for (auto it : rv::split(arg, ',')) {
                std::string_view part{it};

                if (part == "tokens") {
                    args.dump = args.dump.with_tokens();
                } else if (part == "ast") {
                    args.dump = args.dump.with_ast();
                } else {
                    print(stderr, "error: unknown dump step: '{}'\n", part);
                }
            }
        }

        else if (arg == "-e" || arg == "--eval") {
            if (args.has_eval) {
                print(stderr, "error: source already given with --eval\n");
                std::exit(1);
            }

            if (!it.next(arg)) {
                print(stderr, "error: missing argument for --eval.\n");
                std::exit(1);
            }

            args.eval = arg;
            args.has_eval = true;
        }

        else if (arg == "--error-format") {
            if (!it.next(arg)) {
                print(stderr, "error: missing argument for --error-format.\n");
                std::exit(1);
            }

            if (arg == "pretty") {
                args.error_format = ErrorReporterFormat::Pretty;
            } else if (arg == "json") {
                args.error_format = ErrorReporterFormat::Json;
            } else {
                print(stderr,
                      "error: invalid argument for --error-format: {}\n", arg);
                std::exit(1);
            }
        }

        else if (args.program.empty() && !arg.starts_with('-')) {
            args.program = arg;
        }

        else {
            print(stderr, "error: unknown option: '{}'\n", arg);
            std::exit(1);
        }
    }

    if (args.has_eval && !args.program.empty()) {
        print(stderr, "error: can not use both --eval and a program\n");
        std::exit(1);
    }

    return args;
}

auto format_as(DumpStep::Step step) -> std::string_view {
    std::string_view s;

    switch (step) {
        case DumpStep::None: s = "none"; break;
        case DumpStep::Tokens: s = "tokens"; break;
        case DumpStep::Ast: s = "ast"; break;
    }

    return s;
}

auto format_as(VerboseStep::Step step) -> std::string_view {
    std::string_view name;

    switch (step) {
        case VerboseStep::None: name = "none"; break;
        case VerboseStep::Exe: name = "exe"; break;
        case VerboseStep::Parser: name = "parser"; break;
    }

    return name;
}

}  // namespace bacon::cli

// ============================================================================

auto fmt::formatter<bacon::cli::DumpStep>::format(
    bacon::cli::DumpStep const& step, format_context& ctx) const
    -> format_context::iterator {
    std::array steps{bacon::cli::DumpStep::Tokens, bacon::cli::DumpStep::Ast};

    std::vector<std::string_view> names;
    for (auto s : steps) {
        if (step.has(s)) names.push_back(bacon::cli::format_as(s));
    }

    return fmt::format_to(ctx.out(), "{}", fmt::join(names, ","));
}

auto fmt::formatter<bacon::cli::VerboseStep>::format(
    bacon::cli::VerboseStep const& step, format_context& ctx) const
    -> format_context::iterator {
    std::array steps{bacon::cli::VerboseStep::Exe,
                     bacon::cli::VerboseStep::Parser};

    std::vector<std::string_view> names;
    for (auto s : steps) {
        if (step.has(s)) names.push_back(bacon::cli::format_as(s));
    }

    return fmt::format_to(ctx.out(), "{}", fmt::join(names, ","));
}

auto fmt::formatter<bacon::cli::Args>::format(bacon::cli::Args const& p,
                                              format_context& ctx) const
    -> format_context::iterator {
    return fmt::format_to(
        ctx.out(),
        "Args{{program=\"{}\", eval=\"{}\", dump={}, verbose={}}}",
        p.program, p.eval, p.dump, p.verbose);
}
