#include <fmt/format.h>

#include <pwd.h>
#include <unistd.h>

#include <cstdio>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "argparser.hpp"
#include "ast.hpp"
#include "error_reporter.hpp"
#include "parser.hpp"
#include "scanner.hpp"
#include "utils.hpp"

namespace {

auto get_user_name() -> std::string {
    if (auto const* pw = getpwuid(getuid()); pw != nullptr) return pw->pw_name;
    return "there";
}

// Scan and parse a complete program, printing whatever was asked for.
auto run_source(std::string_view path, std::string_view source,
                bacon::cli::Args const& args) -> int {
    if (args.verbose.has_exe()) {
        fmt::print(stderr, "program: {} ({}B)\n", path, source.size());
    }

    auto er = bacon::ErrorReporter{source, path, stderr, args.error_format};

    if (args.dump.has_tokens()) {
        nlohmann::json j = bacon::tokenize(source);
        fmt::print("{}\n", bacon::dump_json(j, 2));
    }

    auto program =
        bacon::parse(source, er, {.verbose = args.verbose.has_parser()});

    if (args.dump.has_ast()) {
        nlohmann::json j;
        bacon::ast::to_json(j, program);
        fmt::print("{}\n", bacon::dump_json(j, 2));
    }

    if (!args.dump.has_any()) fmt::print("{}\n", program);

    if (args.verbose.has_exe()) {
        fmt::print(stderr, "done! {} statement(s), {} error(s)\n",
                   program.size(), er.get_error_count());
    }

    return er.had_error() ? 1 : 0;
}

// Read-parse-print loop over stdin, each line is parsed on its own.
auto run_repl(bacon::cli::Args const& args) -> int {
    fmt::print("Hello {}! This is the Bacon programming language!\n",
               get_user_name());
    fmt::print("Feel free to type in commands\n");

    while (true) {
        fmt::print(">> ");
        std::fflush(stdout);

        auto line = bacon::read_line(stdin);
        if (!line) break;

        if (args.dump.has_tokens()) {
            auto scanner = bacon::Scanner{*line};
            for (auto tok = scanner.next_token(); !tok.is_eof();
                 tok = scanner.next_token()) {
                fmt::print("{}\n", tok);
            }
        }

        auto er =
            bacon::ErrorReporter{*line, "<repl>", stderr, args.error_format};
        auto scanner = bacon::Scanner{*line};
        auto parser = bacon::Parser{scanner, er,
                                    {.verbose = args.verbose.has_parser()}};

        auto program = parser.parse_program();
        if (er.had_error()) continue;

        if (args.dump.has_ast()) {
            nlohmann::json j;
            bacon::ast::to_json(j, program);
            fmt::print("{}\n", bacon::dump_json(j, 2));
        }

        fmt::print("{}\n", program);
    }

    fmt::print("\n");
    return 0;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    auto args = bacon::cli::argparse(argc, argv);
    if (args.verbose.has_exe()) fmt::print(stderr, "args: {}\n", args);

    if (args.has_eval) return run_source("<eval>", args.eval, args);
    if (args.program.empty()) return run_repl(args);

    auto source = bacon::read_entire_file(args.program);
    if (!source) {
        fmt::print(stderr, "error: could not read file: {}\n", args.program);
        return 1;
    }

    return run_source(args.program, *source, args);
}
