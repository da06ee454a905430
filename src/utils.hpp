#pragma once

#include <cstdio>
#include <cstdlib>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace bacon {

// Walks `argv` one argument at a time.
struct ArgIterator {
    int    argc;
    char** argv;

    constexpr auto next(std::string_view& arg) -> bool {
        if (argc == 0) return false;

        argc--;
        arg = std::string_view{*argv++};
        return true;
    }
};

// Combine lambdas into a single visitor for `std::visit`.
template <typename... Ts>
struct Overload : Ts... {
    using Ts::operator()...;
};

template <typename... Ts>
Overload(Ts...) -> Overload<Ts...>;

auto read_entire_file(std::string const& path) -> std::optional<std::string>;

// Serialize `j`, replacing bytes that are not valid UTF-8 (source text can
// contain anything) with U+FFFD instead of throwing.
[[nodiscard]] auto dump_json(nlohmann::json const& j, int indent = -1)
    -> std::string;

// Read a single line from `f`, without the line break. Returns `nullopt` at
// end of file.
auto read_line(FILE* f) -> std::optional<std::string>;

// An in-memory `FILE*`, everything written to `f` can be read back with
// `flush_str()`.
struct MemStream {
    MemStream() : f{open_memstream(&buf, &bufsize)} {}
    ~MemStream() {
        fclose(f);
        f = nullptr;

        free(buf);
        buf = nullptr;
        bufsize = 0;
    }

    MemStream(MemStream const&) = delete;
    MemStream(MemStream&&) = delete;
    auto operator=(MemStream const&) -> MemStream& = delete;
    auto operator=(MemStream&&) -> MemStream& = delete;

    void flush() const { fflush(f); }

    [[nodiscard]] auto flush_str() const -> std::string_view {
        flush();
        return str();
    }

    [[nodiscard]] constexpr auto str() const -> std::string_view {
        return {buf, bufsize};
    }

    FILE* f{};

    char*  buf{};
    size_t bufsize{};
};

}  // namespace bacon
