#include "utils.hpp"

#include <fmt/format.h>

#include <array>
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>

using namespace bacon;

// NOLINTBEGIN(readability-function-cognitive-complexity)

TEST_CASE("argument iterator", "[utils]") {
    std::array<char const*, 3> argv{"bacon", "--dump", "ast"};

    auto it = ArgIterator{.argc = static_cast<int>(argv.size()),
                          .argv = const_cast<char**>(argv.data())};

    std::string_view arg;
    REQUIRE(it.next(arg));
    REQUIRE(arg == "bacon");
    REQUIRE(it.next(arg));
    REQUIRE(arg == "--dump");
    REQUIRE(it.next(arg));
    REQUIRE(arg == "ast");
    REQUIRE_FALSE(it.next(arg));
    REQUIRE(arg == "ast");
}

TEST_CASE("memory stream", "[utils]") {
    auto ms = MemStream{};
    REQUIRE(ms.flush_str().empty());

    fmt::print(ms.f, "hello {}", 42);
    REQUIRE(ms.flush_str() == "hello 42");

    fmt::print(ms.f, "!\n");
    REQUIRE(ms.flush_str() == "hello 42!\n");
}

TEST_CASE("json dumps never throw on invalid utf-8", "[utils]") {
    auto j = nlohmann::json{{"text", "a\xff"}};

    REQUIRE(dump_json(j) == "{\"text\":\"a\xef\xbf\xbd\"}");
    REQUIRE(dump_json(j, 2) == "{\n  \"text\": \"a\xef\xbf\xbd\"\n}");
}

TEST_CASE("read lines", "[utils]") {
    std::string input = "let x = 1;\n\nx + 2";

    std::unique_ptr<FILE, void (*)(FILE*)> f = {
        fmemopen(input.data(), input.size(), "r"), [](auto f) { fclose(f); }};
    REQUIRE(f != nullptr);

    REQUIRE(read_line(f.get()) == "let x = 1;");
    REQUIRE(read_line(f.get()) == "");
    REQUIRE(read_line(f.get()) == "x + 2");
    REQUIRE(read_line(f.get()) == std::nullopt);
}

TEST_CASE("read a whole file", "[utils]") {
    SECTION("missing file") {
        REQUIRE(read_entire_file("/this/path/does/not/exist.bacon") ==
                std::nullopt);
    }

    SECTION("existing file") {
        std::string path = "/tmp/bacon-test-XXXXXX";

        auto fd = mkstemp(path.data());
        REQUIRE(fd >= 0);

        std::string contents = "let answer = 42;\nanswer\n";
        REQUIRE(write(fd, contents.data(), contents.size()) ==
                static_cast<ssize_t>(contents.size()));
        close(fd);

        auto read = read_entire_file(path);
        unlink(path.data());

        REQUIRE(read == contents);
    }
}

// NOLINTEND(readability-function-cognitive-complexity)
