#include "utils.hpp"

#include <cstdio>
#include <memory>
#include <nlohmann/json.hpp>

namespace bacon {

auto read_entire_file(std::string const& path) -> std::optional<std::string> {
    std::unique_ptr<FILE, void (*)(FILE*)> f = {fopen(path.c_str(), "rb"),
                                                [](auto f) { fclose(f); }};
    if (!f) return std::nullopt;

    if (fseek(f.get(), 0, SEEK_END) != 0) return std::nullopt;
    auto len = ftell(f.get());
    if (len < 0) return std::nullopt;

    if (fseek(f.get(), 0, SEEK_SET) != 0) return std::nullopt;

    std::string s;
    s.resize(len);
    if (static_cast<decltype(len)>(fread(
            s.data(), sizeof(std::string::value_type), len, f.get())) != len)
        return std::nullopt;

    return s;
}

auto dump_json(nlohmann::json const& j, int indent) -> std::string {
    return j.dump(indent, ' ', false,
                  nlohmann::json::error_handler_t::replace);
}

auto read_line(FILE* f) -> std::optional<std::string> {
    std::string line;

    int c{};
    while ((c = fgetc(f)) != EOF) {
        if (c == '\n') return line;
        line.push_back(static_cast<char>(c));
    }

    // last line without a line break
    if (!line.empty()) return line;
    return std::nullopt;
}

}  // namespace bacon
