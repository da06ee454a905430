#pragma once

#include <string_view>

namespace bacon {

namespace detail {

static inline constexpr std::string_view VERSION = "0.1.0";

}  // namespace detail

constexpr auto get_version() -> std::string_view { return detail::VERSION; }

}  // namespace bacon
