#pragma once

// Declare a `fmt::formatter` for `T` that reuses the string_view formatter
// options. The `format` member must be defined in a source file.
#define bacon_define_formatter(T)                          \
    template <>                                            \
    struct fmt::formatter<T> : formatter<string_view> {    \
        auto format(T const& p, format_context& ctx) const \
            -> format_context::iterator;                   \
    }
