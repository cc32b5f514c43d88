#pragma once

#include <cstdint>
#include <cstdio>
#include <utility>

#include <fmt/format.h>

namespace kopt {
    /// Prints a diagnostic line to stderr when the configured verbosity reaches `level`.
    template<typename... Args>
    void Trace(const uint32_t verbosity, const uint32_t level, fmt::format_string<Args...> format, Args &&... args) {
        if (verbosity < level) {
            return;
        }
        fmt::print(stderr, "[kopt] ");
        fmt::print(stderr, format, std::forward<Args>(args)...);
        fmt::print(stderr, "\n");
    }
} // namespace kopt
