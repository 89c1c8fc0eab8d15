#pragma once

#include <fmt/core.h>
#include <fmt/format.h>

#include <string_view>

namespace tagver::log {

enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

inline level current_log_level = level::info;

void log_print(level l, std::string_view s) noexcept;

void init_logger() noexcept;

template <typename T>
concept formattable = requires(const T item) {
    fmt::format("{}", item);
};

inline bool level_enabled(level l) noexcept { return int(l) >= int(current_log_level); }

template <formattable... Args>
void log(level l, std::string_view s, const Args&... args) noexcept {
    if (level_enabled(l)) {
        try {
            log_print(l, fmt::format(fmt::runtime(s), args...));
        } catch (const fmt::format_error& e) {
            log_print(level::critical, fmt::format("Bad log format string '{}': {}", s, e.what()));
        }
    }
}

template <formattable... Args>
void trace(std::string_view s, const Args&... args) {
    log(level::trace, s, args...);
}

#define tagver_log(Level, str, ...)                                                                \
    do {                                                                                           \
        if (int(::tagver::log::level::Level) >= int(::tagver::log::current_log_level)) {           \
            ::tagver::log::log(::tagver::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);       \
        }                                                                                          \
    } while (0)

}  // namespace tagver::log
