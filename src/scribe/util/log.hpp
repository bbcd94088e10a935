#pragma once

#include <fmt/core.h>

#include <string_view>

namespace scribe::log {

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

struct ev_log {
    log::level       level;
    std::string_view message;

    void print() const noexcept;
};

void log_print(level l, std::string_view s) noexcept;
void log_emit(ev_log) noexcept;

/**
 * @brief Set up the process-wide logger. All log output goes to stderr.
 */
void init_logger() noexcept;

template <typename T>
concept formattable = requires(const T item) {
    fmt::format("{}", item);
};

template <formattable... Args>
void log(level l, std::string_view s, const Args&... args) noexcept {
    if (int(l) >= int(current_log_level)) {
        auto message = fmt::format(fmt::runtime(s), args...);
        log_emit(ev_log{l, message});
    }
}

#define scribe_log(Level, str, ...)                                                                \
    do {                                                                                           \
        if (int(scribe::log::level::Level) >= int(scribe::log::current_log_level)) {               \
            ::scribe::log::log(::scribe::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);       \
        }                                                                                          \
    } while (0)

}  // namespace scribe::log
