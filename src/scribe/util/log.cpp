#include "./log.hpp"

#include <neo/assert.hpp>

#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>

void scribe::log::init_logger() noexcept {
    // Diagnostics must never be mixed into converted data, so everything goes to stderr
    auto logger = spdlog::stderr_color_mt("scribe");
    // Filtering happens in scribe_log(), against current_log_level
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%^%-5l%$] %v");
}

void scribe::log::log_print(level l, std::string_view msg) noexcept {
    const auto lvl = [&] {
        switch (l) {
        case level::trace:
            return spdlog::level::trace;
        case level::debug:
            return spdlog::level::debug;
        case level::info:
            return spdlog::level::info;
        case level::warn:
            return spdlog::level::warn;
        case level::error:
            return spdlog::level::err;
        case level::critical:
            return spdlog::level::critical;
        case level::silent:
            return spdlog::level::off;
        }
        neo_assert_always(invariant, false, "Invalid log level", msg, int(l));
    }();

    spdlog::default_logger_raw()->log(lvl, "{}", msg);
}

void scribe::log::ev_log::print() const noexcept { log_print(level, message); }

void scribe::log::log_emit(ev_log ev) noexcept { ev.print(); }
