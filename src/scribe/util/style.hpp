#pragma once

#include <fmt/color.h>

#include <string>
#include <string_view>

namespace scribe {

enum class should_style {
    detect,
    force,
    never,
};

/**
 * @brief Determine whether the error stream is a terminal that will render ANSI styles
 */
bool detect_should_style() noexcept;

/**
 * @brief Wrap `text` in the given style if styling is enabled, otherwise return it unchanged
 */
std::string stylize(std::string_view text, fmt::text_style, should_style = should_style::detect);

/// Shorthands for the styles used in diagnostics
inline std::string em_bad(std::string_view s, should_style sh = should_style::detect) {
    return stylize(s, fmt::emphasis::bold | fmt::fg(fmt::terminal_color::red), sh);
}

inline std::string em_subject(std::string_view s, should_style sh = should_style::detect) {
    return stylize(s, fmt::emphasis::bold | fmt::fg(fmt::terminal_color::yellow), sh);
}

inline std::string em_hint(std::string_view s, should_style sh = should_style::detect) {
    return stylize(s, fmt::fg(fmt::terminal_color::bright_green), sh);
}

}  // namespace scribe
