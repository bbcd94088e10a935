#pragma once

#include <functional>

namespace scribe {

/**
 * @brief Invoke `fn`, and turn any error that escapes it into log messages and an exit code.
 *
 * Errors in the user's input exit with 1, command-line mistakes exit with 2, and anything
 * unexpected is reported in full and exits with 42.
 */
int handle_cli_errors(std::function<int()> fn) noexcept;

}  // namespace scribe
