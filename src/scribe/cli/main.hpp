#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace scribe::cli {

/**
 * Parse the command line in `argv` (not including the program name) and run the conversion
 * it asks for. Help and usage errors are written to stdout and stderr respectively.
 *
 * Returns the process exit code: 0 on success or `--help`, 1 when the conversion fails, 2 for
 * a malformed command line, and 42 for an unexpected internal error.
 */
int main_fn(std::string_view program_name, const std::vector<std::string>& argv);

}  // namespace scribe::cli
