#pragma once

namespace scribe::cli {

struct options;

/**
 * @brief Run the conversion described by the given options, reporting any errors.
 *
 * @return The process exit code
 */
int dispatch_main(const options&) noexcept;

}  // namespace scribe::cli
