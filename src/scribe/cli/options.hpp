#pragma once

#include <scribe/util/log.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace debate {
class argument_parser;
}  // namespace debate

namespace scribe {

namespace fs = std::filesystem;

namespace cli {

/**
 * @brief Options for `--if-exists` on the CLI
 */
enum class if_exists {
    replace,
    fail,
};

/**
 * @brief Complete aggregate of all scribe command-line options
 */
struct options {
    using path       = fs::path;
    using opt_path   = std::optional<fs::path>;
    using string     = std::string;
    using opt_string = std::optional<std::string>;

    // The document to convert
    path input;
    // Where to write the result. If omitted, derived from `input` and the output format
    opt_path output;

    // A `-F/--from` argument. Kept as a string: it's checked when formats are resolved
    opt_string input_format;
    // A `-f/--to` argument
    opt_string output_format;

    // What to do if the output file already exists
    cli::if_exists if_exists = cli::if_exists::replace;

    // The `--log-level` argument
    log::level log_level = log::level::info;

    /**
     * @brief Attach arguments and handlers to the given argument parser.
     */
    void setup_parser(debate::argument_parser& parser) noexcept;
};

}  // namespace cli
}  // namespace scribe
