#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace scribe {

/**
 * @brief The structured-data notations that scribe can read and write
 */
enum class file_format {
    json,
    yaml,
    toml,
};

/**
 * @brief Get the human-readable name of a format, e.g. "JSON"
 */
std::string_view format_display_name(file_format) noexcept;

/**
 * @brief Get the file extension (without a leading dot) that scribe uses when it needs to name a
 * file of the given format.
 */
std::string_view canonical_extension(file_format) noexcept;

/**
 * @brief Match a format name as given on the command line. Matching is case-insensitive, and
 * accepts "json", "yaml", "yml", and "toml".
 */
std::optional<file_format> format_from_name(std::string_view name) noexcept;

/**
 * @brief Infer the format of a file from its extension. Matching is case-insensitive.
 */
std::optional<file_format> format_from_extension(const std::filesystem::path& p) noexcept;

/**
 * @brief Resolve a format name, or throw an e_unsupported_format error.
 */
file_format resolve_format_name(std::string_view name);

/**
 * @brief Determine the format of one side of a conversion.
 *
 * If `override_name` is given, it takes precedence over the extension of `p`. Throws an
 * e_unsupported_format error if neither names a known format.
 */
file_format resolve_format(const std::filesystem::path&   p,
                           const std::optional<std::string>& override_name);

/**
 * @brief Replace the extension of `p` with the canonical extension of the given format
 */
std::filesystem::path with_format_extension(std::filesystem::path p, file_format) noexcept;

}  // namespace scribe
