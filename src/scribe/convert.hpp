#pragma once

#include <scribe/format.hpp>
#include <scribe/value.hpp>

#include <iosfwd>
#include <span>
#include <string>
#include <string_view>

namespace scribe {

/**
 * @brief The parser and emitter that translate one file format to and from values
 */
struct format_adapter {
    file_format format;
    value (*parse)(std::string_view);
    std::string (*emit)(const value&);
};

/**
 * @brief Get the table of all format adapters
 */
std::span<const format_adapter> format_adapters() noexcept;

/**
 * @brief Find the adapter for the given format. Throws e_unsupported_format if there is none.
 */
const format_adapter& find_adapter(file_format);

/**
 * @brief Convert a document from one format to another, returning the emitted text.
 *
 * Errors are tagged with the conversion_stage and the e_format that was being processed.
 */
std::string convert(std::string_view input, file_format input_format, file_format output_format);

/**
 * @brief Convert a document and write the result to `sink`.
 *
 * Nothing is written to the sink unless emission succeeds.
 */
void convert(std::string_view input,
             file_format      input_format,
             std::ostream&    sink,
             file_format      output_format);

}  // namespace scribe
