#pragma once

#include <scribe/format.hpp>

#include <cstddef>
#include <filesystem>
#include <string>

namespace scribe {

/**
 * @brief The phase of a conversion in which an error occurred. Loaded into every in-flight
 * conversion error.
 */
enum class conversion_stage {
    parse,
    emit,
};

/**
 * @brief Which side of a conversion a format or path belongs to
 */
enum class document_role {
    input,
    output,
};

/**
 * @brief The format of the document being parsed or emitted when the error occurred
 */
struct e_format {
    file_format value;
};

/**
 * @brief A file extension or format name that does not name a supported format.
 *
 * `value` is the spelling as it was given. `did_you_mean` holds the closest known format name,
 * or is empty if nothing is close.
 */
struct e_unsupported_format {
    std::string value;
    std::string did_you_mean{};
};

/**
 * @brief The input did not conform to the grammar of its format. `value` is the message from the
 * underlying parser.
 */
struct e_parse_error {
    std::string value;
};

/**
 * @brief A 1-based line/column position within a parsed document
 */
struct e_source_position {
    std::size_t line;
    std::size_t column;
};

/**
 * @brief A 0-based byte offset within a parsed document
 */
struct e_byte_offset {
    std::size_t value;
};

/**
 * @brief The input uses a construct that has no representation in scribe's value model
 */
struct e_unsupported_feature {
    std::string value;
};

/**
 * @brief A value cannot be written in the target format.
 */
struct e_unrepresentable {
    /// The type name of the offending value (e.g. "sequence")
    std::string type_name;
    /// Why the value can't be emitted
    std::string reason;
};

/**
 * @brief The location of a value within the document tree, as a dotted key path
 */
struct e_value_path {
    std::string value;
};

/**
 * @brief The input and the output of a conversion are the same file
 */
struct e_same_input_output {
    std::filesystem::path value;
};

/**
 * @brief The input and output of a conversion resolved to the same format, so there is nothing to
 * convert
 */
struct e_same_format {
    file_format value;
};

/**
 * @brief The output file exists, and the user asked us not to replace it
 */
struct e_output_exists {
    std::filesystem::path value;
};

/**
 * @brief Neither an output path nor an output format was given, so there is nothing to convert to
 */
struct e_missing_output {};

}  // namespace scribe
