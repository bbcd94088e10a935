#include "./parse.hpp"

#include "./convert.hpp"

#include <scribe/error/errors.hpp>
#include <scribe/util/log.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/format.h>
#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/node/parse.h>

#include <optional>
#include <string>
#include <vector>

using namespace scribe;

namespace {

/// Determine whether the line ends with a block scalar header (`|`, `>-`, `|2+`, ...)
bool opens_block_scalar(std::string_view line) noexcept {
    auto comment = line.find(" #");
    if (comment != line.npos) {
        line = line.substr(0, comment);
    }
    auto last = line.find_last_not_of(" \t\r");
    if (last == line.npos) {
        return false;
    }
    line = line.substr(0, last + 1);
    // Up to two indicators: chomping and indentation
    for (int i = 0; i < 2 && !line.empty(); ++i) {
        auto c = line.back();
        if (c == '-' || c == '+' || (c >= '1' && c <= '9')) {
            line.remove_suffix(1);
        }
    }
    if (line.empty() || (line.back() != '|' && line.back() != '>')) {
        return false;
    }
    line.remove_suffix(1);
    return line.empty() || line.back() == ' ';
}

/// Whether a quote or flow indicator at `pos` opens a new node rather than sitting inside a plain
/// scalar (as in `don't` or `a[0]`)
bool starts_node(std::string_view line, std::size_t pos) noexcept {
    if (pos == 0) {
        return true;
    }
    auto prev = line[pos - 1];
    return prev == ' ' || prev == '\t' || prev == '[' || prev == '{' || prev == ',';
}

/**
 * Tracks the flow collections and quoted scalars that are still open at the end of each line.
 * Lines that continue one of those are not block-indented, so tabs may lead them.
 */
struct continuation_state {
    int  flow_depth = 0;
    char open_quote = 0;

    bool in_continuation() const noexcept { return flow_depth > 0 || open_quote != 0; }

    void scan(std::string_view line) noexcept {
        for (std::size_t pos = 0; pos < line.size(); ++pos) {
            auto c = line[pos];
            if (open_quote == '"') {
                if (c == '\\') {
                    ++pos;
                } else if (c == '"') {
                    open_quote = 0;
                }
            } else if (open_quote == '\'') {
                if (c == '\'' && pos + 1 < line.size() && line[pos + 1] == '\'') {
                    ++pos;
                } else if (c == '\'') {
                    open_quote = 0;
                }
            } else if (c == '#' && (pos == 0 || line[pos - 1] == ' ' || line[pos - 1] == '\t')) {
                return;
            } else if ((c == '"' || c == '\'') && starts_node(line, pos)) {
                open_quote = c;
            } else if ((c == '[' || c == '{') && starts_node(line, pos)) {
                ++flow_depth;
            } else if ((c == ']' || c == '}') && flow_depth > 0) {
                --flow_depth;
            }
        }
    }
};

/**
 * yaml-cpp tolerates tabs in block indentation, but YAML forbids them. Find them ourselves. Tabs
 * are allowed after the indentation of block scalar content, and as separation space in lines
 * that continue a flow collection or a quoted scalar.
 */
void check_tab_indentation(std::string_view content) {
    std::size_t                line_no = 0;
    std::optional<std::size_t> block_scalar_indent;
    continuation_state         state;
    while (!content.empty()) {
        ++line_no;
        auto nl   = content.find('\n');
        auto line = content.substr(0, nl);
        content   = nl == content.npos ? std::string_view{} : content.substr(nl + 1);

        auto first = line.find_first_not_of(" \t\r");
        if (first == line.npos) {
            continue;
        }
        auto spaces = line.find_first_not_of(' ');
        if (block_scalar_indent) {
            if (spaces > *block_scalar_indent) {
                continue;
            }
            block_scalar_indent.reset();
        }
        if (state.in_continuation()) {
            state.scan(line);
            continue;
        }
        if (line[first] == '#') {
            continue;
        }
        if (spaces < first) {
            BOOST_LEAF_THROW_EXCEPTION(
                e_parse_error{"Tab characters must not be used for indentation"},
                e_source_position{line_no, spaces + 1});
        }
        if (opens_block_scalar(line)) {
            block_scalar_indent = spaces;
        } else {
            state.scan(line);
        }
    }
}

[[noreturn]] void throw_yaml_error(const YAML::Exception& exc) {
    if (exc.mark.is_null()) {
        BOOST_LEAF_THROW_EXCEPTION(e_parse_error{exc.msg});
    }
    BOOST_LEAF_THROW_EXCEPTION(e_parse_error{exc.msg},
                               e_byte_offset{static_cast<std::size_t>(exc.mark.pos)},
                               e_source_position{static_cast<std::size_t>(exc.mark.line) + 1,
                                                 static_cast<std::size_t>(exc.mark.column) + 1});
}

}  // namespace

YAML::Node scribe::parse_yaml_node(std::string_view content) {
    check_tab_indentation(content);
    std::vector<YAML::Node> docs;
    try {
        docs = YAML::LoadAll(std::string(content));
    } catch (const YAML::Exception& exc) {
        throw_yaml_error(exc);
    }
    if (docs.empty()) {
        scribe_log(debug, "YAML stream holds no documents. Reading it as null.");
        return YAML::Node{};
    }
    if (docs.size() > 1) {
        auto mark = docs[1].Mark();
        BOOST_LEAF_THROW_EXCEPTION(
            e_unsupported_feature{
                fmt::format("Multi-document YAML streams are not supported (found {} documents)",
                            docs.size())},
            e_source_position{static_cast<std::size_t>(mark.line) + 1,
                              static_cast<std::size_t>(mark.column) + 1});
    }
    return docs.front();
}

value scribe::parse_yaml(std::string_view content) {
    auto node = parse_yaml_node(content);
    return yaml_as_value(node);
}
