#include "./parse.hpp"

#include "./convert.hpp"

#include <scribe/error/errors.hpp>

#include <boost/leaf/exception.hpp>
#include <nlohmann/json.hpp>

#include <fmt/format.h>

#include <algorithm>

using namespace scribe;

namespace {

e_source_position position_of_offset(std::string_view content, std::size_t offset) {
    offset         = (std::min)(offset, content.size());
    auto head      = content.substr(0, offset);
    auto line      = static_cast<std::size_t>(std::ranges::count(head, '\n')) + 1;
    auto last_nl   = head.rfind('\n');
    auto col_start = last_nl == head.npos ? 0 : last_nl + 1;
    return e_source_position{line, offset - col_start + 1};
}

}  // namespace

value scribe::parse_json(std::string_view content) {
    // Reject deep nesting while parsing, before the document is walked recursively
    auto limit_depth = [](int depth, nlohmann::ordered_json::parse_event_t event, auto&) {
        using event_t = nlohmann::ordered_json::parse_event_t;
        if ((event == event_t::array_start || event == event_t::object_start)
            && static_cast<std::size_t>(depth) >= max_nesting_depth) {
            BOOST_LEAF_THROW_EXCEPTION(
                e_parse_error{fmt::format("JSON arrays and objects nest deeper than {} levels",
                                          max_nesting_depth)});
        }
        return true;
    };
    nlohmann::ordered_json doc;
    try {
        doc = nlohmann::ordered_json::parse(content, limit_depth);
    } catch (const nlohmann::json::parse_error& err) {
        // `byte` is the 1-based index of the character that was being read
        auto offset = err.byte == 0 ? 0 : err.byte - 1;
        BOOST_LEAF_THROW_EXCEPTION(e_parse_error{err.what()},
                                   e_byte_offset{offset},
                                   position_of_offset(content, offset));
    }
    return nlohmann_json_as_value(doc);
}
