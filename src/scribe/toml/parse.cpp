#include "./parse.hpp"

#include <scribe/error/errors.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/format.h>
#include <toml.hpp>

#include <string>

using namespace scribe;

namespace {

e_source_position position_of(const toml::source_location& loc) {
    return e_source_position{loc.first_line_number(), loc.first_column_number()};
}

value toml_as_value(const toml::ordered_value& val, const std::string& path, std::size_t depth) {
    if (depth >= max_nesting_depth && (val.is_array() || val.is_table())) {
        BOOST_LEAF_THROW_EXCEPTION(
            e_parse_error{fmt::format("TOML arrays and tables nest deeper than {} levels",
                                      max_nesting_depth)},
            e_value_path{path},
            position_of(val.location()));
    }
    switch (val.type()) {
    case toml::value_t::boolean:
        return val.as_boolean();
    case toml::value_t::integer:
        return val.as_integer();
    case toml::value_t::floating:
        return val.as_floating();
    case toml::value_t::string:
        return val.as_string();
    case toml::value_t::array: {
        auto seq = value::sequence_type{};
        for (auto& elem : val.as_array()) {
            seq.push_back(toml_as_value(elem, child_path(path, seq.size()), depth + 1));
        }
        return value(std::move(seq));
    }
    case toml::value_t::table: {
        auto map = mapping{};
        for (auto& [key, elem] : val.as_table()) {
            map.insert_or_assign(key, toml_as_value(elem, child_path(path, key), depth + 1));
        }
        return value(std::move(map));
    }
    case toml::value_t::offset_datetime:
    case toml::value_t::local_datetime:
    case toml::value_t::local_date:
    case toml::value_t::local_time:
        BOOST_LEAF_THROW_EXCEPTION(e_unsupported_feature{"TOML dates and times are not supported"},
                                   e_value_path{path},
                                   position_of(val.location()));
    case toml::value_t::empty:
        break;
    }
    BOOST_LEAF_THROW_EXCEPTION(e_parse_error{"TOML value has no type"}, e_value_path{path});
}

}  // namespace

value scribe::parse_toml(std::string_view content) {
    toml::ordered_value doc;
    try {
        doc = toml::parse_str<toml::ordered_type_config>(std::string(content),
                                                         toml::spec::v(1, 0, 0));
    } catch (const toml::syntax_error& err) {
        auto& errors = err.errors();
        if (!errors.empty() && !errors.front().locations().empty()) {
            BOOST_LEAF_THROW_EXCEPTION(e_parse_error{err.what()},
                                       position_of(errors.front().locations().front().first));
        }
        BOOST_LEAF_THROW_EXCEPTION(e_parse_error{err.what()});
    } catch (const toml::exception& err) {
        BOOST_LEAF_THROW_EXCEPTION(e_parse_error{err.what()});
    }
    return toml_as_value(doc, "", 0);
}
