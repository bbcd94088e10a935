#include "./emit.hpp"

#include <scribe/error/errors.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/assert.hpp>
#include <toml.hpp>

#include <string>

using namespace scribe;

namespace {

toml::ordered_value value_as_toml(const value& val, const std::string& path) {
    toml::ordered_value out;

    switch (val.get_kind()) {
    case kind::null:
        BOOST_LEAF_THROW_EXCEPTION(e_unrepresentable{"null", "TOML has no null value"},
                                   e_value_path{path});

    case kind::boolean:
        out = val.as_bool();
        break;

    case kind::integer:
        out = val.as_integer();
        break;

    case kind::floating:
        out = val.as_float();
        break;

    case kind::string:
        out = val.as_string();
        break;

    case kind::sequence: {
        out             = toml::ordered_value::array_type();
        std::size_t idx = 0;
        for (auto& elem : val.as_sequence()) {
            out.push_back(value_as_toml(elem, child_path(path, idx++)));
        }
        break;
    }

    case kind::mapping:
        out = toml::ordered_value::table_type();
        for (auto& [key, elem] : val.as_mapping()) {
            out[key] = value_as_toml(elem, child_path(path, key));
        }
        break;

    default:
        neo::unreachable();
    }

    return out;
}

}  // namespace

std::string scribe::emit_toml(const value& val) {
    if (!val.is_mapping()) {
        BOOST_LEAF_THROW_EXCEPTION(
            e_unrepresentable{std::string(kind_name(val.get_kind())),
                              "A TOML document must have a table (mapping) at the top level"});
    }
    return toml::format(value_as_toml(val, ""), toml::spec::v(1, 0, 0));
}
