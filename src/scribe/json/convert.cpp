#include "./convert.hpp"

#include <scribe/error/errors.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/assert.hpp>
#include <nlohmann/json.hpp>

#include <cmath>
#include <limits>

using namespace scribe;

value scribe::nlohmann_json_as_value(const nlohmann::ordered_json& data) noexcept {
    if (data.is_null()) {
        return nullptr;
    } else if (data.is_string()) {
        return data.get_ref<const std::string&>();
    } else if (data.is_number_unsigned()) {
        auto n = data.get<std::uint64_t>();
        if (n > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return static_cast<double>(n);
        }
        return static_cast<std::int64_t>(n);
    } else if (data.is_number_integer()) {
        return data.get<std::int64_t>();
    } else if (data.is_number_float()) {
        return data.get<double>();
    } else if (data.is_boolean()) {
        return data.get<bool>();
    } else if (data.is_array()) {
        auto ret = value::sequence_type{};
        ret.reserve(data.size());
        for (const auto& elem : data) {
            ret.push_back(nlohmann_json_as_value(elem));
        }
        return value(std::move(ret));
    } else if (data.is_object()) {
        auto ret = mapping{};
        for (const auto& [key, val] : data.items()) {
            ret.insert_or_assign(key, nlohmann_json_as_value(val));
        }
        return value(std::move(ret));
    } else {
        neo::unreachable();
    }
}

namespace {

nlohmann::ordered_json to_json(const value& val, const std::string& path) {
    switch (val.get_kind()) {
    case kind::null:
        return nullptr;
    case kind::boolean:
        return val.as_bool();
    case kind::integer:
        return val.as_integer();
    case kind::floating: {
        auto d = val.as_float();
        if (!std::isfinite(d)) {
            BOOST_LEAF_THROW_EXCEPTION(e_unrepresentable{"float",
                                                         "JSON numbers must be finite"},
                                       e_value_path{path});
        }
        return d;
    }
    case kind::string:
        return val.as_string();
    case kind::sequence: {
        auto ret = nlohmann::ordered_json::array();
        std::size_t idx = 0;
        for (auto& elem : val.as_sequence()) {
            ret.push_back(to_json(elem, child_path(path, idx++)));
        }
        return ret;
    }
    case kind::mapping: {
        auto ret = nlohmann::ordered_json::object();
        for (auto& [key, elem] : val.as_mapping()) {
            ret.emplace(key, to_json(elem, child_path(path, key)));
        }
        return ret;
    }
    }
    neo::unreachable();
}

}  // namespace

nlohmann::ordered_json scribe::value_as_nlohmann_json(const value& val) { return to_json(val, ""); }
