#include "./convert.hpp"

#include "./errors.hpp"
#include "./scalar.hpp"

#include <scribe/error/errors.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/format.h>
#include <neo/utility.hpp>
#include <yaml-cpp/node/iterator.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <vector>

using namespace scribe;

namespace {

e_source_position node_position(const YAML::Node& node) {
    auto mark = node.Mark();
    if (mark.is_null()) {
        return e_source_position{0, 0};
    }
    return e_source_position{static_cast<std::size_t>(mark.line) + 1,
                             static_cast<std::size_t>(mark.column) + 1};
}

[[noreturn]] void throw_invalid_spelling(const YAML::Node& node) {
    BOOST_LEAF_THROW_EXCEPTION(
        e_parse_error{fmt::format("'{}' is not a valid value for tag {}", node.Scalar(), node.Tag())},
        e_yaml_tag{node.Tag()},
        node_position(node));
}

value convert_tagged_scalar(const YAML::Node& node) {
    std::string_view tag   = node.Tag();
    const auto&      spell = node.Scalar();
    if (tag == "?") {
        return resolve_plain_scalar(spell);
    } else if (tag == neo::oper::any_of("!", "tag:yaml.org,2002:str")) {
        return spell;
    } else if (tag == "tag:yaml.org,2002:bool") {
        // Explicitly tagged booleans also accept the YAML 1.1 spellings
        try {
            return node.as<bool>();
        } catch (const YAML::TypedBadConversion<bool>&) {
            throw_invalid_spelling(node);
        }
    } else if (tag == "tag:yaml.org,2002:null") {
        return nullptr;
    } else if (tag == "tag:yaml.org,2002:int") {
        if (auto i = parse_core_integer(spell)) {
            return *i;
        }
        throw_invalid_spelling(node);
    } else if (tag == "tag:yaml.org,2002:float") {
        if (auto d = parse_core_float(spell)) {
            return *d;
        }
        if (auto i = parse_core_integer(spell)) {
            return i->is_integer() ? static_cast<double>(i->as_integer()) : i->as_float();
        }
        throw_invalid_spelling(node);
    } else {
        BOOST_LEAF_THROW_EXCEPTION(e_unsupported_feature{fmt::format("Unsupported YAML tag: {}",
                                                                     tag)},
                                   e_yaml_tag{std::string(tag)},
                                   node_position(node));
    }
}

struct yaml_converter {
    /// The container nodes that enclose the node being converted
    std::vector<YAML::Node> ancestors;

    void enter(const YAML::Node& node) {
        auto is_same = [&](const YAML::Node& anc) { return anc.is(node); };
        if (std::ranges::any_of(ancestors, is_same)) {
            BOOST_LEAF_THROW_EXCEPTION(
                e_unsupported_feature{"Recursive YAML structures (an alias to an enclosing node) "
                                      "are not supported"},
                node_position(node));
        }
        if (ancestors.size() >= max_nesting_depth) {
            BOOST_LEAF_THROW_EXCEPTION(
                e_parse_error{fmt::format("YAML sequences and mappings nest deeper than {} levels",
                                          max_nesting_depth)},
                node_position(node));
        }
        ancestors.push_back(node);
    }

    std::string key_string(const YAML::Node& key) {
        if (key.IsNull()) {
            return "null";
        } else if (key.IsScalar()) {
            return key.Scalar();
        } else {
            BOOST_LEAF_THROW_EXCEPTION(
                e_unsupported_feature{"Mapping keys must be scalars, not sequences or mappings"},
                node_position(key));
        }
    }

    value convert(const YAML::Node& node) {
        if (node.IsNull()) {
            return nullptr;
        } else if (node.IsSequence()) {
            enter(node);
            auto seq = value::sequence_type{};
            seq.reserve(node.size());
            for (auto& elem : node) {
                seq.push_back(convert(elem));
            }
            ancestors.pop_back();
            return value(std::move(seq));
        } else if (node.IsMap()) {
            enter(node);
            auto map = mapping{};
            for (auto& pair : node) {
                map.insert_or_assign(key_string(pair.first), convert(pair.second));
            }
            ancestors.pop_back();
            return value(std::move(map));
        } else if (node.IsScalar()) {
            return convert_tagged_scalar(node);
        } else {
            BOOST_LEAF_THROW_EXCEPTION(e_parse_error{"Undefined YAML node"}, node_position(node));
        }
    }
};

}  // namespace

value scribe::yaml_as_value(const YAML::Node& node) { return yaml_converter{}.convert(node); }
