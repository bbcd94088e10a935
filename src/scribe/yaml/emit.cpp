#include "./emit.hpp"

#include "./scalar.hpp"

#include <scribe/error/errors.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/assert.hpp>
#include <yaml-cpp/emitter.h>
#include <yaml-cpp/emittermanip.h>

#include <cmath>

using namespace scribe;

namespace {

/// Would a YAML reader take this text, written plain, to be anything other than a string?
bool needs_quotes(const std::string& str) {
    return !resolve_plain_scalar(str).is_string() || is_yaml11_bool_spelling(str);
}

void emit_string(YAML::Emitter& out, const std::string& str) {
    if (needs_quotes(str)) {
        out << YAML::DoubleQuoted << str;
    } else {
        out << str;
    }
}

void emit_float(YAML::Emitter& out, double d) {
    if (std::isnan(d)) {
        out << ".nan";
    } else if (std::isinf(d)) {
        out << (d < 0 ? "-.inf" : ".inf");
    } else {
        out << repr_float(d);
    }
}

void emit_value(YAML::Emitter& out, const value& val) {
    switch (val.get_kind()) {
    case kind::null:
        out << YAML::Null;
        return;
    case kind::boolean:
        out << val.as_bool();
        return;
    case kind::integer:
        out << val.as_integer();
        return;
    case kind::floating:
        emit_float(out, val.as_float());
        return;
    case kind::string:
        emit_string(out, val.as_string());
        return;
    case kind::sequence: {
        auto& seq = val.as_sequence();
        if (seq.empty()) {
            out << YAML::Flow;
        }
        out << YAML::BeginSeq;
        for (auto& elem : seq) {
            emit_value(out, elem);
        }
        out << YAML::EndSeq;
        return;
    }
    case kind::mapping: {
        auto& map = val.as_mapping();
        if (map.empty()) {
            out << YAML::Flow;
        }
        out << YAML::BeginMap;
        for (auto& [key, elem] : map) {
            out << YAML::Key;
            emit_string(out, key);
            out << YAML::Value;
            emit_value(out, elem);
        }
        out << YAML::EndMap;
        return;
    }
    }
    neo::unreachable();
}

}  // namespace

std::string scribe::emit_yaml(const value& val) {
    YAML::Emitter out;
    out.SetIndent(2);
    out.SetNullFormat(YAML::LowerNull);
    out.SetBoolFormat(YAML::TrueFalseBool);
    out.SetBoolFormat(YAML::LowerCase);
    emit_value(out, val);
    if (!out.good()) {
        BOOST_LEAF_THROW_EXCEPTION(e_unrepresentable{std::string(kind_name(val.get_kind())),
                                                     out.GetLastError()});
    }
    std::string ret = out.c_str();
    ret.push_back('\n');
    return ret;
}
