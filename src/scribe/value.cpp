#include "./value.hpp"

#include <fmt/format.h>

using namespace scribe;

bool mapping::insert_or_assign(std::string key, value v) {
    auto found = _index.find(key);
    if (found != _index.end()) {
        _entries[found->second].second = std::move(v);
        return false;
    }
    _index.emplace(key, _entries.size());
    _entries.emplace_back(std::move(key), std::move(v));
    return true;
}

value* mapping::find(std::string_view key) noexcept {
    auto found = _index.find(std::string(key));
    if (found == _index.end()) {
        return nullptr;
    }
    return &_entries[found->second].second;
}

const value* mapping::find(std::string_view key) const noexcept {
    auto found = _index.find(std::string(key));
    if (found == _index.end()) {
        return nullptr;
    }
    return &_entries[found->second].second;
}

const value& mapping::at(std::string_view key) const noexcept {
    auto ptr = find(key);
    neo_assert(expects, ptr != nullptr, "Accessed a mapping key that is not present", key);
    return *ptr;
}

bool scribe::operator==(const mapping& lhs, const mapping& rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (auto& [key, val] : lhs) {
        auto other = rhs.find(key);
        if (!other || !(*other == val)) {
            return false;
        }
    }
    return true;
}

bool scribe::operator==(const value& lhs, const value& rhs) noexcept {
    return lhs._var == rhs._var;
}

std::string_view scribe::kind_name(kind k) noexcept {
    switch (k) {
    case kind::null:
        return "null";
    case kind::boolean:
        return "boolean";
    case kind::integer:
        return "integer";
    case kind::floating:
        return "float";
    case kind::string:
        return "string";
    case kind::sequence:
        return "sequence";
    case kind::mapping:
        return "mapping";
    }
    neo::unreachable();
}

std::string scribe::repr_float(double d) noexcept {
    // fmt gives the shortest representation that round-trips
    auto str = fmt::format("{}", d);
    if (str.find('.') != str.npos) {
        return str;
    }
    auto exp_pos = str.find('e');
    if (exp_pos == str.npos) {
        str.append(".0");
    } else {
        // "1e+20" -> "1.0e+20". Some YAML readers do not accept an exponent without a fraction.
        str.insert(exp_pos, ".0");
    }
    return str;
}

std::string scribe::child_path(std::string_view parent, std::string_view key) {
    if (parent.empty()) {
        return std::string(key);
    }
    return fmt::format("{}.{}", parent, key);
}

std::string scribe::child_path(std::string_view parent, std::size_t index) {
    return fmt::format("{}[{}]", parent, index);
}
