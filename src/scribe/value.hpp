#pragma once

#include <neo/assert.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace scribe {

class value;

/**
 * @brief An association of string keys to values that remembers insertion order.
 *
 * Keys are unique. Assigning to a key that is already present replaces its value but keeps the
 * key at the position where it was first inserted, so documents that repeat a key resolve to
 * "last write wins" without reordering.
 */
class mapping {
public:
    using entry          = std::pair<std::string, value>;
    using container_type = std::vector<entry>;
    using iterator       = container_type::iterator;
    using const_iterator = container_type::const_iterator;

private:
    container_type                               _entries;
    std::unordered_map<std::string, std::size_t> _index;

public:
    mapping() = default;
    mapping(std::initializer_list<entry> entries);

    /**
     * @brief Insert the given key, or replace the value of an existing key.
     *
     * @return true if a new key was inserted, false if an existing value was replaced
     */
    bool insert_or_assign(std::string key, value v);

    [[nodiscard]] value*       find(std::string_view key) noexcept;
    [[nodiscard]] const value* find(std::string_view key) const noexcept;

    [[nodiscard]] bool contains(std::string_view key) const noexcept;

    /**
     * @brief Obtain the value for an existing key. The key must be present.
     */
    [[nodiscard]] const value& at(std::string_view key) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool        empty() const noexcept;

    iterator       begin() noexcept;
    iterator       end() noexcept;
    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

    /**
     * @brief Two mappings are equal if they hold the same keys, and each key maps to an equal
     * value in both. The order of keys is not considered.
     */
    friend bool operator==(const mapping&, const mapping&) noexcept;
};

/**
 * @brief The kinds of values that can appear in a document
 */
enum class kind {
    null,
    boolean,
    integer,
    floating,
    string,
    sequence,
    mapping,
};

/**
 * @brief Get a human-readable name for the given kind of value, e.g. "sequence"
 */
std::string_view kind_name(kind) noexcept;

/**
 * @brief A document value: the common ground between all of the formats that scribe understands.
 *
 * A value is one of: null, a boolean, a 64-bit signed integer, a 64-bit float, a UTF-8 string, a
 * sequence of values, or a mapping from string keys to values.
 */
class value {
public:
    using null_type     = std::nullptr_t;
    using integer_type  = std::int64_t;
    using float_type    = double;
    using string_type   = std::string;
    using sequence_type = std::vector<value>;
    using mapping_type  = scribe::mapping;

private:
    using variant_type = std::variant<null_type,
                                      bool,
                                      integer_type,
                                      float_type,
                                      string_type,
                                      sequence_type,
                                      mapping_type>;
    variant_type _var;

    template <typename T>
    T& _get() noexcept {
        neo_assert(expects,
                   std::holds_alternative<T>(_var),
                   "Accessed a document value as the wrong kind",
                   kind_name(get_kind()));
        return *std::get_if<T>(&_var);
    }

    template <typename T>
    const T& _get() const noexcept {
        neo_assert(expects,
                   std::holds_alternative<T>(_var),
                   "Accessed a document value as the wrong kind",
                   kind_name(get_kind()));
        return *std::get_if<T>(&_var);
    }

public:
    value() noexcept
        : _var(nullptr) {}
    value(null_type) noexcept
        : _var(nullptr) {}
    value(bool b) noexcept
        : _var(b) {}
    template <std::integral I>
    requires(!std::same_as<I, bool>) value(I i) noexcept
        : _var(static_cast<integer_type>(i)) {}
    value(float_type d) noexcept
        : _var(d) {}
    value(string_type s) noexcept
        : _var(std::move(s)) {}
    value(std::string_view s)
        : _var(string_type(s)) {}
    value(const char* s)
        : _var(string_type(s)) {}
    value(sequence_type seq) noexcept
        : _var(std::move(seq)) {}
    value(mapping_type map) noexcept
        : _var(std::move(map)) {}

    [[nodiscard]] enum kind get_kind() const noexcept {
        return static_cast<enum kind>(_var.index());
    }

    bool is_null() const noexcept { return get_kind() == kind::null; }
    bool is_bool() const noexcept { return get_kind() == kind::boolean; }
    bool is_integer() const noexcept { return get_kind() == kind::integer; }
    bool is_float() const noexcept { return get_kind() == kind::floating; }
    bool is_string() const noexcept { return get_kind() == kind::string; }
    bool is_sequence() const noexcept { return get_kind() == kind::sequence; }
    bool is_mapping() const noexcept { return get_kind() == kind::mapping; }

    /**
     * @brief Determine whether this value holds other values (is a sequence or a mapping)
     */
    bool is_container() const noexcept { return is_sequence() || is_mapping(); }

    bool                 as_bool() const noexcept { return _get<bool>(); }
    integer_type         as_integer() const noexcept { return _get<integer_type>(); }
    float_type           as_float() const noexcept { return _get<float_type>(); }
    const string_type&   as_string() const noexcept { return _get<string_type>(); }
    const sequence_type& as_sequence() const noexcept { return _get<sequence_type>(); }
    sequence_type&       as_sequence() noexcept { return _get<sequence_type>(); }
    const mapping_type&  as_mapping() const noexcept { return _get<mapping_type>(); }
    mapping_type&        as_mapping() noexcept { return _get<mapping_type>(); }

    /**
     * @brief Invoke `fn` with the active alternative of this value
     */
    template <typename Fn>
    decltype(auto) visit(Fn&& fn) const {
        return std::visit(std::forward<Fn>(fn), _var);
    }

    friend bool operator==(const value&, const value&) noexcept;
};

// These need a complete `value`, so they live here rather than in the class body.

bool operator==(const mapping&, const mapping&) noexcept;
bool operator==(const value&, const value&) noexcept;

inline mapping::mapping(std::initializer_list<entry> entries) {
    for (auto& [key, val] : entries) {
        insert_or_assign(key, val);
    }
}

inline bool mapping::contains(std::string_view key) const noexcept { return find(key) != nullptr; }

inline std::size_t mapping::size() const noexcept { return _entries.size(); }
inline bool        mapping::empty() const noexcept { return _entries.empty(); }

inline mapping::iterator       mapping::begin() noexcept { return _entries.begin(); }
inline mapping::iterator       mapping::end() noexcept { return _entries.end(); }
inline mapping::const_iterator mapping::begin() const noexcept { return _entries.cbegin(); }
inline mapping::const_iterator mapping::end() const noexcept { return _entries.cend(); }

/**
 * @brief The deepest nesting of sequences and mappings that the parsers will build. Deeper
 * documents are rejected with e_parse_error.
 */
inline constexpr std::size_t max_nesting_depth = 1000;

/**
 * @brief Generate the shortest text that reads back as exactly the given finite double.
 *
 * The text always contains a decimal point or an exponent, so that it can't be mistaken for an
 * integer.
 */
std::string repr_float(double d) noexcept;

/**
 * @brief Extend a dotted value path (as loaded into e_value_path) with a mapping key or a sequence
 * index. An empty `parent` is the document root.
 */
std::string child_path(std::string_view parent, std::string_view key);
std::string child_path(std::string_view parent, std::size_t index);

}  // namespace scribe
