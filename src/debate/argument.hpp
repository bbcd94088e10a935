#pragma once

#include "./error.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace debate {

template <typename E>
constexpr auto make_enum_putter(E& dest) noexcept;

template <typename T>
class argument_value_putter {
    T& _dest;

public:
    explicit argument_value_putter(T& dest) noexcept
        : _dest(dest) {}

    void operator()(std::string_view value, std::string_view) { _dest = T(value); }
};

template <typename T>
constexpr auto make_argument_putter(T& dest) {
    if constexpr (std::is_enum_v<T>) {
        return make_enum_putter(dest);  /// !! Include <debate/enum.hpp> to use enums here
    } else {
        return argument_value_putter{dest};
    }
}

constexpr inline auto put_into = [](auto& dest) { return make_argument_putter(dest); };

/**
 * @brief A single command-line option or positional argument.
 *
 * An argument with no long or short spellings is positional, and receives the non-option words
 * in the order the positionals were added.
 */
struct argument {
    std::vector<std::string> long_spellings{};
    std::vector<std::string> short_spellings{};

    std::string help{};
    std::string valname{};

    bool required   = false;
    int  nargs      = 1;
    bool can_repeat = false;

    std::function<void(std::string_view, std::string_view)> action;

    std::string_view try_match_short(std::string_view arg) const noexcept;
    std::string_view try_match_long(std::string_view arg) const noexcept;
    std::string      preferred_spelling() const noexcept;
    std::string      syntax_string() const noexcept;
    std::string      help_string() const noexcept;
    bool             is_positional() const noexcept {
        return long_spellings.empty() && short_spellings.empty();
    }
};

}  // namespace debate
