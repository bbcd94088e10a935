#pragma once

#include "./argument_parser.hpp"
#include "./error.hpp"

#include <boost/leaf/exception.hpp>
#include <fmt/format.h>
#include <magic_enum.hpp>

#include <algorithm>
#include <string>
#include <type_traits>
#include <vector>

namespace debate {

/**
 * @brief The command-line spelling of an enumerator: underscores become hyphens, and trailing
 * underscores are dropped (so `delete_` is spelled "delete")
 */
inline std::string enum_kebab_name(std::string val_ident) {
    std::ranges::replace(val_ident, '_', '-');
    auto trim_pos = val_ident.find_last_not_of('-');
    if (trim_pos != std::string::npos) {
        val_ident.erase(trim_pos + 1);
    }
    return val_ident;
}

/**
 * @brief Get the command-line spellings of every enumerator of E, in declaration order
 */
template <typename E>
std::vector<std::string> enum_choices() {
    std::vector<std::string> ret;
    for (auto name : magic_enum::enum_names<E>()) {
        ret.push_back(enum_kebab_name(std::string(name)));
    }
    return ret;
}

/**
 * @brief Get a "{a,b,c}" string listing the choices for an enum-bound argument
 */
template <typename E>
std::string enum_choices_string() {
    return fmt::format("{{{}}}", fmt::join(enum_choices<E>(), ","));
}

template <typename E>
class enum_putter {
    E* _dest;

public:
    constexpr explicit enum_putter(E& e)
        : _dest(&e) {}

    void operator()(std::string_view given, std::string_view full_arg) const {
        auto entries  = magic_enum::enum_entries<E>();
        auto matching = std::ranges::find(entries, given, [](auto&& p) {
            return enum_kebab_name(std::string(p.second));
        });
        if (matching == std::ranges::end(entries)) {
            throw boost::leaf::
                exception(invalid_arguments(
                              fmt::format("Invalid value for enum-bound argument (expected one "
                                          "of {})",
                                          enum_choices_string<E>())),
                          e_invalid_arg_value{std::string(given)},
                          e_arg_spelling{std::string(full_arg)});
        }

        *_dest = matching->first;
    }
};

template <typename E>
constexpr auto make_enum_putter(E& dest) noexcept {
    return enum_putter<E>(dest);
}

}  // namespace debate
