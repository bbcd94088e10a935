#include "./argument.hpp"

#include <fmt/color.h>

using namespace debate;

using strv = std::string_view;

using namespace std::literals;

strv argument::try_match_short(strv given) const noexcept {
    for (auto& cand : short_spellings) {
        if (given.starts_with(cand)) {
            return cand;
        }
    }
    return "";
}

strv argument::try_match_long(strv given) const noexcept {
    for (auto& cand : long_spellings) {
        if (!given.starts_with(cand)) {
            continue;
        }
        auto tail = given.substr(cand.size());
        // Either '--argument value' or '--argument=value'
        if (tail.empty() || tail[0] == '=') {
            return cand;
        }
    }
    return "";
}

std::string argument::preferred_spelling() const noexcept {
    if (!long_spellings.empty()) {
        return "--"s + long_spellings.front();
    } else if (!short_spellings.empty()) {
        return "-"s + short_spellings.front();
    } else {
        return valname;
    }
}

std::string argument::syntax_string() const noexcept {
    auto pref_spell   = preferred_spelling();
    auto real_valname = !valname.empty()
        ? valname
        : (long_spellings.empty() ? "<value>" : ("<" + long_spellings[0] + ">"));
    if (is_positional()) {
        if (required) {
            return can_repeat ? fmt::format("{} [{} [...]]", real_valname, real_valname)
                              : real_valname;
        }
        return can_repeat ? fmt::format("[{} [{} [...]]]", real_valname, real_valname)
                          : fmt::format("[{}]", real_valname);
    } else if (nargs == 0) {
        return fmt::format("[{}]", pref_spell);
    }
    char sep_char = pref_spell.starts_with("--") ? '=' : ' ';
    auto one      = fmt::format("{}{}{}", pref_spell, sep_char, real_valname);
    if (required) {
        return can_repeat ? fmt::format("{} [{} [...]]", one, one) : one;
    }
    return can_repeat ? fmt::format("[{} [{} [...]]]", one, one) : fmt::format("[{}]", one);
}

std::string argument::help_string() const noexcept {
    std::string ret;
    auto        shown_valname = valname.empty() ? "<value>"s : valname;
    for (auto& l : long_spellings) {
        ret.append(fmt::format(fmt::emphasis::bold, "--{}", l));
        if (nargs != 0) {
            ret.append(fmt::format(fmt::emphasis::italic, "={}", shown_valname));
        }
        ret.push_back('\n');
    }
    for (auto& s : short_spellings) {
        ret.append(fmt::format(fmt::emphasis::bold, "-{}", s));
        if (nargs != 0) {
            ret.append(fmt::format(fmt::emphasis::italic, " {}", shown_valname));
        }
        ret.push_back('\n');
    }
    if (is_positional()) {
        ret.append(preferred_spelling() + "\n");
    }
    ret.append("  ");
    for (auto c : help) {
        ret.push_back(c);
        if (c == '\n') {
            ret.append(2, ' ');
        }
    }
    ret.push_back('\n');
    return ret;
}
