#include "./argument_parser.hpp"

#include <boost/leaf/error.hpp>
#include <boost/leaf/exception.hpp>
#include <boost/leaf/on_error.hpp>

#include <fmt/format.h>

#include <set>

using strv = std::string_view;

using namespace debate;

namespace {

struct parse_engine {
    debate::detail::parser_state& state;
    const argument_parser&        parser;

    // How many positional arguments have been filled
    int positional_index = 0;

    // Once seen, '--' makes every remaining word positional
    bool only_positionals = false;

    std::set<const argument*> seen{};

    auto current_arg() const noexcept { return state.current_arg(); }
    auto at_end() const noexcept { return state.at_end(); }
    void shift() noexcept { return state.shift(); }

    void see(const argument& arg) {
        auto did_insert = seen.insert(&arg).second;
        if (!did_insert && !arg.can_repeat) {
            throw boost::leaf::exception(invalid_repetition("Invalid repetition"));
        }
    }

    void run() {
        auto _ = boost::leaf::on_error([this] { return e_argument_parser{parser}; });
        while (!at_end()) {
            parse_another();
        }
        finalize();
    }

    void parse_another() {
        auto given     = current_arg();
        auto did_parse = try_parse_given(given);
        if (!did_parse) {
            throw boost::leaf::exception(unrecognized_argument("Unrecognized argument"),
                                         e_arg_spelling{std::string(given)});
        }
    }

    bool try_parse_given(const strv given) {
        if (only_positionals || given.size() < 2 || given[0] != '-') {
            return try_parse_positional(given);
        } else if (given == "--") {
            only_positionals = true;
            shift();
            return true;
        } else if (given[1] == '-') {
            // Two hyphens is a long argument
            return try_parse_long(given.substr(2));
        } else {
            // A single hyphen, shorthand argument(s)
            return try_parse_short(given.substr(1));
        }
    }

    bool try_parse_long(strv tail) {
        if (tail == "help") {
            throw boost::leaf::exception(help_request());
        }
        for (const argument& cand : parser.arguments()) {
            auto matched = cand.try_match_long(tail);
            if (matched.empty()) {
                continue;
            }
            tail.remove_prefix(matched.size());
            shift();
            auto long_arg = fmt::format("--{}", matched);
            auto _        = boost::leaf::on_error(e_argument{cand}, e_arg_spelling{long_arg});
            see(cand);
            dispatch_long(cand, tail, long_arg);
            return true;
        }
        return false;
    }

    void dispatch_long(const argument& arg, strv tail, strv given) {
        if (arg.nargs == 0) {
            if (!tail.empty()) {
                throw boost::leaf::exception(invalid_arguments("Argument does not expect a value"),
                                             e_wrong_val_num{1});
            }
            arg.action(given, given);
            return;
        }
        neo_assert(invariant,
                   tail.empty() || tail[0] == '=',
                   "Invalid argparsing state",
                   tail,
                   given);
        if (!tail.empty()) {
            // Given with an '=', as in: '--long-option=value'
            tail.remove_prefix(1);
            if (arg.nargs > 1) {
                throw boost::leaf::exception(invalid_arguments("Invalid number of values"),
                                             e_wrong_val_num{1});
            }
            arg.action(tail, given);
            return;
        }
        // The following words are the values
        for (auto i = 0; i < arg.nargs; ++i) {
            if (at_end()) {
                throw boost::leaf::exception(invalid_arguments("Invalid number of argument values"),
                                             e_wrong_val_num{i});
            }
            arg.action(current_arg(), given);
            shift();
        }
    }

    bool try_parse_short(strv tail) {
        if (tail == "h") {
            throw boost::leaf::exception(help_request());
        }
        while (!tail.empty()) {
            auto new_tail = try_parse_short_1(tail);
            if (new_tail == tail) {
                // Nothing matched the remainder of the group
                return false;
            }
            tail = new_tail;
        }
        return true;
    }

    strv try_parse_short_1(const strv tail) {
        for (const argument& cand : parser.arguments()) {
            auto matched = cand.try_match_short(tail);
            if (matched.empty()) {
                continue;
            }
            auto short_tail = tail.substr(matched.size());
            auto short_arg  = fmt::format("-{}", matched);
            auto _          = boost::leaf::on_error(e_argument{cand}, e_arg_spelling{short_arg});
            see(cand);
            return dispatch_short(cand, short_tail, short_arg);
        }
        return tail;
    }

    strv dispatch_short(const argument& arg, strv tail, strv spelling) {
        if (arg.nargs == 0) {
            // A switch consumes a single character of the group
            arg.action("", spelling);
            if (tail.empty()) {
                shift();
            }
            return tail;
        } else if (arg.nargs == 1 && !tail.empty()) {
            // The remainder of the word is the value, as in '-fjson'
            arg.action(tail, spelling);
            shift();
            return "";
        } else if (!tail.empty()) {
            throw boost::leaf::exception(invalid_arguments("Wrong number of argument values given"),
                                         e_wrong_val_num{1});
        }
        shift();
        for (auto i = 0; i < arg.nargs; ++i) {
            if (at_end()) {
                throw boost::leaf::exception(invalid_arguments("Expected a value"),
                                             e_wrong_val_num{i});
            }
            arg.action(current_arg(), spelling);
            shift();
        }
        return "";
    }

    bool try_parse_positional(strv given) {
        int pos_idx = 0;
        for (auto& arg : parser.arguments()) {
            if (!arg.is_positional()) {
                continue;
            }
            if (pos_idx != positional_index) {
                ++pos_idx;
                continue;
            }
            neo_assert(expects,
                       arg.nargs == 1,
                       "Positional arguments must have their nargs=1. For more than one "
                       "positional, use multiple positional arguments objects.",
                       arg.nargs,
                       given,
                       positional_index);
            auto _ = boost::leaf::on_error(e_arg_spelling{arg.preferred_spelling()});
            see(arg);
            arg.action(given, given);
            if (!arg.can_repeat) {
                // A repeatable positional soaks up every remaining positional word
                ++positional_index;
            }
            shift();
            return true;
        }
        return false;
    }

    void finalize() {
        for (auto& arg : parser.arguments()) {
            if (arg.required && !seen.contains(&arg)) {
                throw boost::leaf::exception(missing_required("Required argument is missing"),
                                             e_argument{arg});
            }
        }
    }
};

}  // namespace

void debate::detail::parser_state::run(const argument_parser& parser) {
    parse_engine{*this, parser}.run();
}

argument& argument_parser::add_argument(argument arg) noexcept {
    _arguments.push_back(std::move(arg));
    return _arguments.back();
}

std::string argument_parser::usage_string(std::string_view progname) const noexcept {
    auto ret    = fmt::format("Usage: {}", progname);
    auto indent = ret.size() + 1;
    if (indent > 40) {
        ret.push_back('\n');
        indent = 10;
        ret.append(indent, ' ');
    }

    std::size_t col = indent;
    for (auto& arg : _arguments) {
        auto synstr = arg.syntax_string();
        if (col + synstr.size() > 79 && col > indent) {
            ret.append("\n");
            ret.append(indent - 1, ' ');
            col = indent - 1;
        }
        ret.append(" " + synstr);
        col += synstr.size() + 1;
    }
    return ret;
}

std::string argument_parser::help_string(std::string_view progname) const noexcept {
    std::string ret = usage_string(progname);
    ret.append("\n\n");
    if (!_description.empty()) {
        ret.append(_description);
        ret.append("\n\n");
    }
    auto append_group = [&](std::string_view title, bool want_required) {
        bool any = false;
        for (auto& arg : arguments()) {
            if (arg.required != want_required) {
                continue;
            }
            if (!any) {
                ret.append(title);
                ret.append(":\n\n");
            }
            any = true;
            ret.append(arg.help_string());
            ret.append("\n");
        }
    };
    append_group("required arguments", true);
    append_group("optional arguments", false);
    return ret;
}
