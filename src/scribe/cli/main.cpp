#include "./main.hpp"

#include <scribe/cli/dispatch_main.hpp>
#include <scribe/cli/options.hpp>
#include <scribe/util/log.hpp>
#include <scribe/util/style.hpp>

#include <debate/debate.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <fmt/ostream.h>

#include <iostream>
#include <optional>

namespace {

/**
 * Print the usage text and a one-line description of what was wrong with the command line.
 * Returns the exit code for usage errors.
 */
int usage_error(std::string_view               program_name,
                const debate::argument_parser& parser,
                std::string_view               message) {
    fmt::print(std::cerr,
               "{}\n{}\n  (Run '{} --help' for more information)\n",
               parser.usage_string(program_name),
               message,
               program_name);
    return 2;
}

std::string wrong_value_count_message(const debate::argument& arg, int given) {
    if (arg.nargs == 0) {
        return "does not take a value";
    }
    if (given == 0) {
        return "requires a value";
    }
    return fmt::format("expects {} values, but received {}", arg.nargs, given);
}

}  // namespace

int scribe::cli::main_fn(std::string_view program_name, const std::vector<std::string>& argv) {
    scribe::cli::options    opts;
    debate::argument_parser parser{
        "Convert a structured-data document between JSON, YAML, and TOML"};
    opts.setup_parser(parser);

    auto parse_result = boost::leaf::try_catch(
        [&]() -> std::optional<int> {
            parser.parse_argv(argv);
            return std::nullopt;
        },
        [&](debate::help_request, debate::e_argument_parser p) {
            std::cout << p.value.help_string(program_name);
            return 0;
        },
        [&](debate::unrecognized_argument, debate::e_argument_parser p, debate::e_arg_spelling arg) {
            auto message = fmt::format("Unrecognized argument: \"{}\"", scribe::em_bad(arg.value));
            return usage_error(program_name, p.value, message);
        },
        [&](debate::invalid_arguments,
            debate::e_argument          arg,
            debate::e_argument_parser   p,
            debate::e_arg_spelling      spell,
            debate::e_invalid_arg_value val) {
            auto message = fmt::format("'{}' is not a valid value for '{}' (expected {})",
                                       scribe::em_bad(val.value),
                                       spell.value,
                                       arg.value.valname);
            return usage_error(program_name, p.value, message);
        },
        [&](debate::invalid_arguments,
            debate::e_argument_parser p,
            debate::e_arg_spelling    spell,
            debate::e_argument        arg,
            debate::e_wrong_val_num   given) {
            auto message = fmt::format("Argument '{}' {}",
                                       spell.value,
                                       wrong_value_count_message(arg.value, given.value));
            return usage_error(program_name, p.value, message);
        },
        [&](debate::missing_required, debate::e_argument_parser p, debate::e_argument arg) {
            auto message
                = fmt::format("Missing required argument '{}'", arg.value.preferred_spelling());
            return usage_error(program_name, p.value, message);
        },
        [&](debate::invalid_repetition, debate::e_argument_parser p, debate::e_arg_spelling sp) {
            auto message = fmt::format("Argument '{}' may only be given once", sp.value);
            return usage_error(program_name, p.value, message);
        },
        [&](debate::invalid_arguments const& err, debate::e_argument_parser p) {
            return usage_error(program_name, p.value, fmt::format("Error: {}", err.what()));
        });
    if (parse_result) {
        // Help was printed, or the command line was rejected
        return *parse_result;
    }
    scribe::log::current_log_level = opts.log_level;
    return scribe::cli::dispatch_main(opts);
}
