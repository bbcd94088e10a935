#include "./options.hpp"

#include <debate/argument_parser.hpp>
#include <debate/enum.hpp>

using namespace scribe;
using namespace debate;

namespace {

struct setup {
    scribe::cli::options& opts;

    void do_setup(argument_parser& parser) noexcept {
        parser.add_argument({
            .long_spellings  = {"log-level"},
            .short_spellings = {"l"},
            .help            = "Set the scribe logging level. One of 'trace', 'debug', 'info', \n"
                               "'warn', 'error', 'critical', or 'silent'",
            .valname         = "<level>",
            .action          = put_into(opts.log_level),
        });
        parser.add_argument({
            .long_spellings  = {"to", "format"},
            .short_spellings = {"f"},
            .help = "The format to write: 'json', 'yaml' (or 'yml'), or 'toml'. Overrides the\n"
                    "format implied by the output path's extension",
            .valname = "<format>",
            .action  = put_into(opts.output_format),
        });
        parser.add_argument({
            .long_spellings  = {"from", "input-format"},
            .short_spellings = {"F"},
            .help    = "The format to read. Overrides the format implied by the input path's\n"
                       "extension",
            .valname = "<format>",
            .action  = put_into(opts.input_format),
        });
        parser.add_argument({
            .long_spellings = {"if-exists"},
            .help = "What to do if the output file already exists. 'replace' (the default)\n"
                    "overwrites it, and 'fail' stops without writing anything",
            .valname = enum_choices_string<scribe::cli::if_exists>(),
            .action  = put_into(opts.if_exists),
        });
        parser.add_argument({
            .help     = "The document to convert. Its format is inferred from its extension\n"
                        "(.json, .yaml, .yml, or .toml) unless '--from' is given",
            .valname  = "<input>",
            .required = true,
            .action   = put_into(opts.input),
        });
        parser.add_argument({
            .help = "Where to write the converted document. If omitted, the input path is used\n"
                    "with its extension replaced to match the '--to' format",
            .valname = "<output>",
            .action  = put_into(opts.output),
        });
    }
};

}  // namespace

void cli::options::setup_parser(debate::argument_parser& parser) noexcept {
    setup{*this}.do_setup(parser);
}
