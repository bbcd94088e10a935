#include "./error_handler.hpp"

#include <scribe/error/errors.hpp>
#include <scribe/format.hpp>
#include <scribe/util/fs/io.hpp>
#include <scribe/util/log.hpp>
#include <scribe/util/style.hpp>
#include <scribe/yaml/errors.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <fmt/ostream.h>

#include <system_error>

using namespace scribe;

namespace {

std::string_view role_str(const document_role* role) noexcept {
    if (!role) {
        return "";
    }
    return *role == document_role::input ? "input " : "output ";
}

std::string_view stage_str(const conversion_stage* stage) noexcept {
    if (!stage) {
        return "convert";
    }
    return *stage == conversion_stage::parse ? "parse" : "emit";
}

void log_document_context(const e_read_file_path*  path,
                          const e_source_position* pos,
                          const e_byte_offset*     offset) {
    if (path) {
        if (pos) {
            scribe_log(error,
                       "  (At {}:{}:{})",
                       em_subject(path->value.string()),
                       pos->line,
                       pos->column);
        } else {
            scribe_log(error, "  (In [{}])", em_subject(path->value.string()));
        }
    } else if (pos) {
        scribe_log(error, "  (At line {}, column {})", pos->line, pos->column);
    }
    if (offset) {
        scribe_log(debug, "  (Byte offset {})", offset->value);
    }
}

auto handlers = std::tuple(  //
    [](e_unsupported_format bad, const document_role* role) {
        scribe_log(error,
                   "Unsupported {}format '{}'. Supported formats are JSON (.json), YAML "
                   "(.yaml, .yml), and TOML (.toml)",
                   role_str(role),
                   em_bad(bad.value));
        if (!bad.did_you_mean.empty()) {
            scribe_log(error, "  (Did you mean '{}'?)", em_hint(bad.did_you_mean));
        }
        return 1;
    },
    [](e_parse_error            err,
       const e_format*          fmt_,
       const e_yaml_tag*  tag,
       const e_read_file_path*  path,
       const e_source_position* pos,
       const e_byte_offset*     offset) {
        scribe_log(error,
                   "Failed to parse {}input: {}",
                   fmt_ ? fmt::format("{} ", format_display_name(fmt_->value)) : std::string(),
                   em_bad(err.value));
        if (tag) {
            scribe_log(error, "  (While resolving tag '{}')", tag->value);
        }
        log_document_context(path, pos, offset);
        return 1;
    },
    [](e_unsupported_feature    feat,
       const conversion_stage*  stage,
       const e_format*          fmt_,
       const e_yaml_tag*  tag,
       const e_value_path*      vpath,
       const e_read_file_path*  path,
       const e_source_position* pos) {
        scribe_log(error,
                   "Unable to {} {}document: unsupported feature: {}",
                   stage_str(stage),
                   fmt_ ? fmt::format("{} ", format_display_name(fmt_->value)) : std::string(),
                   em_bad(feat.value));
        if (tag) {
            scribe_log(error, "  (Tag: '{}')", tag->value);
        }
        if (vpath && !vpath->value.empty()) {
            scribe_log(error, "  (At value [{}])", em_subject(vpath->value));
        }
        log_document_context(path, pos, nullptr);
        return 1;
    },
    [](e_unrepresentable       un,
       const e_format*         fmt_,
       const e_value_path*     vpath,
       const e_read_file_path* path) {
        scribe_log(error,
                   "Cannot emit {} value as {}: {}",
                   em_bad(un.type_name),
                   fmt_ ? format_display_name(fmt_->value) : "the output format",
                   un.reason);
        if (vpath && !vpath->value.empty()) {
            scribe_log(error, "  (At value [{}])", em_subject(vpath->value));
        }
        if (path) {
            scribe_log(error, "  (Converting [{}])", em_subject(path->value.string()));
        }
        return 1;
    },
    [](e_same_format same) {
        scribe_log(error,
                   "The input and the output are both {}. Nothing to convert",
                   em_bad(format_display_name(same.value)));
        scribe_log(error,
                   "  (Choose another output format with {}, or another output extension)",
                   em_hint("--to"));
        return 1;
    },
    [](e_same_input_output same) {
        scribe_log(error,
                   "Refusing to overwrite the input file [{}] with its own conversion",
                   em_subject(same.value.string()));
        return 1;
    },
    [](e_output_exists exists) {
        scribe_log(error,
                   "Output file [{}] already exists",
                   em_subject(exists.value.string()));
        scribe_log(error, "  (Pass {} to replace it)", em_hint("--if-exists=replace"));
        return 1;
    },
    [](e_missing_output) {
        scribe_log(error,
                   "No output path or output format was given. Pass an output path, or "
                   "name a format with {}",
                   em_hint("--to"));
        return 2;
    },
    [](const std::system_error& e, e_write_file_path path) {
        scribe_log(error,
                   "Failed to write output file [{}]: {}",
                   em_subject(path.value.string()),
                   em_bad(e.code().message()));
        return 1;
    },
    [](const std::system_error& e, e_read_file_path path) {
        scribe_log(error,
                   "Failed to read input file [{}]: {}",
                   em_subject(path.value.string()),
                   em_bad(e.code().message()));
        return 1;
    },
    [](const std::system_error& e, e_open_file_path path) {
        scribe_log(error,
                   "Failed to open file [{}]: {}",
                   em_subject(path.value.string()),
                   em_bad(e.code().message()));
        return 1;
    },
    [](const std::system_error& exc, boost::leaf::verbose_diagnostic_info const& diag) {
        scribe_log(critical,
                   "An unhandled std::system_error arose. {} Info: {}",
                   em_bad("THIS IS A SCRIBE BUG!"),
                   fmt::streamed(diag));
        scribe_log(critical,
                   "Exception message from std::system_error: {}",
                   em_bad(exc.code().message()));
        return 42;
    },
    [](boost::leaf::verbose_diagnostic_info const& diag) {
        scribe_log(critical,
                   "An unhandled error arose. {} Info: {}",
                   em_bad("THIS IS A SCRIBE BUG!"),
                   fmt::streamed(diag));
        return 42;
    });
}  // namespace

int scribe::handle_cli_errors(std::function<int()> fn) noexcept {
    return boost::leaf::try_catch(fn, handlers);
}
