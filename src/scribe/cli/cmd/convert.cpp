#include "../options.hpp"

#include <scribe/convert.hpp>
#include <scribe/error/errors.hpp>
#include <scribe/error/on_error.hpp>
#include <scribe/format.hpp>
#include <scribe/util/fs/io.hpp>
#include <scribe/util/log.hpp>

#include <boost/leaf/exception.hpp>

#include <system_error>

namespace scribe::cli::cmd {

namespace {

struct resolved_conversion {
    file_format in_format;
    file_format out_format;
    fs::path    output;
};

resolved_conversion resolve(const options& opts) {
    auto in_format = [&] {
        SCRIBE_E_SCOPE(document_role::input);
        return resolve_format(opts.input, opts.input_format);
    }();

    SCRIBE_E_SCOPE(document_role::output);
    if (opts.output) {
        return {in_format, resolve_format(*opts.output, opts.output_format), *opts.output};
    }
    if (!opts.output_format) {
        BOOST_LEAF_THROW_EXCEPTION(e_missing_output{});
    }
    auto out_format = resolve_format_name(*opts.output_format);
    return {in_format, out_format, with_format_extension(opts.input, out_format)};
}

bool is_same_file(const fs::path& a, const fs::path& b) {
    std::error_code ec;
    if (fs::exists(a, ec) && fs::exists(b, ec)) {
        return fs::equivalent(a, b, ec);
    }
    auto a_norm = fs::weakly_canonical(a, ec);
    if (ec) {
        a_norm = fs::absolute(a).lexically_normal();
    }
    auto b_norm = fs::weakly_canonical(b, ec);
    if (ec) {
        b_norm = fs::absolute(b).lexically_normal();
    }
    return a_norm == b_norm;
}

}  // namespace

int convert(const options& opts) {
    // Everything that can be decided without touching the filesystem is decided first
    auto conv = resolve(opts);
    scribe_log(debug,
               "Converting [{}] ({}) to [{}] ({})",
               opts.input.string(),
               format_display_name(conv.in_format),
               conv.output.string(),
               format_display_name(conv.out_format));

    if (conv.in_format == conv.out_format) {
        BOOST_LEAF_THROW_EXCEPTION(e_same_format{conv.in_format});
    }
    if (is_same_file(opts.input, conv.output)) {
        BOOST_LEAF_THROW_EXCEPTION(e_same_input_output{conv.output});
    }
    if (opts.if_exists == if_exists::fail) {
        std::error_code ec;
        auto            exists = fs::exists(conv.output, ec);
        if (ec) {
            BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec,
                                                         "Failed to check for an existing output "
                                                         "file"),
                                       e_write_file_path{conv.output});
        }
        if (exists) {
            BOOST_LEAF_THROW_EXCEPTION(e_output_exists{conv.output});
        }
    }

    auto content = read_file(opts.input);
    auto result  = [&] {
        SCRIBE_E_SCOPE(e_read_file_path{opts.input});
        return scribe::convert(content, conv.in_format, conv.out_format);
    }();
    write_file(conv.output, result);
    scribe_log(info, "Wrote {} to {}", opts.input.string(), conv.output.string());
    return 0;
}

}  // namespace scribe::cli::cmd
