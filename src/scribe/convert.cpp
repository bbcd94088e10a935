#include "./convert.hpp"

#include <scribe/error/errors.hpp>
#include <scribe/error/on_error.hpp>
#include <scribe/json/emit.hpp>
#include <scribe/json/parse.hpp>
#include <scribe/toml/emit.hpp>
#include <scribe/toml/parse.hpp>
#include <scribe/util/log.hpp>
#include <scribe/yaml/emit.hpp>
#include <scribe/yaml/parse.hpp>

#include <boost/leaf/exception.hpp>

#include <algorithm>
#include <array>
#include <ostream>
#include <system_error>

using namespace scribe;

namespace {

const std::array<format_adapter, 3> adapter_table = {{
    {file_format::json, &parse_json, &emit_json},
    {file_format::yaml, &parse_yaml, &emit_yaml},
    {file_format::toml, &parse_toml, &emit_toml},
}};

value parse_stage(const format_adapter& adapter, std::string_view input) {
    SCRIBE_E_SCOPE(conversion_stage::parse);
    SCRIBE_E_SCOPE(e_format{adapter.format});
    scribe_log(debug, "Parsing {} bytes of {}", input.size(), format_display_name(adapter.format));
    return adapter.parse(input);
}

std::string emit_stage(const format_adapter& adapter, const value& doc) {
    SCRIBE_E_SCOPE(conversion_stage::emit);
    SCRIBE_E_SCOPE(e_format{adapter.format});
    scribe_log(debug,
               "Emitting a {} as {}",
               kind_name(doc.get_kind()),
               format_display_name(adapter.format));
    return adapter.emit(doc);
}

}  // namespace

std::span<const format_adapter> scribe::format_adapters() noexcept { return adapter_table; }

const format_adapter& scribe::find_adapter(file_format fmt) {
    auto found = std::ranges::find(adapter_table, fmt, &format_adapter::format);
    if (found == adapter_table.end()) {
        BOOST_LEAF_THROW_EXCEPTION(e_unsupported_format{std::to_string(static_cast<int>(fmt))});
    }
    return *found;
}

std::string scribe::convert(std::string_view input, file_format in, file_format out) {
    auto& parser  = find_adapter(in);
    auto  doc     = parse_stage(parser, input);
    auto& emitter = find_adapter(out);
    auto  result  = emit_stage(emitter, doc);
    scribe_log(debug, "Emitted {} bytes of {}", result.size(), format_display_name(out));
    return result;
}

void scribe::convert(std::string_view input,
                     file_format      in,
                     std::ostream&    sink,
                     file_format      out) {
    auto result = convert(input, in, out);
    sink.write(result.data(), static_cast<std::streamsize>(result.size()));
    if (!sink) {
        BOOST_LEAF_THROW_EXCEPTION(
            std::system_error(std::make_error_code(std::errc::io_error),
                              "Failed to write the converted document"));
    }
}
