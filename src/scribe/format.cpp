#include "./format.hpp"

#include <scribe/dym.hpp>
#include <scribe/error/errors.hpp>
#include <scribe/error/on_error.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/assert.hpp>
#include <neo/utility.hpp>

#include <algorithm>
#include <cctype>

using namespace scribe;

namespace {

std::string lowercase(std::string_view sv) {
    std::string ret{sv};
    std::ranges::transform(ret, ret.begin(), [](unsigned char c) { return std::tolower(c); });
    return ret;
}

// Beyond this many edits, a suggestion is more confusing than helpful
constexpr std::size_t max_suggestion_distance = 2;

[[noreturn]] void throw_unsupported(std::string_view given) {
    e_unsupported_format err{std::string(given)};
    auto                 name = lowercase(given);
    if (name.starts_with('.')) {
        name.erase(0, 1);
    }
    auto cand = did_you_mean(name, {"json", "yaml", "yml", "toml"});
    if (cand && lev_edit_distance(*cand, name) <= max_suggestion_distance) {
        err.did_you_mean = *cand;
    }
    BOOST_LEAF_THROW_EXCEPTION(err);
}

}  // namespace

std::string_view scribe::format_display_name(file_format f) noexcept {
    switch (f) {
    case file_format::json:
        return "JSON";
    case file_format::yaml:
        return "YAML";
    case file_format::toml:
        return "TOML";
    }
    neo::unreachable();
}

std::string_view scribe::canonical_extension(file_format f) noexcept {
    switch (f) {
    case file_format::json:
        return "json";
    case file_format::yaml:
        return "yml";
    case file_format::toml:
        return "toml";
    }
    neo::unreachable();
}

std::optional<file_format> scribe::format_from_name(std::string_view name) noexcept {
    auto lower = lowercase(name);
    if (lower == "json") {
        return file_format::json;
    } else if (lower == neo::oper::any_of("yaml", "yml")) {
        return file_format::yaml;
    } else if (lower == "toml") {
        return file_format::toml;
    }
    return std::nullopt;
}

std::optional<file_format> scribe::format_from_extension(const std::filesystem::path& p) noexcept {
    auto ext = p.extension().string();
    if (ext.size() < 2) {
        // No extension, or just a trailing dot
        return std::nullopt;
    }
    return format_from_name(std::string_view(ext).substr(1));
}

file_format scribe::resolve_format_name(std::string_view name) {
    auto fmt = format_from_name(name);
    if (!fmt) {
        throw_unsupported(name);
    }
    return *fmt;
}

file_format scribe::resolve_format(const std::filesystem::path&      p,
                                   const std::optional<std::string>& override_name) {
    if (override_name) {
        return resolve_format_name(*override_name);
    }
    SCRIBE_E_SCOPE(p);
    auto fmt = format_from_extension(p);
    if (!fmt) {
        throw_unsupported(p.extension().string());
    }
    return *fmt;
}

std::filesystem::path scribe::with_format_extension(std::filesystem::path p,
                                                    file_format           f) noexcept {
    p.replace_extension(canonical_extension(f));
    return p;
}
