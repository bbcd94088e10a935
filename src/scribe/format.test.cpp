#include "./format.hpp"

#include <scribe/error/errors.hpp>
#include <scribe/error/try_catch.hpp>
#include <scribe/scribe.test.hpp>

#include <catch2/catch.hpp>

using scribe::file_format;

TEST_CASE("Infer formats from extensions") {
    auto [given, expect] = GENERATE(Catch::Generators::table<std::string, file_format>({
        {"data.json", file_format::json},
        {"data.JSON", file_format::json},
        {"dir.d/data.yaml", file_format::yaml},
        {"data.yml", file_format::yaml},
        {"data.YmL", file_format::yaml},
        {"data.toml", file_format::toml},
        {"archive.tar.toml", file_format::toml},
    }));
    CAPTURE(given);
    auto fmt = scribe::format_from_extension(given);
    REQUIRE(fmt);
    CHECK(*fmt == expect);
}

TEST_CASE("Unknown extensions") {
    CHECK_FALSE(scribe::format_from_extension("data.xml"));
    CHECK_FALSE(scribe::format_from_extension("data"));
    CHECK_FALSE(scribe::format_from_extension("data."));
    CHECK_FALSE(scribe::format_from_extension(".json/data"));
}

TEST_CASE("Format names") {
    CHECK(scribe::format_from_name("JSON") == file_format::json);
    CHECK(scribe::format_from_name("yaml") == file_format::yaml);
    CHECK(scribe::format_from_name("Yml") == file_format::yaml);
    CHECK(scribe::format_from_name("toml") == file_format::toml);
    CHECK_FALSE(scribe::format_from_name("xml"));
    CHECK(scribe::format_display_name(file_format::toml) == "TOML");
    CHECK(scribe::canonical_extension(file_format::yaml) == "yml");
}

TEST_CASE("An override takes precedence over the extension") {
    auto fmt = REQUIRES_LEAF_NOFAIL(scribe::resolve_format("data.json", "toml"));
    CHECK(fmt == file_format::toml);
    fmt = REQUIRES_LEAF_NOFAIL(scribe::resolve_format("data.unknown", "YAML"));
    CHECK(fmt == file_format::yaml);
    fmt = REQUIRES_LEAF_NOFAIL(scribe::resolve_format("data.json", std::nullopt));
    CHECK(fmt == file_format::json);
}

TEST_CASE("Unsupported formats suggest a correction") {
    scribe_leaf_try {
        scribe::resolve_format("data.jsno", std::nullopt);
        FAIL_CHECK("Expected an error");
    }
    scribe_leaf_catch(scribe::e_unsupported_format e) {
        CHECK(e.value == ".jsno");
        CHECK(e.did_you_mean == "json");
    }
    scribe_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };

    scribe_leaf_try {
        scribe::resolve_format_name("spreadsheet");
        FAIL_CHECK("Expected an error");
    }
    scribe_leaf_catch(scribe::e_unsupported_format e) {
        CHECK(e.value == "spreadsheet");
        CHECK(e.did_you_mean.empty());
    }
    scribe_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}

TEST_CASE("Derive an output path") {
    CHECK(scribe::with_format_extension("dir/config.json", file_format::yaml) == "dir/config.yml");
    CHECK(scribe::with_format_extension("config", file_format::toml) == "config.toml");
}
