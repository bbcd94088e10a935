#include "./emit.hpp"

#include "./parse.hpp"

#include <scribe/error/errors.hpp>
#include <scribe/error/try_catch.hpp>
#include <scribe/scribe.test.hpp>

#include <catch2/catch.hpp>

#include <limits>
#include <string>
#include <vector>

using scribe::mapping;
using scribe::value;

namespace {

/// Emit the document, and check that it reads back as the same value
std::string emit_and_reparse(const value& doc) {
    auto str = REQUIRES_LEAF_NOFAIL(scribe::emit_toml(doc));
    CAPTURE(str);
    auto back = REQUIRES_LEAF_NOFAIL(scribe::parse_toml(str));
    CHECK(back == doc);
    return str;
}

}  // namespace

TEST_CASE("Emit plain keys") {
    auto doc = value(mapping{
        {"name", "scribe"},
        {"count", 3},
        {"ratio", 1.0},
        {"enabled", false},
        {"list", value::sequence_type{1, "two"}},
        {"empty", mapping{}},
    });
    auto str = emit_and_reparse(doc);
    CHECK_THAT(str, Catch::Contains("name = \"scribe\""));
    CHECK_THAT(str, Catch::Contains("count = 3"));
    CHECK_THAT(str, Catch::Contains("enabled = false"));
    // Key order survives the trip
    auto back = REQUIRES_LEAF_NOFAIL(scribe::parse_toml(str));
    std::vector<std::string> keys;
    for (auto& entry : back.as_mapping()) {
        keys.push_back(entry.first);
    }
    CHECK(keys == std::vector<std::string>{"name", "count", "ratio", "enabled", "list", "empty"});
}

TEST_CASE("Plain keys are written before tables") {
    auto doc = value(mapping{
        {"server", mapping{{"host", "localhost"}, {"port", 8080}}},
        {"title", "example"},
    });
    auto str = REQUIRES_LEAF_NOFAIL(scribe::emit_toml(doc));
    CAPTURE(str);
    auto title_pos  = str.find("title = \"example\"");
    auto server_pos = str.find("[server]");
    REQUIRE(title_pos != std::string::npos);
    REQUIRE(server_pos != std::string::npos);
    CHECK(title_pos < server_pos);
    CHECK(REQUIRES_LEAF_NOFAIL(scribe::parse_toml(str)) == doc);
}

TEST_CASE("Sequences of mappings become arrays of tables") {
    auto doc = value(mapping{
        {"a", value::sequence_type{mapping{{"b", 1}}, mapping{{"b", 2}}}},
    });
    auto str = emit_and_reparse(doc);
    CHECK_THAT(str, Catch::Contains("[[a]]"));
}

TEST_CASE("Nested tables") {
    auto doc = value(mapping{
        {"outer", mapping{{"inner", mapping{{"x", 1}}}}},
        {"fruit",
         value::sequence_type{
             mapping{{"name", "apple"}, {"physical", mapping{{"color", "red"}}}},
             mapping{{"name", "banana"}},
         }},
    });
    auto str = emit_and_reparse(doc);
    CHECK_THAT(str, Catch::Contains("[outer.inner]"));
    CHECK_THAT(str, Catch::Contains("[[fruit]]"));
}

TEST_CASE("Mixed sequences are written inline") {
    auto doc = value(mapping{
        {"mixed", value::sequence_type{mapping{{"a", 1}}, 2}},
    });
    auto str = emit_and_reparse(doc);
    CHECK_THAT(str, Catch::Contains("mixed = ["));
}

TEST_CASE("Keys that are not bare are quoted") {
    auto doc = value(mapping{
        {"bare-key_1", 1},
        {"with space", 2},
        {"dotted.key", 3},
        {"", 4},
        {"table key", mapping{{"x", 5}}},
    });
    auto str = emit_and_reparse(doc);
    CHECK_THAT(str, Catch::Contains("bare-key_1 = 1"));
    CHECK_THAT(str, Catch::Contains("\"with space\""));
    CHECK_THAT(str, Catch::Contains("\"dotted.key\""));
}

TEST_CASE("Strings are escaped") {
    auto doc = value(mapping{{"s", "quote \" slash \\ tab \t newline \n bell \x07"}});
    emit_and_reparse(doc);
}

TEST_CASE("Special floats") {
    auto doc = value(mapping{
        {"pos", std::numeric_limits<double>::infinity()},
        {"neg", -std::numeric_limits<double>::infinity()},
        {"big", 1e20},
        {"tenth", 0.1},
    });
    auto str = emit_and_reparse(doc);
    CHECK_THAT(str, Catch::Contains("pos = inf"));
    CHECK_THAT(str, Catch::Contains("neg = -inf"));
    auto back = REQUIRES_LEAF_NOFAIL(scribe::parse_toml(str));
    CHECK(back.as_mapping().at("big").is_float());
}

TEST_CASE("A TOML document must be a mapping") {
    auto root = GENERATE(value(value::sequence_type{1, 2, 3}), value(12), value("text"));
    scribe_leaf_try {
        scribe::emit_toml(root);
        FAIL_CHECK("Expected an error");
    }
    scribe_leaf_catch(scribe::e_unrepresentable e) {
        CHECK(e.type_name == scribe::kind_name(root.get_kind()));
        CHECK_THAT(e.reason, Catch::Contains("TOML"));
    }
    scribe_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}

TEST_CASE("Null cannot be written as TOML") {
    auto doc = value(mapping{{"server", mapping{{"ports", value::sequence_type{80, nullptr}}}}});
    scribe_leaf_try {
        scribe::emit_toml(doc);
        FAIL_CHECK("Expected an error");
    }
    scribe_leaf_catch(scribe::e_unrepresentable e, scribe::e_value_path path) {
        CHECK(e.type_name == "null");
        CHECK(path.value == "server.ports[1]");
    }
    scribe_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}

TEST_CASE("TOML round-trip") {
    auto doc = value(mapping{
        {"title", "TOML round-trip"},
        {"int", -7},
        {"float", 0.1},
        {"nested", mapping{{"list", value::sequence_type{value::sequence_type{1}, "x"}}}},
        {"servers",
         value::sequence_type{
             mapping{{"name", "alpha"}, {"meta", mapping{{"tags", value::sequence_type{}}}}},
             mapping{},
         }},
    });
    auto text = REQUIRES_LEAF_NOFAIL(scribe::emit_toml(doc));
    CAPTURE(text);
    auto back = REQUIRES_LEAF_NOFAIL(scribe::parse_toml(text));
    CHECK(back == doc);
}
