#include "./emit.hpp"

#include "./parse.hpp"

#include <scribe/scribe.test.hpp>

#include <catch2/catch.hpp>

#include <cmath>
#include <limits>

using scribe::mapping;
using scribe::value;

TEST_CASE("Emit block-style YAML") {
    auto doc = value(mapping{
        {"a", 1},
        {"b", value::sequence_type{true, nullptr, "x"}},
    });
    auto str = REQUIRES_LEAF_NOFAIL(scribe::emit_yaml(doc));
    CHECK(str == "a: 1\nb:\n  - true\n  - null\n  - x\n");
}

TEST_CASE("Empty containers use flow style") {
    auto doc = value(mapping{{"seq", value::sequence_type{}}, {"map", mapping{}}});
    auto str = REQUIRES_LEAF_NOFAIL(scribe::emit_yaml(doc));
    CHECK(str == "seq: []\nmap: {}\n");
}

TEST_CASE("Strings that look like other types are quoted") {
    auto given = GENERATE(as<std::string>{},
                          "true",
                          "False",
                          "null",
                          "~",
                          "",
                          "12",
                          "-3.5",
                          "0x1F",
                          ".inf",
                          "yes",
                          "off");
    CAPTURE(given);
    auto doc = value(mapping{{given, given}});
    auto str = REQUIRES_LEAF_NOFAIL(scribe::emit_yaml(doc));
    CAPTURE(str);
    CHECK(str == "\"" + given + "\": \"" + given + "\"\n");
    auto back = REQUIRES_LEAF_NOFAIL(scribe::parse_yaml(str));
    CHECK(back == doc);
}

TEST_CASE("Plain strings are not quoted") {
    auto str = REQUIRES_LEAF_NOFAIL(scribe::emit_yaml(value(mapping{{"name", "scribe"}})));
    CHECK(str == "name: scribe\n");
}

TEST_CASE("Floats are written so they read back as floats") {
    auto doc = value(value::sequence_type{1.0,
                                          0.1,
                                          1e300,
                                          std::numeric_limits<double>::infinity(),
                                          -std::numeric_limits<double>::infinity()});
    auto str = REQUIRES_LEAF_NOFAIL(scribe::emit_yaml(doc));
    CHECK(str == "- 1.0\n- 0.1\n- 1.0e+300\n- .inf\n- -.inf\n");
    auto back = REQUIRES_LEAF_NOFAIL(scribe::parse_yaml(str));
    CHECK(back == doc);

    auto nan_str = REQUIRES_LEAF_NOFAIL(
        scribe::emit_yaml(value(std::numeric_limits<double>::quiet_NaN())));
    CHECK(nan_str == ".nan\n");
    CHECK(std::isnan(REQUIRES_LEAF_NOFAIL(scribe::parse_yaml(nan_str)).as_float()));
}

TEST_CASE("YAML round-trip") {
    auto doc = value(mapping{
        {"title", "A document: with punctuation"},
        {"multi", "line one\nline two"},
        {"count", -42},
        {"ratio", 2.5},
        {"enabled", false},
        {"nothing", nullptr},
        {"items",
         value::sequence_type{
             mapping{{"id", 1}, {"tags", value::sequence_type{"a", "b"}}},
             value::sequence_type{1, value::sequence_type{2}},
             mapping{},
         }},
        {"unicode", "caf\xc3\xa9"},
    });
    auto text = REQUIRES_LEAF_NOFAIL(scribe::emit_yaml(doc));
    CAPTURE(text);
    auto back = REQUIRES_LEAF_NOFAIL(scribe::parse_yaml(text));
    CHECK(back == doc);
}

TEST_CASE("A scalar document") {
    CHECK(REQUIRES_LEAF_NOFAIL(scribe::emit_yaml(value("hello"))) == "hello\n");
    CHECK(REQUIRES_LEAF_NOFAIL(scribe::emit_yaml(value(nullptr))) == "null\n");
}
