#include "./parse.hpp"

#include <scribe/error/errors.hpp>
#include <scribe/error/try_catch.hpp>
#include <scribe/scribe.test.hpp>

#include <catch2/catch.hpp>

using scribe::mapping;
using scribe::value;

TEST_CASE("Parse a YAML document") {
    auto data = REQUIRES_LEAF_NOFAIL(scribe::parse_yaml("---\nkey: value\n...\n"));
    CHECK(data == value(mapping{{"key", "value"}}));
}

TEST_CASE("An empty YAML stream is null") {
    CHECK(REQUIRES_LEAF_NOFAIL(scribe::parse_yaml("")).is_null());
    CHECK(REQUIRES_LEAF_NOFAIL(scribe::parse_yaml("# Only a comment\n")).is_null());
}

TEST_CASE("Malformed YAML reports a position") {
    scribe_leaf_try {
        scribe::parse_yaml("a: [1, 2\nb: 3\n");
        FAIL_CHECK("Expected an error");
    }
    scribe_leaf_catch(scribe::e_parse_error, scribe::e_source_position pos) {
        CHECK(pos.line >= 1);
    }
    scribe_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}

TEST_CASE("Tabs must not be used for indentation") {
    scribe_leaf_try {
        scribe::parse_yaml("outer:\n\tinner: 1\n");
        FAIL_CHECK("Expected an error");
    }
    scribe_leaf_catch(scribe::e_parse_error, scribe::e_source_position pos) {
        CHECK(pos.line == 2);
        CHECK(pos.column == 1);
    }
    scribe_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}

TEST_CASE("Tabs are allowed in other places") {
    auto data = REQUIRES_LEAF_NOFAIL(scribe::parse_yaml("a:\t1\n\t# A comment\ntext: |\n  one\ttwo\n"));
    CHECK(data == value(mapping{{"a", 1}, {"text", "one\ttwo\n"}}));
}

TEST_CASE("Tabs may follow the indentation of block scalar content") {
    auto data = REQUIRES_LEAF_NOFAIL(scribe::parse_yaml("script: |\n  all:\n  \techo hi\n"));
    CHECK(data == value(mapping{{"script", "all:\n\techo hi\n"}}));

    auto folded = REQUIRES_LEAF_NOFAIL(
        scribe::parse_yaml("steps:\n  - run: |\n      make\n      \tls\n  - done\n"));
    auto& steps = folded.as_mapping().at("steps").as_sequence();
    REQUIRE(steps.size() == 2);
    CHECK(steps[0] == value(mapping{{"run", "make\n\tls\n"}}));
    CHECK(steps[1] == value("done"));
}

TEST_CASE("A tab before block scalar content is still indentation") {
    scribe_leaf_try {
        scribe::parse_yaml("script: |\n  one\n\ttwo\n");
        FAIL_CHECK("Expected an error");
    }
    scribe_leaf_catch(scribe::e_parse_error, scribe::e_source_position pos) {
        CHECK(pos.line == 3);
    }
    scribe_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}

TEST_CASE("Tabs may separate the items of a multi-line flow collection") {
    auto data = REQUIRES_LEAF_NOFAIL(scribe::parse_yaml("a: [1,\n\t2]\nb: don't [x]\n"));
    CHECK(data == value(mapping{{"a", value::sequence_type{1, 2}}, {"b", "don't [x]"}}));
}

TEST_CASE("Multiple YAML documents are not supported") {
    scribe_leaf_try {
        scribe::parse_yaml("a: 1\n---\nb: 2\n");
        FAIL_CHECK("Expected an error");
    }
    scribe_leaf_catch(scribe::e_unsupported_feature) {}
    scribe_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}
