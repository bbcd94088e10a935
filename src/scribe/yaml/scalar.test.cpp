#include "./scalar.hpp"

#include <catch2/catch.hpp>

#include <cmath>

using scribe::value;

TEST_CASE("Resolve plain scalars with the core schema") {
    auto [given, expect] = GENERATE(Catch::Generators::table<std::string, value>({
        {"", nullptr},
        {"~", nullptr},
        {"null", nullptr},
        {"NULL", nullptr},
        {"true", true},
        {"True", true},
        {"FALSE", false},
        // YAML 1.1 booleans are plain strings in the core schema
        {"yes", "yes"},
        {"off", "off"},
        {"tRuE", "tRuE"},
        {"0", 0},
        {"-12", -12},
        {"+12", 12},
        {"0o17", 15},
        {"0x1F", 31},
        {"0xff", 255},
        {"1.5", 1.5},
        {"-.5", -0.5},
        {"1.", 1.0},
        {"1e3", 1000.0},
        {"2.5E-1", 0.25},
        {"9223372036854775808", 9223372036854775808.0},
        {"0x10000000000000000", 18446744073709551616.0},
        {"1_000", "1_000"},
        {"0b101", "0b101"},
        {"1.2.3", "1.2.3"},
        {"hello", "hello"},
        {"12 monkeys", "12 monkeys"},
    }));
    CAPTURE(given);
    auto got = scribe::resolve_plain_scalar(given);
    CHECK(got.get_kind() == expect.get_kind());
    CHECK(got == expect);
}

TEST_CASE("Resolve the special float spellings") {
    CHECK(scribe::resolve_plain_scalar(".inf").as_float() == INFINITY);
    CHECK(scribe::resolve_plain_scalar("+.Inf").as_float() == INFINITY);
    CHECK(scribe::resolve_plain_scalar("-.INF").as_float() == -INFINITY);
    CHECK(std::isnan(scribe::resolve_plain_scalar(".nan").as_float()));
    CHECK(std::isnan(scribe::resolve_plain_scalar(".NaN").as_float()));
    CHECK(scribe::resolve_plain_scalar("inf").is_string());
    CHECK(scribe::resolve_plain_scalar("-.nan").is_string());
}

TEST_CASE("Recognize YAML 1.1 boolean spellings") {
    CHECK(scribe::is_yaml11_bool_spelling("yes"));
    CHECK(scribe::is_yaml11_bool_spelling("Off"));
    CHECK(scribe::is_yaml11_bool_spelling("n"));
    CHECK_FALSE(scribe::is_yaml11_bool_spelling("true"));
    CHECK_FALSE(scribe::is_yaml11_bool_spelling("yep"));
}
