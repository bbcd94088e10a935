#include "./main.hpp"

#include <scribe/scribe.test.hpp>
#include <scribe/util/fs/io.hpp>

#include <catch2/catch.hpp>

#include <iostream>
#include <sstream>

namespace {

/// Collect everything written to an iostream until destroyed
class stream_capture {
    std::ostream&      _stream;
    std::ostringstream _buffer;
    std::streambuf*    _prev;

public:
    explicit stream_capture(std::ostream& os)
        : _stream(os)
        , _prev(os.rdbuf(_buffer.rdbuf())) {}

    ~stream_capture() { _stream.rdbuf(_prev); }

    stream_capture(const stream_capture&) = delete;
    stream_capture& operator=(const stream_capture&) = delete;

    std::string str() const { return _buffer.str(); }
};

/// Run in a fresh scratch directory, restoring the working directory afterward
struct scratch_cwd {
    scribe::fs::path prev = scribe::fs::current_path();
    scribe::fs::path path;

    explicit scratch_cwd(std::string_view name)
        : path(scribe::fs::temp_directory_path() / name) {
        scribe::fs::remove_all(path);
        scribe::fs::create_directories(path);
        scribe::fs::current_path(path);
    }

    ~scratch_cwd() {
        std::error_code ec;
        scribe::fs::current_path(prev, ec);
        scribe::fs::remove_all(path, ec);
    }
};

}  // namespace

TEST_CASE("Help is printed on request") {
    stream_capture out{std::cout};
    CHECK(scribe::cli::main_fn("scribe", {"--help"}) == 0);
    auto text = out.str();
    CAPTURE(text);
    CHECK_THAT(text, Catch::StartsWith("Usage: scribe"));
    CHECK_THAT(text, Catch::Contains("--if-exists"));
    CHECK_THAT(text, Catch::Contains("<input>"));
}

TEST_CASE("Malformed command lines are usage errors") {
    stream_capture err{std::cerr};
    std::string    expect;

    SECTION("No input") {
        CHECK(scribe::cli::main_fn("scribe", {}) == 2);
        expect = "Missing required argument";
    }
    SECTION("Unknown option") {
        CHECK(scribe::cli::main_fn("scribe", {"--bogus", "doc.json"}) == 2);
        expect = "Unrecognized argument";
    }
    SECTION("Bad choice for --if-exists") {
        CHECK(scribe::cli::main_fn("scribe", {"--if-exists=sometimes", "doc.json"}) == 2);
        expect = "sometimes";
    }
    SECTION("Option without its value") {
        CHECK(scribe::cli::main_fn("scribe", {"doc.json", "--to"}) == 2);
        expect = "--to";
    }
    SECTION("Too many positionals") {
        CHECK(scribe::cli::main_fn("scribe", {"a.json", "b.yaml", "c.toml"}) == 2);
        expect = "c.toml";
    }

    auto text = err.str();
    CAPTURE(text);
    CHECK_THAT(text, Catch::Contains(expect));
    CHECK_THAT(text, Catch::Contains("Usage: scribe"));
    CHECK_THAT(text, Catch::Contains("scribe --help"));
}

TEST_CASE("A double-dash ends option parsing") {
    scratch_cwd dir{"scribe-cli-dashes"};
    scribe::write_file("-dash.json", R"({"a": [1, 2]})");

    scribe::testing::log_capture logs;
    CHECK(scribe::cli::main_fn("scribe", {"--to=yaml", "--", "-dash.json"}) == 0);
    REQUIRE(scribe::fs::exists("-dash.yml"));
    CHECK_THAT(scribe::read_file("-dash.yml"), Catch::Contains("a:"));
}

TEST_CASE("Conversion failures set the exit code") {
    scratch_cwd dir{"scribe-cli-exit"};
    scribe::write_file("list.json", "[1, 2]");

    scribe::testing::log_capture logs;
    CHECK(scribe::cli::main_fn("scribe", {"list.json", "list.toml"}) == 1);
    CHECK_FALSE(scribe::fs::exists("list.toml"));
    CHECK(scribe::cli::main_fn("scribe", {"--log-level=silent", "list.json", "list.yaml"}) == 0);
    CHECK(logs.str().find("Wrote") == std::string::npos);
}
