#include <catch2/catch_test_macros.hpp>

#include "pricesched/infra/command_runner.hpp"

using namespace pricesched;

TEST_CASE("PopenCommandRunner captures output and exit code", "[command_runner]") {
    infra::PopenCommandRunner runner;

    SECTION("success") {
        auto out = runner.run({"sh", "-c", "echo hello"});
        REQUIRE(out.has_value());
        CHECK(out->ok());
        CHECK(out->output == "hello");
    }

    SECTION("non-zero exit with stderr folded in") {
        auto out = runner.run({"sh", "-c", "echo oops >&2; exit 3"});
        REQUIRE(out.has_value());
        CHECK_FALSE(out->ok());
        CHECK(out->exit_code == 3);
        CHECK(out->output == "oops");
    }

    SECTION("arguments are passed verbatim") {
        auto out = runner.run({"printf", "%s", "it's a $HOME; test"});
        REQUIRE(out.has_value());
        CHECK(out->output == "it's a $HOME; test");
    }

    SECTION("missing program reports 127") {
        auto out = runner.run({"pricesched-no-such-binary-xyz"});
        REQUIRE(out.has_value());
        CHECK(out->exit_code == 127);
    }
}

TEST_CASE("PopenCommandRunner caps captured output", "[command_runner]") {
    infra::PopenCommandRunner runner(16);
    auto out = runner.run({"sh", "-c", "i=0; while [ $i -lt 100 ]; do printf 0123456789; i=$((i+1)); done"});
    REQUIRE(out.has_value());
    CHECK(out->ok());
    CHECK(out->output.size() == 16);
}

TEST_CASE("PopenCommandRunner rejects an empty command", "[command_runner]") {
    infra::PopenCommandRunner runner;
    auto out = runner.run({});
    REQUIRE_FALSE(out.has_value());
    CHECK(out.error().code() == ErrorCode::InvalidArgument);
}
