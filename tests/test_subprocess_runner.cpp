#include <catch2/catch_test_macros.hpp>

#include "platform/linux/subprocess_runner.hpp"

TEST_CASE("SubprocessRunner", "[subprocess]") {
    SubprocessRunner runner;

    SECTION("CapturesStdoutStderrAndExitCode") {
        auto res = runner.run({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"});
        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == 3);
        REQUIRE_FALSE(res->ok());
        REQUIRE(res->out == "out\n");
        REQUIRE(res->err == "err\n");
    }

    SECTION("SuccessfulCommand") {
        auto res = runner.run({"sh", "-c", "printf hello"});
        REQUIRE(res.has_value());
        REQUIRE(res->ok());
        REQUIRE(res->out == "hello");
        REQUIRE(res->err.empty());
    }

    SECTION("MissingBinaryExits127") {
        auto res = runner.run({"definitely-not-a-real-binary-xyz"});
        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == 127);
    }

    SECTION("LargeOutputOnBothStreams") {
        auto res = runner.run({"/bin/sh", "-c",
                               "head -c 200000 /dev/zero; head -c 100000 /dev/zero >&2"});
        REQUIRE(res.has_value());
        REQUIRE(res->ok());
        REQUIRE(res->out.size() == 200000);
        REQUIRE(res->err.size() == 100000);
    }

    SECTION("KilledBySignal") {
        auto res = runner.run({"/bin/sh", "-c", "kill -TERM $$"});
        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == 128 + 15);
    }

    SECTION("EmptyCommandLine") {
        auto res = runner.run({});
        REQUIRE_FALSE(res.has_value());
    }
}
