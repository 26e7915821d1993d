#include <catch2/catch_test_macros.hpp>

#include "cli_options.hpp"

#include <vector>

namespace {

std::expected<CliOptions, std::string> parse(std::vector<const char*> args) {
    args.insert(args.begin(), "kitty-pane-bg");
    return CliOptions::parse(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST_CASE("CliOptions", "[cli]") {

    SECTION("OptionsBeforeCommand") {
        auto opts = parse({"-v", "--config", "/etc/kpb.json", "set-background", "/tmp/bg.png"});
        REQUIRE(opts.has_value());
        REQUIRE(opts->verbose);
        REQUIRE_FALSE(opts->help);
        REQUIRE(opts->config_path == "/etc/kpb.json");
        REQUIRE(opts->positional == std::vector<std::string>{"set-background", "/tmp/bg.png"});
    }

    SECTION("ArgumentsAfterCommandPassThrough") {
        auto opts = parse({"remote", "ls", "-c", "--help"});
        REQUIRE(opts.has_value());
        REQUIRE(opts->config_path.empty());
        REQUIRE_FALSE(opts->help);
        REQUIRE(opts->positional == std::vector<std::string>{"remote", "ls", "-c", "--help"});
    }

    SECTION("TrailingConfigFlagIsAnError") {
        auto opts = parse({"--config"});
        REQUIRE_FALSE(opts.has_value());
        REQUIRE(opts.error() == "--config requires a path");

        auto short_form = parse({"-v", "-c"});
        REQUIRE_FALSE(short_form.has_value());
        REQUIRE(short_form.error() == "-c requires a path");
    }

    SECTION("Help") {
        auto opts = parse({"-h"});
        REQUIRE(opts.has_value());
        REQUIRE(opts->help);
        REQUIRE(opts->positional.empty());
    }

    SECTION("NoArguments") {
        auto opts = parse({});
        REQUIRE(opts.has_value());
        REQUIRE(opts->positional.empty());
        REQUIRE_FALSE(opts->verbose);
    }
}
