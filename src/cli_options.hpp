#pragma once

#include <expected>
#include <string>
#include <vector>

// Command line of kitty-pane-bg. Options come before the command; everything
// from the first positional argument on is passed through untouched.
struct CliOptions {
    bool verbose = false;
    bool help = false;
    std::string config_path;
    std::vector<std::string> positional;

    static std::expected<CliOptions, std::string> parse(int argc, const char* const argv[]);
};
