#include "cli_options.hpp"

std::expected<CliOptions, std::string> CliOptions::parse(int argc, const char* const argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (!opts.positional.empty()) {
            opts.positional.push_back(arg);
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                return std::unexpected(arg + " requires a path");
            }
            opts.config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else {
            opts.positional.push_back(arg);
        }
    }

    return opts;
}
