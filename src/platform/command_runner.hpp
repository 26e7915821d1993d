#pragma once

#include <expected>
#include <string>
#include <vector>

struct CommandResult {
    int exit_code = -1;
    std::string out;
    std::string err;

    bool ok() const { return exit_code == 0; }
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Runs argv[0] (looked up in PATH) and collects its output. An error means
    // the child could not be started or reaped; a non-zero exit is a result.
    virtual std::expected<CommandResult, std::string> run(const std::vector<std::string>& argv) = 0;
};
