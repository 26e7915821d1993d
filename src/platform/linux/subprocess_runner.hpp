#pragma once

#include "platform/command_runner.hpp"

class SubprocessRunner : public CommandRunner {
public:
    std::expected<CommandResult, std::string> run(const std::vector<std::string>& argv) override;
};
