#pragma once

#include "platform/command_runner.hpp"

#include <expected>
#include <string>
#include <vector>

// Primary transport: `kitten @ --to <address> <args...>`.
class RemoteControlClient {
public:
    explicit RemoteControlClient(CommandRunner& runner, std::string binary = "kitten");

    // stdout of the remote command, or the diagnostic of a failed call.
    std::expected<std::string, std::string> send(const std::string& address,
                                                 const std::vector<std::string>& args);

private:
    CommandRunner& runner_;
    std::string binary_;
};
