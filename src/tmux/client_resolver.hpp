#pragma once

#include "platform/command_runner.hpp"

#include <optional>
#include <string>
#include <vector>

struct TmuxClient {
    int pid = 0;
    std::string session_id; // without the leading '$'
};

// Maps the session we run in ($TMUX) to the PID of an attached tmux client.
class SessionClientResolver {
public:
    explicit SessionClientResolver(CommandRunner& runner, std::string tmux_binary = "tmux");

    // `descriptor` is the value of $TMUX: "<socket>,<server-pid>,<session-index>".
    // Falls back to any attached client when none is on our session.
    std::optional<int> resolve(const std::string& descriptor);

    // Session token of a descriptor: nullopt if it is not a tmux descriptor,
    // empty if it carries no session field.
    static std::optional<std::string> session_token(const std::string& descriptor);

    // Parses `list-clients -F "#{client_pid} #{session_id}"` output.
    static std::vector<TmuxClient> parse_clients(const std::string& listing);

    static std::optional<int> pick_client(const std::vector<TmuxClient>& clients,
                                          const std::string& token);

private:
    CommandRunner& runner_;
    std::string tmux_binary_;
};
