#pragma once

#include "platform/command_runner.hpp"
#include "transport/background_transport.hpp"

#include <cstddef>

// Sends the escape sequence through `tmux run-shell`, for sessions where the
// terminal cannot be reached over its control socket.
class TmuxPassthroughTransport : public BackgroundTransport {
public:
    // Linux MAX_ARG_STRLEN (32 pages), including the terminating NUL.
    static constexpr size_t MAX_ARG_BYTES = 32 * 4096;

    explicit TmuxPassthroughTransport(CommandRunner& runner, std::string tmux_binary = "tmux");

    std::expected<void, std::string> deliver(const BackgroundCommand& cmd) override;

private:
    CommandRunner& runner_;
    std::string tmux_binary_;
};
