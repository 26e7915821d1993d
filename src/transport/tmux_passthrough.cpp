#include "transport/tmux_passthrough.hpp"

#include <format>

TmuxPassthroughTransport::TmuxPassthroughTransport(CommandRunner& runner, std::string tmux_binary)
    : runner_(runner), tmux_binary_(std::move(tmux_binary)) {}

std::expected<void, std::string> TmuxPassthroughTransport::deliver(const BackgroundCommand& cmd) {
    auto payload = escape::background_payload(cmd);
    if (!payload) return std::unexpected(payload.error());

    // base64 never contains a single quote, so plain quoting is enough
    auto shell_cmd = std::format("printf '{}'", escape::tmux_passthrough_format(*payload));

    // execve() rejects any single argument of MAX_ARG_STRLEN bytes or more
    if (shell_cmd.size() + 1 > MAX_ARG_BYTES) {
        return std::unexpected(std::format(
            "background payload of {} bytes exceeds the {} byte argument limit of tmux run-shell",
            payload->size(), MAX_ARG_BYTES));
    }

    auto res = runner_.run({tmux_binary_, "run-shell", shell_cmd});
    if (!res) {
        return std::unexpected(std::format("tmux run-shell failed: {} (payload {} bytes)",
                                           res.error(), payload->size()));
    }
    if (!res->ok()) {
        return std::unexpected(std::format("tmux run-shell exited with code {} (payload {} bytes)",
                                           res->exit_code, payload->size()));
    }
    return {};
}
