#include "transport/remote_control.hpp"

#include <format>

RemoteControlClient::RemoteControlClient(CommandRunner& runner, std::string binary)
    : runner_(runner), binary_(std::move(binary)) {}

std::expected<std::string, std::string>
RemoteControlClient::send(const std::string& address, const std::vector<std::string>& args) {
    std::vector<std::string> argv = {binary_, "@", "--to", address};
    argv.insert(argv.end(), args.begin(), args.end());

    auto res = runner_.run(argv);
    if (!res) {
        return std::unexpected(std::format("failed to run {}: {}", binary_, res.error()));
    }
    if (!res->ok()) {
        auto diag = res->err;
        while (!diag.empty() && (diag.back() == '\n' || diag.back() == ' ')) diag.pop_back();
        if (diag.empty()) diag = std::format("{} exited with code {}", binary_, res->exit_code);
        return std::unexpected(diag);
    }
    return std::move(res->out);
}
