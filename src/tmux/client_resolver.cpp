#include "tmux/client_resolver.hpp"

#include <charconv>
#include <print>
#include <sstream>

SessionClientResolver::SessionClientResolver(CommandRunner& runner, std::string tmux_binary)
    : runner_(runner), tmux_binary_(std::move(tmux_binary)) {}

std::optional<int> SessionClientResolver::resolve(const std::string& descriptor) {
    auto token = session_token(descriptor);
    if (!token) return std::nullopt;

    auto res = runner_.run({tmux_binary_, "list-clients", "-F", "#{client_pid} #{session_id}"});
    if (!res) {
        std::println(stderr, "tmux: list-clients failed: {}", res.error());
        return std::nullopt;
    }
    if (!res->ok()) {
        std::println(stderr, "tmux: list-clients exited with code {}", res->exit_code);
        return std::nullopt;
    }

    return pick_client(parse_clients(res->out), *token);
}

std::optional<std::string> SessionClientResolver::session_token(const std::string& descriptor) {
    std::vector<std::string> fields;
    std::istringstream in(descriptor);
    std::string field;
    while (std::getline(in, field, ',')) fields.push_back(field);

    if (fields.size() < 2) return std::nullopt;
    if (fields.size() < 3) return std::string();
    return fields[2];
}

std::vector<TmuxClient> SessionClientResolver::parse_clients(const std::string& listing) {
    std::vector<TmuxClient> clients;
    std::istringstream lines(listing);
    std::string line;

    while (std::getline(lines, line)) {
        std::istringstream parts(line);
        std::string pid_str;
        std::string session;
        if (!(parts >> pid_str)) continue;
        parts >> session;

        int pid = 0;
        auto [ptr, ec] = std::from_chars(pid_str.data(), pid_str.data() + pid_str.size(), pid);
        if (ec != std::errc() || ptr != pid_str.data() + pid_str.size() || pid <= 0) continue;

        if (session.starts_with('$')) session.erase(0, 1);
        clients.push_back({pid, std::move(session)});
    }

    return clients;
}

std::optional<int> SessionClientResolver::pick_client(const std::vector<TmuxClient>& clients,
                                                      const std::string& token) {
    if (clients.empty()) return std::nullopt;

    if (!token.empty()) {
        for (const auto& c : clients) {
            if (c.session_id == token) return c.pid;
        }
    }

    // Several clients may share a session; any of them leads to a terminal
    return clients.front().pid;
}
