#include "discovery/endpoint_discoverer.hpp"

#include <charconv>
#include <cstdlib>
#include <format>
#include <print>

namespace {

std::optional<std::string> env_value(const std::string& name) {
    if (name.empty()) return std::nullopt;
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    return std::string(v);
}

} // namespace

DiscoveryEnvironment DiscoveryEnvironment::from_process(const std::string& pid_env,
                                                        const std::string& session_env) {
    return {.pid_hint = env_value(pid_env), .session = env_value(session_env)};
}

EndpointDiscoverer::EndpointDiscoverer(const ProcessIntrospector& introspector,
                                       const AncestorWalker& walker,
                                       SessionClientResolver& resolver,
                                       const EndpointValidator& validator,
                                       DiscoveryEnvironment env, bool verbose)
    : introspector_(introspector), walker_(walker), resolver_(resolver),
      validator_(validator), env_(std::move(env)), verbose_(verbose) {}

std::optional<DiscoveredEndpoint> EndpointDiscoverer::discover() {
    if (auto ep = from_environment_hint()) return ep;
    if (auto ep = from_multiplexer()) return ep;
    if (auto ep = from_global_scan()) return ep;

    std::println(stderr, "discovery: no {} remote-control endpoint found",
                 introspector_.signature());
    return std::nullopt;
}

std::optional<DiscoveredEndpoint> EndpointDiscoverer::from_environment_hint() {
    if (!env_.pid_hint) return std::nullopt;

    const auto& hint = *env_.pid_hint;
    int pid = 0;
    auto [ptr, ec] = std::from_chars(hint.data(), hint.data() + hint.size(), pid);
    if (ec != std::errc() || ptr != hint.data() + hint.size() || pid <= 0) {
        std::println(stderr, "discovery: ignoring malformed pid hint '{}'", hint);
        return std::nullopt;
    }

    if (!introspector_.matches(pid)) {
        std::println(stderr, "discovery: hinted pid {} is not a {} process",
                     pid, introspector_.signature());
        return std::nullopt;
    }

    return validated(pid, "environment hint");
}

std::optional<DiscoveredEndpoint> EndpointDiscoverer::from_multiplexer() {
    if (!env_.session) return std::nullopt;

    log("searching via tmux client ancestry");
    auto client = resolver_.resolve(*env_.session);
    if (!client) {
        std::println(stderr, "discovery: could not find the tmux client pid");
        return std::nullopt;
    }
    log(std::format("tmux client pid {}", *client));

    auto target = walker_.find_target(*client);
    if (!target) {
        std::println(stderr, "discovery: no {} process above tmux client {}",
                     introspector_.signature(), *client);
        return std::nullopt;
    }

    return validated(*target, "tmux ancestry");
}

std::optional<DiscoveredEndpoint> EndpointDiscoverer::from_global_scan() {
    log("scanning all processes");
    for (int pid : introspector_.find_matching()) {
        // A terminal that hosts our session has at least a shell under it
        if (!introspector_.has_children(pid)) continue;
        return validated(pid, "process scan");
    }
    return std::nullopt;
}

std::optional<DiscoveredEndpoint> EndpointDiscoverer::validated(int pid, const char* strategy) {
    auto ep = validator_.make(pid);
    if (!ep) {
        std::println(stderr, "discovery: {} pid {} has no control socket at {}",
                     strategy, pid, validator_.layout().file_for(pid));
        return std::nullopt;
    }
    log(std::format("{} found pid {} ({})", strategy, pid, ep->socket_path()));
    return ep;
}

void EndpointDiscoverer::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[kitty-pane-bg] discovery: {}", msg);
    }
}
