#pragma once

#include "discovery/ancestor_walker.hpp"
#include "discovery/endpoint.hpp"
#include "discovery/process_introspector.hpp"
#include "tmux/client_resolver.hpp"

#include <optional>
#include <string>

// Environment inputs of discovery, captured once so tests can supply their own.
struct DiscoveryEnvironment {
    std::optional<std::string> pid_hint; // e.g. $KITTY_PID
    std::optional<std::string> session;  // $TMUX

    static DiscoveryEnvironment from_process(const std::string& pid_env,
                                             const std::string& session_env);
};

// Finds the terminal's control endpoint. Strategies run in order and the
// first candidate that validates wins:
//   1. the pid hint from the environment
//   2. the tmux client attached to our session, and its ancestors
//   3. any matching process that has at least one child
class EndpointDiscoverer {
public:
    EndpointDiscoverer(const ProcessIntrospector& introspector, const AncestorWalker& walker,
                       SessionClientResolver& resolver, const EndpointValidator& validator,
                       DiscoveryEnvironment env, bool verbose = false);

    // nullopt when every strategy came up empty.
    std::optional<DiscoveredEndpoint> discover();

    std::optional<DiscoveredEndpoint> from_environment_hint();
    std::optional<DiscoveredEndpoint> from_multiplexer();
    std::optional<DiscoveredEndpoint> from_global_scan();

    const DiscoveryEnvironment& environment() const { return env_; }

private:
    std::optional<DiscoveredEndpoint> validated(int pid, const char* strategy);

    void log(const std::string& msg);

    const ProcessIntrospector& introspector_;
    const AncestorWalker& walker_;
    SessionClientResolver& resolver_;
    const EndpointValidator& validator_;
    DiscoveryEnvironment env_;
    bool verbose_;
};
