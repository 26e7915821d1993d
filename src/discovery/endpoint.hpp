#pragma once

#include "discovery/process_introspector.hpp"

#include <chrono>
#include <optional>
#include <string>

// A validated (pid, control socket) pair. Immutable: a different pid,
// address or timestamp means a new instance.
class DiscoveredEndpoint {
public:
    using Clock = std::chrono::steady_clock;

    DiscoveredEndpoint(int pid, std::string socket_path,
                       Clock::time_point validated_at = Clock::now());

    int pid() const { return pid_; }

    // Scheme-prefixed transport address, e.g. "unix:/tmp/kitty-1234".
    const std::string& socket_path() const { return socket_path_; }

    Clock::time_point validated_at() const { return validated_at_; }

    bool operator==(const DiscoveredEndpoint&) const = default;

private:
    int pid_;
    std::string socket_path_;
    Clock::time_point validated_at_;
};

// Where the terminal puts its control socket for a given pid:
// <scheme>:<dir>/<app>-<pid>
struct SocketLayout {
    std::string scheme = "unix";
    std::string dir = "/tmp";
    std::string app = "kitty";

    std::string file_for(int pid) const;
    std::string address_for(int pid) const;

    // Filesystem path of an address, with any "<scheme>:" prefix removed.
    std::string file_of(const std::string& address) const;
};

// Confirms that a candidate still runs the target application and that its
// socket file exists.
class EndpointValidator {
public:
    EndpointValidator(const ProcessIntrospector& introspector, SocketLayout layout);

    bool validate(const DiscoveredEndpoint& endpoint) const;

    // Builds the endpoint for `pid` and validates it.
    std::optional<DiscoveredEndpoint> make(int pid) const;

    const SocketLayout& layout() const { return layout_; }

private:
    const ProcessIntrospector& introspector_;
    SocketLayout layout_;
};
