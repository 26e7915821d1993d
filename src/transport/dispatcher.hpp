#pragma once

#include "discovery/endpoint.hpp"
#include "discovery/endpoint_cache.hpp"
#include "transport/background_transport.hpp"
#include "transport/commands.hpp"
#include "transport/remote_control.hpp"

#include <expected>
#include <functional>
#include <optional>
#include <string>

enum class DispatchErrorKind {
    NotFound,          // no endpoint and no applicable fallback
    TransportFailure,  // every applicable transport failed
    MalformedResponse, // the endpoint answered with something unparseable
};

struct DispatchError {
    DispatchErrorKind kind;
    std::string message;
};

struct DispatchOutput {
    std::string output; // raw stdout of the remote command; empty for fallbacks
    Transport via;
};

using DispatchOutcome = std::expected<DispatchOutput, DispatchError>;

std::string_view error_kind_name(DispatchErrorKind kind);

// Sends commands to the terminal. The control socket is tried first; a
// failure there invalidates the cache and triggers exactly one re-discovery
// and one retry. Background commands then fall back to tmux pass-through
// (inside tmux) or a direct escape sequence.
class Dispatcher {
public:
    using DiscoverFn = std::function<std::optional<DiscoveredEndpoint>()>;

    struct Fallbacks {
        BackgroundTransport* passthrough = nullptr; // set only inside tmux
        BackgroundTransport* direct = nullptr;
    };

    Dispatcher(EndpointCache& cache, DiscoverFn discover, RemoteControlClient& remote,
               Fallbacks fallbacks, bool verbose = false);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    DispatchOutcome dispatch(const RemoteCommand& cmd);
    DispatchOutcome dispatch(const BackgroundCommand& cmd);

    // Live cached endpoint, else a fresh discovery (which is then cached).
    std::optional<DiscoveredEndpoint> endpoint();

    // Which fallback a background command would use, if any.
    std::optional<Transport> fallback_transport() const;

private:
    DispatchOutcome send_primary(const std::vector<std::string>& args);
    DispatchOutcome send_fallback(const BackgroundCommand& cmd, const DispatchError& primary_error);

    void log(const std::string& msg);

    EndpointCache& cache_;
    DiscoverFn discover_;
    RemoteControlClient& remote_;
    Fallbacks fallbacks_;
    bool verbose_;
};
