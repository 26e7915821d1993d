#pragma once

#include "discovery/endpoint.hpp"
#include "discovery/endpoint_cache.hpp"
#include "discovery/endpoint_discoverer.hpp"
#include "kitty/window_query.hpp"
#include "transport/dispatcher.hpp"

#include <optional>
#include <string>

struct SetupReport {
    bool in_tmux = false;
    bool in_kitty = false;
    std::optional<std::string> pid_hint;

    std::optional<DiscoveredEndpoint> endpoint;
    bool endpoint_was_cached = false;

    std::optional<WindowDimensions> remote_dimensions;
    std::string remote_error; // set when remote_dimensions is empty
    WindowDimensions fallback_dimensions;

    std::optional<Transport> fallback_transport;
};

// Environment diagnosis for `kitty-pane-bg check`. Shares the dispatcher's
// endpoint cache, so a successful check warms it for later commands.
class SetupCheck {
public:
    SetupCheck(Dispatcher& dispatcher, EndpointCache& cache, WindowQuery& query,
               DiscoveryEnvironment env, bool in_kitty);

    SetupReport run();

    static void print(const SetupReport& report);

private:
    Dispatcher& dispatcher_;
    EndpointCache& cache_;
    WindowQuery& query_;
    DiscoveryEnvironment env_;
    bool in_kitty_;
};
