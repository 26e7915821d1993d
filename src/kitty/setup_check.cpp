#include "kitty/setup_check.hpp"

#include <print>

SetupCheck::SetupCheck(Dispatcher& dispatcher, EndpointCache& cache, WindowQuery& query,
                       DiscoveryEnvironment env, bool in_kitty)
    : dispatcher_(dispatcher), cache_(cache), query_(query),
      env_(std::move(env)), in_kitty_(in_kitty) {}

SetupReport SetupCheck::run() {
    SetupReport report;
    report.in_tmux = env_.session.has_value();
    report.in_kitty = in_kitty_;
    report.pid_hint = env_.pid_hint;

    report.endpoint_was_cached = cache_.get().has_value();
    report.endpoint = dispatcher_.endpoint();

    auto remote = query_.remote_dimensions();
    if (remote) {
        report.remote_dimensions = *remote;
    } else {
        report.remote_error = std::string(error_kind_name(remote.error().kind)) + ": " +
                              remote.error().message;
    }
    report.fallback_dimensions = query_.fallback_dimensions();
    report.fallback_transport = dispatcher_.fallback_transport();
    return report;
}

void SetupCheck::print(const SetupReport& r) {
    std::println("Checking terminal environment...");
    std::println("  tmux session: {}", r.in_tmux ? "yes" : "no");

    if (r.endpoint) {
        std::println("  {} kitty endpoint: pid {}, socket {}",
                     r.endpoint_was_cached ? "Cached" : "Discovered",
                     r.endpoint->pid(), r.endpoint->socket_path());
    } else {
        std::println("  Could not discover a kitty remote-control endpoint");
    }

    if (r.in_kitty) {
        std::println("  Running in kitty");
        if (r.pid_hint) std::println("  KITTY_PID: {}", *r.pid_hint);
    } else {
        std::println("  Not running in kitty; some features may not work");
    }

    if (r.remote_dimensions) {
        const auto& d = *r.remote_dimensions;
        std::println("  Remote control working: {}x{} pixels", d.width, d.height);
        std::println("  Cell dimensions: {:.1f}x{:.1f} pixels", d.cell_width, d.cell_height);
    } else {
        std::println("  Remote control limited: {}", r.remote_error);
        if (r.in_kitty) {
            std::println();
            std::println("  To enable kitty remote control add to ~/.config/kitty/kitty.conf:");
            std::println("    allow_remote_control yes");
            std::println("    listen_on unix:/tmp/kitty");
            std::println("  then restart kitty or reload its config (ctrl+shift+f5).");
            std::println();
        }
        const auto& d = r.fallback_dimensions;
        std::println("  Fallback size: {}x{} pixels ({}x{} cells)", d.width, d.height,
                     d.columns, d.rows);
    }

    std::println("Background transports:");
    std::println("  control socket: {}", r.endpoint ? "available" : "unavailable");
    std::println("  fallback: {}",
                 r.fallback_transport ? transport_name(*r.fallback_transport) : "none");
}
