#include "transport/dispatcher.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

std::string_view error_kind_name(DispatchErrorKind kind) {
    switch (kind) {
        case DispatchErrorKind::NotFound: return "not found";
        case DispatchErrorKind::TransportFailure: return "transport failure";
        case DispatchErrorKind::MalformedResponse: return "malformed response";
    }
    return "unknown";
}

Dispatcher::Dispatcher(EndpointCache& cache, DiscoverFn discover, RemoteControlClient& remote,
                       Fallbacks fallbacks, bool verbose)
    : cache_(cache), discover_(std::move(discover)), remote_(remote),
      fallbacks_(fallbacks), verbose_(verbose) {}

DispatchOutcome Dispatcher::dispatch(const RemoteCommand& cmd) {
    static_assert(!supports_fallback<RemoteCommand>);

    if (cmd.args.empty()) {
        return std::unexpected(DispatchError{DispatchErrorKind::TransportFailure,
                                             "empty remote command"});
    }
    return send_primary(cmd.args);
}

DispatchOutcome Dispatcher::dispatch(const BackgroundCommand& cmd) {
    static_assert(supports_fallback<BackgroundCommand>);

    if (cmd.action == BackgroundCommand::Action::Set) {
        std::error_code ec;
        if (!fs::is_regular_file(cmd.image_path, ec)) {
            return std::unexpected(DispatchError{
                DispatchErrorKind::TransportFailure,
                "image is not a readable file: " + cmd.image_path});
        }
    }

    auto primary = send_primary(cmd.remote_args());
    if (primary) return primary;

    return send_fallback(cmd, primary.error());
}

std::optional<DiscoveredEndpoint> Dispatcher::endpoint() {
    if (auto cached = cache_.get()) {
        log(std::format("using cached endpoint {}", cached->socket_path()));
        return cached;
    }

    auto found = discover_();
    if (found) cache_.set(*found);
    return found;
}

std::optional<Transport> Dispatcher::fallback_transport() const {
    if (fallbacks_.passthrough) return Transport{MultiplexerPassthrough{}};
    if (fallbacks_.direct) return Transport{DirectEscapeSequence{}};
    return std::nullopt;
}

DispatchOutcome Dispatcher::send_primary(const std::vector<std::string>& args) {
    auto ep = endpoint();
    if (!ep) {
        return std::unexpected(DispatchError{DispatchErrorKind::NotFound,
                                             "no remote-control endpoint found"});
    }

    auto first = remote_.send(ep->socket_path(), args);
    if (first) return DispatchOutput{std::move(*first), PrimarySocket{ep->socket_path()}};

    std::println(stderr, "dispatch: {} via {} failed: {}",
                 args.front(), ep->socket_path(), first.error());

    // The endpoint is stale: forget it and rediscover exactly once
    cache_.invalidate();
    auto fresh = discover_();
    if (!fresh) {
        return std::unexpected(DispatchError{DispatchErrorKind::TransportFailure, first.error()});
    }
    cache_.set(*fresh);

    log(std::format("retrying {} via {}", args.front(), fresh->socket_path()));
    auto second = remote_.send(fresh->socket_path(), args);
    if (second) return DispatchOutput{std::move(*second), PrimarySocket{fresh->socket_path()}};

    std::println(stderr, "dispatch: retry via {} failed: {}", fresh->socket_path(), second.error());
    cache_.invalidate();
    return std::unexpected(DispatchError{DispatchErrorKind::TransportFailure, second.error()});
}

DispatchOutcome Dispatcher::send_fallback(const BackgroundCommand& cmd,
                                          const DispatchError& primary_error) {
    auto via = fallback_transport();
    if (!via) return std::unexpected(primary_error);

    BackgroundTransport* transport = fallbacks_.passthrough ? fallbacks_.passthrough
                                                            : fallbacks_.direct;

    std::println(stderr, "dispatch: control socket unavailable ({}), falling back to {}",
                 primary_error.message, transport_name(*via));

    auto res = transport->deliver(cmd);
    if (!res) {
        return std::unexpected(DispatchError{
            DispatchErrorKind::TransportFailure,
            std::format("{}; {} failed: {}", primary_error.message, transport_name(*via), res.error())});
    }
    return DispatchOutput{{}, *via};
}

void Dispatcher::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[kitty-pane-bg] dispatch: {}", msg);
    }
}
