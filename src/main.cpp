#include "cli_options.hpp"
#include "config.hpp"
#include "discovery/ancestor_walker.hpp"
#include "discovery/endpoint.hpp"
#include "discovery/endpoint_cache.hpp"
#include "discovery/endpoint_discoverer.hpp"
#include "discovery/process_introspector.hpp"
#include "kitty/setup_check.hpp"
#include "kitty/window_query.hpp"
#include "platform/linux/procfs_process_table.hpp"
#include "platform/linux/subprocess_runner.hpp"
#include "tmux/client_resolver.hpp"
#include "transport/direct_escape.hpp"
#include "transport/dispatcher.hpp"
#include "transport/remote_control.hpp"
#include "transport/tmux_passthrough.hpp"

#include <chrono>
#include <cstdlib>
#include <print>
#include <string>
#include <vector>

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <command> [args]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  check                  Check tmux / kitty remote control setup");
    std::println(stderr, "  set-background IMAGE   Set IMAGE as the kitty background");
    std::println(stderr, "  clear                  Clear the kitty background");
    std::println(stderr, "  dimensions             Print the kitty window size");
    std::println(stderr, "  remote ARGS...         Run a kitty remote-control command");
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH      Config file path");
    std::println(stderr, "  -v, --verbose          Enable verbose logging");
    std::println(stderr, "  -h, --help             Show this help");
}

int main(int argc, char* argv[]) {
    auto opts = CliOptions::parse(argc, argv);
    if (!opts) {
        std::println(stderr, "Error: {}", opts.error());
        usage(argv[0]);
        return 1;
    }
    if (opts->help) {
        usage(argv[0]);
        return 0;
    }
    if (opts->positional.empty()) {
        usage(argv[0]);
        return 1;
    }

    bool verbose = opts->verbose;
    const auto& config_path = opts->config_path;
    const auto& positional = opts->positional;
    std::string command = positional.front();

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);

    ProcfsProcessTable processes;
    SubprocessRunner runner;

    ProcessIntrospector introspector(processes, config.terminal.app, config.terminal.self_name);
    AncestorWalker walker(introspector, config.discovery.max_ancestor_hops);
    SessionClientResolver resolver(runner, config.multiplexer.binary);
    EndpointValidator validator(introspector, SocketLayout{
        .scheme = config.terminal.socket_scheme,
        .dir = config.terminal.socket_dir,
        .app = config.terminal.app,
    });

    auto env = DiscoveryEnvironment::from_process(config.terminal.pid_env, config.multiplexer.env);
    EndpointDiscoverer discoverer(introspector, walker, resolver, validator, env, verbose);
    EndpointCache cache(validator, std::chrono::seconds(config.discovery.cache_ttl_seconds));

    RemoteControlClient remote(runner, config.terminal.remote_binary);
    TmuxPassthroughTransport passthrough(runner, config.multiplexer.binary);
    DirectEscapeTransport direct(config.terminal.tty);

    Dispatcher dispatcher(cache, [&discoverer] { return discoverer.discover(); }, remote,
                          Dispatcher::Fallbacks{
                              .passthrough = env.session ? &passthrough : nullptr,
                              .direct = &direct,
                          },
                          verbose);
    WindowQuery query(dispatcher, config.dimensions, config.terminal.tty);

    if (command == "check") {
        SetupCheck check(dispatcher, cache, query, env, std::getenv("KITTY_WINDOW_ID") != nullptr);
        SetupCheck::print(check.run());
        return 0;
    }

    if (command == "set-background") {
        if (positional.size() < 2) {
            usage(argv[0]);
            return 1;
        }
        auto res = dispatcher.dispatch(BackgroundCommand::set(positional[1]));
        if (!res) {
            // Not fatal: the pane layout just keeps its previous background
            std::println(stderr, "Failed to set kitty background ({}): {}",
                         error_kind_name(res.error().kind), res.error().message);
            std::println(stderr, "Check the kitty remote control setup with '{} check'.", argv[0]);
            return 0;
        }
        if (verbose) std::println(stderr, "[kitty-pane-bg] background set via {}", transport_name(res->via));
        return 0;
    }

    if (command == "clear") {
        auto res = dispatcher.dispatch(BackgroundCommand::clear());
        if (!res) {
            std::println(stderr, "Failed to clear kitty background ({}): {}",
                         error_kind_name(res.error().kind), res.error().message);
            return 1;
        }
        std::println("Cleared kitty background");
        return 0;
    }

    if (command == "dimensions") {
        auto d = query.dimensions();
        std::println("{}x{} pixels (cell {:.1f}x{:.1f}, {}x{} cells)",
                     d.width, d.height, d.cell_width, d.cell_height, d.columns, d.rows);
        return 0;
    }

    if (command == "remote") {
        RemoteCommand cmd{{positional.begin() + 1, positional.end()}};
        auto res = dispatcher.dispatch(cmd);
        if (!res) {
            std::println(stderr, "Error ({}): {}", error_kind_name(res.error().kind),
                         res.error().message);
            return 1;
        }
        std::print("{}", res->output);
        return 0;
    }

    std::println(stderr, "Unknown command: {}", command);
    usage(argv[0]);
    return 1;
}
