#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Terminal {
        std::string app = "kitty";            // command-line signature of the terminal
        std::string self_name = "kitty-pane-bg"; // never matched, even though it contains `app`
        std::string remote_binary = "kitten";
        std::string socket_dir = "/tmp";
        std::string socket_scheme = "unix";
        std::string pid_env = "KITTY_PID";
        std::string tty = "/dev/tty";
    } terminal;

    struct Multiplexer {
        std::string binary = "tmux";
        std::string env = "TMUX";
    } multiplexer;

    struct Discovery {
        uint32_t max_ancestor_hops = 20;
        uint32_t cache_ttl_seconds = 600;
    } discovery;

    struct Dimensions {
        double cell_width = 10.0;
        double cell_height = 20.0;
        uint32_t columns = 80;
        uint32_t rows = 24;
    } dimensions;

    static Config load(const std::string& path);
    static Config load_default();
};
