#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& section, const char* key, T& out) {
    if (section.contains(key)) out = section[key].get<T>();
}

// Counts and limits: a non-negative integer that fits in 32 bits.
void read_key(const json& section, const char* key, uint32_t& out) {
    if (!section.contains(key)) return;
    const auto& v = section[key];
    if (!v.is_number_unsigned() || v.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
        std::println(stderr, "config: {} must be a non-negative integer, keeping {}", key, out);
        return;
    }
    out = v.get<uint32_t>();
}

// Pixel sizes: a positive number.
void read_key(const json& section, const char* key, double& out) {
    if (!section.contains(key)) return;
    const auto& v = section[key];
    if (!v.is_number() || !(v.get<double>() > 0.0)) {
        std::println(stderr, "config: {} must be a positive number, keeping {}", key, out);
        return;
    }
    out = v.get<double>();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("terminal")) {
            auto& t = j["terminal"];
            read_key(t, "app", cfg.terminal.app);
            read_key(t, "self_name", cfg.terminal.self_name);
            read_key(t, "remote_binary", cfg.terminal.remote_binary);
            read_key(t, "socket_dir", cfg.terminal.socket_dir);
            read_key(t, "socket_scheme", cfg.terminal.socket_scheme);
            read_key(t, "pid_env", cfg.terminal.pid_env);
            read_key(t, "tty", cfg.terminal.tty);
        }

        if (j.contains("multiplexer")) {
            auto& m = j["multiplexer"];
            read_key(m, "binary", cfg.multiplexer.binary);
            read_key(m, "env", cfg.multiplexer.env);
        }

        if (j.contains("discovery")) {
            auto& d = j["discovery"];
            read_key(d, "max_ancestor_hops", cfg.discovery.max_ancestor_hops);
            read_key(d, "cache_ttl_seconds", cfg.discovery.cache_ttl_seconds);
        }

        if (j.contains("dimensions")) {
            auto& d = j["dimensions"];
            read_key(d, "cell_width", cfg.dimensions.cell_width);
            read_key(d, "cell_height", cfg.dimensions.cell_height);
            read_key(d, "columns", cfg.dimensions.columns);
            read_key(d, "rows", cfg.dimensions.rows);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
