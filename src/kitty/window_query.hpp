#pragma once

#include "config.hpp"
#include "transport/dispatcher.hpp"

#include <cstdint>
#include <expected>
#include <string>

struct WindowDimensions {
    uint32_t width = 0;  // pixels
    uint32_t height = 0; // pixels
    double cell_width = 0.0;
    double cell_height = 0.0;
    uint32_t columns = 0;
    uint32_t rows = 0;
};

// Size of the kitty window we draw backgrounds for.
class WindowQuery {
public:
    WindowQuery(Dispatcher& dispatcher, Config::Dimensions defaults, std::string tty_path);

    // Asks kitty via `ls`. Unparseable output is MalformedResponse and is not retried.
    std::expected<WindowDimensions, DispatchError> remote_dimensions();

    // Terminal size from TIOCGWINSZ (or the configured size) times the configured cell size.
    WindowDimensions fallback_dimensions() const;

    // remote_dimensions(), else fallback_dimensions().
    WindowDimensions dimensions();

    // Parses `kitten @ ls` JSON: first OS window, first tab, first window.
    static std::expected<WindowDimensions, std::string>
    parse_window_list(const std::string& text, const Config::Dimensions& defaults);

private:
    Dispatcher& dispatcher_;
    Config::Dimensions defaults_;
    std::string tty_path_;
};
