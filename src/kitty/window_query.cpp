#include "kitty/window_query.hpp"

#include <algorithm>
#include <fcntl.h>
#include <limits>
#include <nlohmann/json.hpp>
#include <print>
#include <sys/ioctl.h>
#include <unistd.h>

using json = nlohmann::json;

namespace {

uint32_t to_pixels(double v) {
    return static_cast<uint32_t>(std::clamp(v, 0.0, double(std::numeric_limits<uint32_t>::max())));
}

WindowDimensions from_grid(uint32_t columns, uint32_t rows, double cell_w, double cell_h) {
    return {
        .width = to_pixels(columns * cell_w),
        .height = to_pixels(rows * cell_h),
        .cell_width = cell_w,
        .cell_height = cell_h,
        .columns = columns,
        .rows = rows,
    };
}

bool plausible_cell(double v) {
    return v > 0.0 && v < 50.0;
}

// Grid sizes as kitty reports them: unsigned 16-bit, anything else is 0.
uint32_t grid_size(const json& window, const char* key) {
    if (!window.contains(key)) return 0;
    const auto& v = window[key];
    if (!v.is_number_unsigned() || v.get<uint64_t>() > std::numeric_limits<uint16_t>::max()) return 0;
    return v.get<uint32_t>();
}

} // namespace

WindowQuery::WindowQuery(Dispatcher& dispatcher, Config::Dimensions defaults, std::string tty_path)
    : dispatcher_(dispatcher), defaults_(defaults), tty_path_(std::move(tty_path)) {}

std::expected<WindowDimensions, DispatchError> WindowQuery::remote_dimensions() {
    auto out = dispatcher_.dispatch(RemoteCommand{{"ls"}});
    if (!out) return std::unexpected(out.error());

    auto dims = parse_window_list(out->output, defaults_);
    if (!dims) {
        return std::unexpected(DispatchError{DispatchErrorKind::MalformedResponse, dims.error()});
    }
    return *dims;
}

WindowDimensions WindowQuery::fallback_dimensions() const {
    uint32_t columns = defaults_.columns;
    uint32_t rows = defaults_.rows;

    int fd = ::open(tty_path_.c_str(), O_RDONLY | O_NOCTTY | O_CLOEXEC);
    if (fd >= 0) {
        winsize ws{};
        if (::ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
            columns = ws.ws_col;
            rows = ws.ws_row;
        }
        ::close(fd);
    }

    return from_grid(columns, rows, defaults_.cell_width, defaults_.cell_height);
}

WindowDimensions WindowQuery::dimensions() {
    auto remote = remote_dimensions();
    if (remote) return *remote;

    std::println(stderr, "Warning: kitty remote control failed ({}: {}), using terminal size",
                 error_kind_name(remote.error().kind), remote.error().message);
    return fallback_dimensions();
}

std::expected<WindowDimensions, std::string>
WindowQuery::parse_window_list(const std::string& text, const Config::Dimensions& defaults) {
    try {
        auto j = json::parse(text);
        if (!j.is_array() || j.empty()) return std::unexpected("no kitty windows found");

        const auto& os_window = j[0];
        if (!os_window.contains("tabs") || !os_window["tabs"].is_array() || os_window["tabs"].empty()) {
            return std::unexpected("no tabs found in kitty window");
        }

        const auto& tab = os_window["tabs"][0];
        if (!tab.contains("windows") || !tab["windows"].is_array() || tab["windows"].empty()) {
            return std::unexpected("no windows found in kitty tab");
        }

        const auto& window = tab["windows"][0];
        auto columns = grid_size(window, "columns");
        auto rows = grid_size(window, "lines");
        if (columns == 0 || rows == 0) {
            return std::unexpected("kitty window reports no grid size");
        }

        double cell_w = defaults.cell_width;
        double cell_h = defaults.cell_height;
        if (os_window.contains("geometry") && os_window["geometry"].is_object()) {
            const auto& g = os_window["geometry"];
            double w = g.value("width", 0.0) / columns;
            double h = g.value("height", 0.0) / rows;
            if (plausible_cell(w) && plausible_cell(h)) {
                cell_w = w;
                cell_h = h;
            }
        }

        return from_grid(columns, rows, cell_w, cell_h);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("failed to parse kitty window list: ") + e.what());
    }
}
