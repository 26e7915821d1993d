#include "transport/background_transport.hpp"

#include "transport/base64.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace escape {

std::expected<std::string, std::string> background_payload(const BackgroundCommand& cmd) {
    if (cmd.action == BackgroundCommand::Action::Clear) return std::string();

    std::error_code ec;
    if (!fs::is_regular_file(cmd.image_path, ec)) {
        return std::unexpected("image is not a regular file: " + cmd.image_path);
    }
    auto size = fs::file_size(cmd.image_path, ec);
    if (ec) {
        return std::unexpected("failed to stat image file " + cmd.image_path + ": " + ec.message());
    }

    std::ifstream f(cmd.image_path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected("failed to read image file " + cmd.image_path);
    }

    // istream::read turns a filebuf error into badbit instead of throwing
    std::string bytes(size, '\0');
    f.read(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (f.bad() || f.gcount() != static_cast<std::streamsize>(bytes.size())) {
        return std::unexpected("failed to read image file " + cmd.image_path);
    }
    return base64::encode(bytes);
}

std::string osc20(std::string_view payload) {
    std::string seq = "\x1b]20;";
    seq += payload;
    seq += "\x1b\\";
    return seq;
}

std::string tmux_passthrough_format(std::string_view payload) {
    // ESC P tmux; ESC ESC ] 20 ; <payload> ESC ESC \ ESC \  (inner ESCs doubled)
    std::string fmt = R"(\033Ptmux;\033\033]20;)";
    fmt += payload;
    fmt += R"(\033\033\\\033\\)";
    return fmt;
}

} // namespace escape
