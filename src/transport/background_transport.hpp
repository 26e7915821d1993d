#pragma once

#include "transport/commands.hpp"

#include <expected>
#include <string>
#include <string_view>

// A fallback channel. It only accepts BackgroundCommand, so arbitrary
// remote verbs cannot be routed here.
class BackgroundTransport {
public:
    virtual ~BackgroundTransport() = default;
    virtual std::expected<void, std::string> deliver(const BackgroundCommand& cmd) = 0;
};

namespace escape {

// Base64 of the image bytes for Set, empty for Clear.
std::expected<std::string, std::string> background_payload(const BackgroundCommand& cmd);

// OSC 20 as raw bytes: ESC ] 20 ; <payload> ESC backslash
std::string osc20(std::string_view payload);

// OSC 20 wrapped in tmux's DCS pass-through, spelled as a printf(1) format
// string with octal escapes.
std::string tmux_passthrough_format(std::string_view payload);

} // namespace escape
