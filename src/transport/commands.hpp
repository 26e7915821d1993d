#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Any remote-control verb plus its arguments, e.g. {"ls"}. Only the control
// socket can carry these.
struct RemoteCommand {
    std::vector<std::string> args;
};

// Set or clear the window background. This verb has an escape-sequence
// encoding, so it can still be delivered without the control socket.
struct BackgroundCommand {
    enum class Action { Set, Clear };

    Action action = Action::Clear;
    std::string image_path;

    static BackgroundCommand set(std::string image_path) {
        return {Action::Set, std::move(image_path)};
    }
    static BackgroundCommand clear() { return {Action::Clear, {}}; }

    // Arguments for the control socket.
    std::vector<std::string> remote_args() const {
        if (action == Action::Set) return {"set-background-image", image_path};
        return {"set-background-image", "none"};
    }
};

// Whether a command type may fall back to the non-socket transports.
template <typename Command>
inline constexpr bool supports_fallback = false;

template <>
inline constexpr bool supports_fallback<BackgroundCommand> = true;

struct PrimarySocket {
    std::string address;
};
struct MultiplexerPassthrough {};
struct DirectEscapeSequence {};

using Transport = std::variant<PrimarySocket, MultiplexerPassthrough, DirectEscapeSequence>;

inline std::string_view transport_name(const Transport& t) {
    struct Visitor {
        std::string_view operator()(const PrimarySocket&) const { return "control socket"; }
        std::string_view operator()(const MultiplexerPassthrough&) const { return "tmux passthrough"; }
        std::string_view operator()(const DirectEscapeSequence&) const { return "escape sequence"; }
    };
    return std::visit(Visitor{}, t);
}
