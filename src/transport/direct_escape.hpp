#pragma once

#include "transport/background_transport.hpp"

#include <string>

// Writes OSC 20 straight to the controlling terminal.
class DirectEscapeTransport : public BackgroundTransport {
public:
    explicit DirectEscapeTransport(std::string tty_path = "/dev/tty");

    std::expected<void, std::string> deliver(const BackgroundCommand& cmd) override;

private:
    std::string tty_path_;
};
