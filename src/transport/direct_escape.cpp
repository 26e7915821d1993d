#include "transport/direct_escape.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

DirectEscapeTransport::DirectEscapeTransport(std::string tty_path)
    : tty_path_(std::move(tty_path)) {}

std::expected<void, std::string> DirectEscapeTransport::deliver(const BackgroundCommand& cmd) {
    auto payload = escape::background_payload(cmd);
    if (!payload) return std::unexpected(payload.error());

    auto seq = escape::osc20(*payload);

    int fd = ::open(tty_path_.c_str(), O_WRONLY | O_NOCTTY | O_CLOEXEC);
    if (fd < 0) {
        return std::unexpected("open(" + tty_path_ + ") failed: " + std::strerror(errno));
    }

    size_t total_written = 0;
    while (total_written < seq.size()) {
        ssize_t n = ::write(fd, seq.data() + total_written, seq.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto msg = std::string("write() failed: ") + std::strerror(errno);
            ::close(fd);
            return std::unexpected(msg);
        }
        total_written += static_cast<size_t>(n);
    }

    ::close(fd);
    return {};
}
