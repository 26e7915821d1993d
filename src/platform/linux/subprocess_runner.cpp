#include "platform/linux/subprocess_runner.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

// Reads both pipes until the child closes them. Both fds are closed on return;
// false means poll() failed and errno is set.
bool drain(int out_fd, int err_fd, CommandResult& result) {
    pollfd fds[2] = {
        {.fd = out_fd, .events = POLLIN, .revents = 0},
        {.fd = err_fd, .events = POLLIN, .revents = 0},
    };
    std::string* sinks[2] = {&result.out, &result.err};
    int open_fds = 2;

    while (open_fds > 0) {
        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            for (auto& p : fds) {
                if (p.fd >= 0) ::close(p.fd);
            }
            errno = saved;
            return false;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            char buf[4096];
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;

            // EOF or hard error: poll() skips negative fds from here on
            ::close(fds[i].fd);
            fds[i].fd = -1;
            --open_fds;
        }
    }
    return true;
}

} // namespace

std::expected<CommandResult, std::string>
SubprocessRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return std::unexpected("empty command line");
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(errno_message("pipe()"));
    }
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        auto msg = errno_message("pipe()");
        close_pipe(out_pipe);
        return std::unexpected(msg);
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto msg = errno_message("fork()");
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        return std::unexpected(msg);
    }

    if (pid == 0) {
        // Child: no stdin, stdout/stderr into the pipes
        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    CommandResult result;
    bool drained = drain(out_pipe[0], err_pipe[0], result);
    std::string drain_error = drained ? std::string() : errno_message("poll()");

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(errno_message("waitpid()"));
    }

    if (!drained) {
        return std::unexpected(drain_error);
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}
