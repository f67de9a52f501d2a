#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace subprocess {

namespace {

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

constexpr int kStopPollMs = 50;

// Waits for the child to exit, killing it once stop is requested.
std::expected<int, std::string> reap(pid_t pid, std::stop_token stop, bool& killed) {
    int status = 0;
    int flags = stop.stop_possible() ? WNOHANG : 0;
    while (true) {
        pid_t r = ::waitpid(pid, &status, flags);
        if (r == pid) return status;
        if (r < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_message("waitpid()"));
        }
        if (stop.stop_requested()) {
            if (::kill(pid, SIGKILL) < 0 && errno != ESRCH) {
                return std::unexpected(errno_message("kill()"));
            }
            killed = true;
            flags = 0;
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kStopPollMs));
    }
}

} // namespace

std::expected<Result, std::string> run(const std::vector<std::string>& argv,
                                       std::string_view input, bool capture_output,
                                       std::stop_token stop) {
    if (argv.empty()) return std::unexpected(std::string("empty command"));

    int in_pipe[2];
    if (::pipe2(in_pipe, O_CLOEXEC) < 0) return std::unexpected(errno_message("pipe()"));

    int out_pipe[2] = {-1, -1};
    if (capture_output && ::pipe2(out_pipe, O_CLOEXEC) < 0) {
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        return std::unexpected(errno_message("pipe()"));
    }

    std::vector<char*> args;
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto err = errno_message("fork()");
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return std::unexpected(err);
    }

    if (pid == 0) {
        ::dup2(in_pipe[0], STDIN_FILENO);
        if (capture_output) ::dup2(out_pipe[1], STDOUT_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(args[0], args.data());
        ::_exit(kExecFailed);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    int write_fd = in_pipe[1];
    int read_fd = out_pipe[0];

    ::fcntl(write_fd, F_SETFL, ::fcntl(write_fd, F_GETFL) | O_NONBLOCK);
    if (input.empty()) close_fd(write_fd);

    Result result;
    size_t written = 0;
    std::string error;

    // Pump stdin and stdout together so neither side can fill a pipe and
    // stall the other.
    const int poll_timeout = stop.stop_possible() ? kStopPollMs : -1;
    bool stopped = false;
    while (write_fd >= 0 || read_fd >= 0) {
        if (stop.stop_requested()) {
            stopped = true;
            break;
        }

        pollfd fds[2];
        nfds_t n = 0;
        if (write_fd >= 0) fds[n++] = {.fd = write_fd, .events = POLLOUT, .revents = 0};
        if (read_fd >= 0) fds[n++] = {.fd = read_fd, .events = POLLIN, .revents = 0};

        if (::poll(fds, n, poll_timeout) < 0) {
            if (errno == EINTR) continue;
            error = errno_message("poll()");
            break;
        }

        for (nfds_t i = 0; i < n; ++i) {
            if (fds[i].revents == 0) continue;

            if (fds[i].fd == write_fd) {
                ssize_t w = ::write(write_fd, input.data() + written, input.size() - written);
                if (w < 0) {
                    if (errno == EINTR || errno == EAGAIN) continue;
                    // EPIPE: the child stopped reading; its exit code tells the rest.
                    close_fd(write_fd);
                    continue;
                }
                written += static_cast<size_t>(w);
                if (written == input.size()) close_fd(write_fd);
            } else {
                char buf[65536];
                ssize_t r = ::read(read_fd, buf, sizeof(buf));
                if (r < 0) {
                    if (errno == EINTR || errno == EAGAIN) continue;
                    error = errno_message("read()");
                    close_fd(read_fd);
                } else if (r == 0) {
                    close_fd(read_fd);
                } else {
                    result.output.append(buf, static_cast<size_t>(r));
                }
            }
        }
        if (!error.empty()) break;
    }

    close_fd(write_fd);
    close_fd(read_fd);

    bool killed = false;
    auto status = reap(pid, stop, killed);
    if (!status) return std::unexpected(status.error());
    if (killed || stopped) return std::unexpected(argv[0] + " stopped before it finished");

    if (!error.empty()) return std::unexpected(error);

    if (WIFEXITED(*status)) {
        result.exit_code = WEXITSTATUS(*status);
    } else if (WIFSIGNALED(*status)) {
        return std::unexpected(argv[0] + " killed by signal " +
                               std::to_string(WTERMSIG(*status)));
    }
    return result;
}

} // namespace subprocess
