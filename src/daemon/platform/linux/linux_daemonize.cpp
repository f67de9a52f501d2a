#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

namespace {

void fork_and_exit_parent() {
    pid_t pid = ::fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        ::_exit(1);
    }
    if (pid > 0) ::_exit(0);
}

} // namespace

void daemonize() {
    fork_and_exit_parent();

    if (::setsid() < 0) {
        std::println(stderr, "setsid() failed: {}", std::strerror(errno));
        ::_exit(1);
    }

    // Second fork so the daemon can never reacquire a controlling terminal.
    fork_and_exit_parent();

    ::umask(077);
    if (::chdir("/") < 0) {
        std::println(stderr, "chdir(/) failed: {}", std::strerror(errno));
    }

    int null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (null_fd >= 0) {
        ::dup2(null_fd, STDIN_FILENO);
        ::dup2(null_fd, STDOUT_FILENO);
        ::dup2(null_fd, STDERR_FILENO);
        if (null_fd > STDERR_FILENO) ::close(null_fd);
    }
}

} // namespace platform
