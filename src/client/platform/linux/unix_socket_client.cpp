#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <chrono>
#include <optional>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::~UnixSocketClient() {
    close();
}

bool UnixSocketClient::connect(const std::string& endpoint) {
    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return false;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        ::close(fd_);
        fd_ = -1;
        return false;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd_);
        fd_ = -1;
        return false;
    }
    return true;
}

bool UnixSocketClient::send(const nlohmann::json& cmd) {
    if (fd_ < 0) return false;
    std::string msg = cmd.dump() + "\n";
    ssize_t sent = ::send(fd_, msg.data(), msg.size(), MSG_NOSIGNAL);
    return sent == static_cast<ssize_t>(msg.size());
}

bool UnixSocketClient::take_line(nlohmann::json& response) {
    auto pos = buf_.find('\n');
    if (pos == std::string::npos) return false;
    auto line = buf_.substr(0, pos);
    buf_.erase(0, pos + 1);
    response = nlohmann::json::parse(line, nullptr, false);
    return true;
}

bool UnixSocketClient::recv(nlohmann::json& response, Timeout timeout) {
    if (fd_ < 0) return false;

    using Clock = std::chrono::steady_clock;
    std::optional<Clock::time_point> deadline;
    if (timeout) deadline = Clock::now() + *timeout;

    pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};

    while (!take_line(response)) {
        int wait_ms = -1;
        if (deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - Clock::now());
            if (left.count() <= 0) return false;
            wait_ms = static_cast<int>(left.count());
        }

        int ret = ::poll(&pfd, 1, wait_ms);
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) return false;

        char tmp[4096];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;

        buf_.append(tmp, static_cast<size_t>(n));
    }
    return !response.is_discarded();
}

void UnixSocketClient::close() {
    buf_.clear();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}
