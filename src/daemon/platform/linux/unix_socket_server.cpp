#include "platform/linux/unix_socket_server.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <string_view>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::fail(const char* what) {
    std::println(stderr, "ipc: {} failed: {}", what, std::strerror(errno));
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
    return false;
}

bool UnixSocketServer::start(const std::string& endpoint) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long: {}", endpoint);
        return false;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    // A socket left behind by a crashed daemon would make bind() fail.
    ::unlink(endpoint.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) return fail("socket()");
    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return fail("bind()");
    }
    if (::listen(server_fd_, 8) < 0) return fail("listen()");

    socket_path_ = endpoint;
    return true;
}

void UnixSocketServer::stop() {
    for (auto& [fd, _] : partial_) ::close(fd);
    partial_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    partial_[fd].clear();
    return fd;
}

bool UnixSocketServer::read_commands(int client_fd, std::vector<nlohmann::json>& cmds) {
    auto it = partial_.find(client_fd);
    if (it == partial_.end()) return false;
    std::string& pending = it->second;

    bool open = true;
    char buf[4096];
    while (true) {
        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n > 0) {
            pending.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
        // EOF or a hard error: still hand over whatever full lines arrived.
        open = false;
        break;
    }

    size_t start = 0;
    for (size_t nl; (nl = pending.find('\n', start)) != std::string::npos; start = nl + 1) {
        std::string_view line(pending.data() + start, nl - start);
        if (line.empty()) continue;

        auto cmd = nlohmann::json::parse(line, nullptr, false);
        if (cmd.is_discarded() || !cmd.is_object()) {
            std::println(stderr, "ipc: ignoring malformed command");
            continue;
        }
        cmds.push_back(std::move(cmd));
    }
    pending.erase(0, start);

    if (pending.size() > kMaxLineBytes) {
        std::println(stderr, "ipc: client sent an overlong line, dropping it");
        return false;
    }
    return open;
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    std::string msg = response.dump() + "\n";
    size_t off = 0;
    while (off < msg.size()) {
        ssize_t sent = ::send(client_fd, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(sent);
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    if (partial_.erase(client_fd) > 0) ::close(client_fd);
}
