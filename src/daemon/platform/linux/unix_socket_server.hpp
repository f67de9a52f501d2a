#pragma once

#include "platform/ipc_server.hpp"

#include <string>
#include <unordered_map>

// Listening unix stream socket speaking newline-delimited JSON. Each
// accepted client keeps its own partial-line buffer.
class UnixSocketServer : public IpcServer {
public:
    UnixSocketServer() = default;
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    bool read_commands(int client_fd, std::vector<nlohmann::json>& cmds) override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

    size_t client_count() const { return partial_.size(); }

private:
    // A client that sends this much without a newline is dropped.
    static constexpr size_t kMaxLineBytes = 64 * 1024;

    bool fail(const char* what);

    int server_fd_ = -1;
    std::string socket_path_;
    std::unordered_map<int, std::string> partial_;
};
