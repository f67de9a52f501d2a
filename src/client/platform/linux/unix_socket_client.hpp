#pragma once

#include "platform/ipc_client.hpp"

#include <string>

// Blocking client side of the daemon's line protocol.
class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient() = default;
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send(const nlohmann::json& cmd) override;
    bool recv(nlohmann::json& response,
              Timeout timeout = std::chrono::seconds(30)) override;
    void close() override;

    bool is_connected() const { return fd_ >= 0; }

private:
    // Pops one complete line from buf_ into response.
    bool take_line(nlohmann::json& response);

    int fd_ = -1;
    std::string buf_;  // bytes received past the last full line
};
