#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Command channel between mindscribe-ctl and the daemon: one JSON object per
// line in each direction. All calls are made from the event loop thread.
class IpcServer {
public:
    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    // Readable when a client is waiting to be accepted.
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    // Appends every complete command received from the client. Returns
    // false once the client has disconnected.
    virtual bool read_commands(int client_fd, std::vector<nlohmann::json>& cmds) = 0;
    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
