#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

class IpcClient {
public:
    using Timeout = std::optional<std::chrono::milliseconds>;

    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    // Waits for one newline-terminated reply; no timeout waits until the
    // daemon answers or hangs up.
    virtual bool recv(nlohmann::json& response,
                      Timeout timeout = std::chrono::seconds(30)) = 0;
    virtual void close() = 0;
};
