#pragma once

#include "provider.hpp"

#include <string>

// Transcript cleanup through an OpenAI-compatible chat completions endpoint
// (POST {url}/chat/completions).
class ChatCleanupProvider : public TextCleanupProvider {
public:
    ChatCleanupProvider(std::string name, std::string url, std::string model,
                        std::string api_key,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));
    ~ChatCleanupProvider() override;

    ChatCleanupProvider(const ChatCleanupProvider&) = delete;
    ChatCleanupProvider& operator=(const ChatCleanupProvider&) = delete;

    const std::string& name() const override { return name_; }

    std::expected<std::string, ProviderError>
        cleanup(const std::string& text, std::stop_token stop) override;

    static std::string build_request(const std::string& model, const std::string& text);

private:
    std::string name_;
    std::string url_;
    std::string model_;
    std::string api_key_;
    std::chrono::milliseconds timeout_;
};
