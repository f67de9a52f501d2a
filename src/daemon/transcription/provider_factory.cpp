#include "provider_factory.hpp"

#include "chat_cleanup.hpp"
#include "whisper_provider.hpp"

#include <cstdlib>

namespace {

std::string env_or_empty(const std::string& name) {
    if (name.empty()) return {};
    const char* v = std::getenv(name.c_str());
    return v ? v : "";
}

} // namespace

ProviderSet build_providers(const Config& config) {
    ProviderSet set;

    for (auto& p : config.ordered_providers()) {
        auto key = env_or_empty(p.api_key_env);
        bool keyless = p.api_format == "whisper.cpp";
        if (key.empty() && !keyless) {
            set.skipped.push_back(p.name);
            continue;
        }

        set.transcribers.push_back(
            std::make_shared<WhisperProvider>(p.name, p.url, p.api_format, p.model, key));

        if (!p.cleanup_model.empty() && !keyless) {
            set.cleaners.push_back(
                std::make_shared<ChatCleanupProvider>(p.name, p.url, p.cleanup_model, key));
        }
    }
    return set;
}
