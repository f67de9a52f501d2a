#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& obj, const char* key, T& out) {
    if (obj.contains(key)) out = obj[key].get<T>();
}

Config::Provider parse_provider(const json& p) {
    Config::Provider prov;
    read_key(p, "name", prov.name);
    read_key(p, "url", prov.url);
    read_key(p, "api_format", prov.api_format);
    read_key(p, "model", prov.model);
    read_key(p, "cleanup_model", prov.cleanup_model);
    read_key(p, "api_key_env", prov.api_key_env);
    return prov;
}

} // namespace

std::vector<Config::Provider> Config::ordered_providers() const {
    auto out = providers;
    auto it = std::find_if(out.begin(), out.end(),
                           [&](const Provider& p) { return p.name == primary_provider; });
    if (it != out.end()) std::rotate(out.begin(), it, it + 1);
    return out;
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("providers")) {
            std::vector<Provider> providers;
            for (auto& p : j["providers"]) {
                auto prov = parse_provider(p);
                if (prov.name.empty() || prov.url.empty()) {
                    std::println(stderr, "config: skipping provider without name or url");
                    continue;
                }
                providers.push_back(std::move(prov));
            }
            cfg.providers = std::move(providers);
        }
        read_key(j, "primary_provider", cfg.primary_provider);

        if (j.contains("transcription")) {
            auto& t = j["transcription"];
            read_key(t, "language", cfg.transcription.language);
            read_key(t, "prompt", cfg.transcription.prompt);
            read_key(t, "post_process", cfg.transcription.post_process);
            read_key(t, "max_attempts", cfg.transcription.max_attempts);
            read_key(t, "backoff_base_ms", cfg.transcription.backoff_base_ms);
            read_key(t, "backoff_cap_ms", cfg.transcription.backoff_cap_ms);
            read_key(t, "attempt_timeout_s", cfg.transcription.attempt_timeout_s);
            read_key(t, "max_workers", cfg.transcription.max_workers);
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read_key(a, "sample_rate", cfg.audio.sample_rate);
            read_key(a, "channels", cfg.audio.channels);
            read_key(a, "device", cfg.audio.device);
            read_key(a, "min_duration_ms", cfg.audio.min_duration_ms);
            read_key(a, "max_seconds", cfg.audio.max_seconds);
        }

        if (j.contains("chunker")) {
            auto& c = j["chunker"];
            read_key(c, "max_segment_bytes", cfg.chunker.max_segment_bytes);
            read_key(c, "compress", cfg.chunker.compress);
            read_key(c, "bitrate", cfg.chunker.bitrate);
        }

        if (j.contains("output")) {
            read_key(j["output"], "default", cfg.output.default_method);
        }

        if (j.contains("history")) {
            read_key(j["history"], "enabled", cfg.history.enabled);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    if (cfg.transcription.max_attempts == 0) cfg.transcription.max_attempts = 1;
    if (cfg.transcription.max_workers == 0) cfg.transcription.max_workers = 1;
    if (cfg.audio.channels == 0) cfg.audio.channels = 1;

    return cfg;
}

std::string Config::default_path() {
    auto dir = platform::config_dir();
    if (dir.empty()) return {};
    return (fs::path(dir) / "config.json").string();
}

Config Config::load_default() {
    auto path = default_path();
    if (path.empty()) return Config{};

    if (fs::exists(path)) {
        return load(path);
    }
    return Config{};
}
