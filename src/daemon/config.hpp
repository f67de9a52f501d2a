#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Provider {
        std::string name;
        std::string url;
        std::string api_format = "openai"; // "openai" or "whisper.cpp"
        std::string model;
        std::string cleanup_model;         // chat model for post-processing, empty = none
        std::string api_key_env;
    };

    std::vector<Provider> providers = {
        {.name = "groq",
         .url = "https://api.groq.com/openai/v1",
         .api_format = "openai",
         .model = "whisper-large-v3",
         .cleanup_model = "llama-3.3-70b-versatile",
         .api_key_env = "GROQ_API_KEY"},
        {.name = "openai",
         .url = "https://api.openai.com/v1",
         .api_format = "openai",
         .model = "whisper-1",
         .cleanup_model = "gpt-4o-mini",
         .api_key_env = "OPENAI_API_KEY"},
    };
    std::string primary_provider = "groq";

    struct Transcription {
        std::string language = "fr";
        std::string prompt;
        bool post_process = false;
        uint32_t max_attempts = 3;
        uint32_t backoff_base_ms = 1000;
        uint32_t backoff_cap_ms = 4000;
        uint32_t attempt_timeout_s = 60;
        uint32_t max_workers = 3;
    } transcription;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint16_t channels = 1;
        std::string device;
        uint32_t min_duration_ms = 500;
        uint32_t max_seconds = 600;

        // Ring between the PipeWire thread and the accumulator. A few seconds
        // of slack; the accumulator drains it every slice.
        size_t ring_capacity_samples() const {
            return static_cast<size_t>(sample_rate) * channels * 4;
        }
    } audio;

    struct Chunker {
        size_t max_segment_bytes = 25 * 1024 * 1024;
        bool compress = true;
        std::string bitrate = "64k";
    } chunker;

    struct Output {
        std::string default_method = "clipboard";
    } output;

    struct History {
        bool enabled = true;
    } history;

    // Providers in failover order: primary_provider first, the rest in
    // file order.
    std::vector<Provider> ordered_providers() const;

    static Config load(const std::string& path);
    static Config load_default();
    static std::string default_path();
};
