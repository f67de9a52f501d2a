#pragma once

#include "provider.hpp"

#include <string>

// Whisper transcription over HTTP. api_format "openai" covers OpenAI and
// Groq (POST {url}/audio/transcriptions with a bearer key); "whisper.cpp"
// targets a LAN whisper.cpp server (POST {url}/inference).
class WhisperProvider : public TranscriptionProvider {
public:
    WhisperProvider(std::string name, std::string url, std::string api_format,
                    std::string model, std::string api_key);
    ~WhisperProvider() override;

    WhisperProvider(const WhisperProvider&) = delete;
    WhisperProvider& operator=(const WhisperProvider&) = delete;

    const std::string& name() const override { return name_; }

    std::expected<std::string, ProviderError>
        transcribe(const AudioSegment& segment, const TranscribeRequest& request,
                   std::stop_token stop) override;

private:
    std::string name_;
    std::string url_;
    std::string api_format_;
    std::string model_;
    std::string api_key_;
};

// Trims surrounding whitespace from provider text.
std::string trim_transcript(std::string text);
