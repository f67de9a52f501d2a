#include "whisper_provider.hpp"
#include "http_client.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <string_view>

using json = nlohmann::json;

WhisperProvider::WhisperProvider(std::string name, std::string url, std::string api_format,
                                 std::string model, std::string api_key)
    : name_(std::move(name)), url_(std::move(url)), api_format_(std::move(api_format)),
      model_(std::move(model)), api_key_(std::move(api_key)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

WhisperProvider::~WhisperProvider() {
    curl_global_cleanup();
}

std::expected<std::string, ProviderError>
WhisperProvider::transcribe(const AudioSegment& segment, const TranscribeRequest& request,
                            std::stop_token stop) {
    if (segment.bytes.empty()) {
        return std::unexpected(ProviderError{ProviderErrorKind::BadRequest, 0, "empty segment"});
    }

    std::string_view audio(reinterpret_cast<const char*>(segment.bytes.data()),
                           segment.bytes.size());

    http::Request req;
    req.bearer_token = api_key_;
    req.timeout = request.deadline;
    req.form.push_back({.name = "file", .data = audio,
                        .filename = segment.filename, .mime_type = segment.mime_type});
    req.form.push_back({.name = "response_format", .data = "json",
                        .filename = {}, .mime_type = {}});

    if (api_format_ == "whisper.cpp") {
        req.url = url_ + "/inference";
        req.form.push_back({.name = "temperature", .data = "0.0",
                            .filename = {}, .mime_type = {}});
    } else {
        req.url = url_ + "/audio/transcriptions";
        req.form.push_back({.name = "model", .data = model_,
                            .filename = {}, .mime_type = {}});
    }

    if (!request.language.empty()) {
        req.form.push_back({.name = "language", .data = request.language,
                            .filename = {}, .mime_type = {}});
    }
    if (!request.prompt.empty()) {
        req.form.push_back({.name = "prompt", .data = request.prompt,
                            .filename = {}, .mime_type = {}});
    }

    auto resp = http::post(req, stop);
    if (!resp) return std::unexpected(resp.error());
    if (resp->status < 200 || resp->status >= 300) {
        return std::unexpected(http::classify(*resp));
    }

    try {
        auto j = json::parse(resp->body);
        if (!j.contains("text") || !j["text"].is_string()) {
            if (j.contains("error")) {
                return std::unexpected(ProviderError{
                    ProviderErrorKind::Server, static_cast<int>(resp->status),
                    "server error: " + http::error_message(resp->body)});
            }
            return std::unexpected(ProviderError{ProviderErrorKind::Server,
                                                 static_cast<int>(resp->status),
                                                 "unexpected response: " + resp->body});
        }

        auto text = trim_transcript(j["text"].get<std::string>());
        if (text.empty()) {
            return std::unexpected(ProviderError{ProviderErrorKind::EmptyTranscript,
                                                 static_cast<int>(resp->status),
                                                 name_ + " returned an empty transcription"});
        }
        return text;
    } catch (const json::exception& e) {
        return std::unexpected(ProviderError{ProviderErrorKind::Server,
                                             static_cast<int>(resp->status),
                                             std::string("JSON parse error: ") + e.what()});
    }
}

std::string trim_transcript(std::string text) {
    auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return {};
    auto last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}
