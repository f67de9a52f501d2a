#pragma once

#include "../chunker.hpp"
#include "../pipeline_error.hpp"

#include <chrono>
#include <expected>
#include <stop_token>
#include <string>
#include <string_view>

enum class ProviderErrorKind {
    Auth,             // 401/403
    BadRequest,       // other 4xx
    SizeLimit,        // 413
    RateLimited,      // 429
    Timeout,          // per-attempt deadline
    Network,          // transport failure
    Server,           // 5xx or unparseable reply
    EmptyTranscript,  // provider answered with blank text
    Aborted,          // cancelled by the caller
};

struct ProviderError {
    ProviderErrorKind kind = ProviderErrorKind::Server;
    int http_status = 0;
    std::string message;
};

constexpr bool is_retryable(ProviderErrorKind kind) {
    switch (kind) {
        case ProviderErrorKind::RateLimited:
        case ProviderErrorKind::Timeout:
        case ProviderErrorKind::Network:
        case ProviderErrorKind::Server:
        case ProviderErrorKind::EmptyTranscript:
            return true;
        case ProviderErrorKind::Auth:
        case ProviderErrorKind::BadRequest:
        case ProviderErrorKind::SizeLimit:
        case ProviderErrorKind::Aborted:
            return false;
    }
    return false;
}

constexpr std::string_view to_string(ProviderErrorKind kind) {
    switch (kind) {
        case ProviderErrorKind::Auth: return "auth";
        case ProviderErrorKind::BadRequest: return "bad_request";
        case ProviderErrorKind::SizeLimit: return "size_limit";
        case ProviderErrorKind::RateLimited: return "rate_limited";
        case ProviderErrorKind::Timeout: return "timeout";
        case ProviderErrorKind::Network: return "network";
        case ProviderErrorKind::Server: return "server_error";
        case ProviderErrorKind::EmptyTranscript: return "empty_transcript";
        case ProviderErrorKind::Aborted: return "aborted";
    }
    return "unknown";
}

// Session-level classification of a provider failure.
constexpr ErrorKind to_error_kind(ProviderErrorKind kind) {
    switch (kind) {
        case ProviderErrorKind::Auth: return ErrorKind::ProviderAuthError;
        case ProviderErrorKind::RateLimited: return ErrorKind::ProviderRateLimited;
        case ProviderErrorKind::SizeLimit: return ErrorKind::SegmentSizeExceeded;
        case ProviderErrorKind::Aborted: return ErrorKind::Cancelled;
        default: return ErrorKind::ProviderTransient;
    }
}

// Passed through verbatim to every provider call.
struct TranscribeRequest {
    std::string language;
    std::string prompt;
    std::chrono::milliseconds deadline{60000};
};

class TranscriptionProvider {
public:
    virtual ~TranscriptionProvider() = default;
    virtual const std::string& name() const = 0;
    virtual std::expected<std::string, ProviderError>
        transcribe(const AudioSegment& segment, const TranscribeRequest& request,
                   std::stop_token stop) = 0;
};

// Chat-style rewrite of a finished transcript (punctuation, filler removal).
class TextCleanupProvider {
public:
    virtual ~TextCleanupProvider() = default;
    virtual const std::string& name() const = 0;
    virtual std::expected<std::string, ProviderError>
        cleanup(const std::string& text, std::stop_token stop) = 0;
};
