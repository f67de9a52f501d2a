#pragma once

#include <optional>
#include <string>
#include <string_view>

enum class ErrorKind {
    DeviceUnavailable,
    RecordingTooShort,
    NoAudio,
    SegmentSizeExceeded,
    SegmentMissing,
    ProviderAuthError,
    ProviderRateLimited,
    ProviderTransient,
    AllProvidersExhausted,
    PostProcessFailure,
    SessionAlreadyActive,
    NotConfigured,
    Cancelled,
};

struct PipelineError {
    ErrorKind kind;
    std::string message;
    // Classification of the last provider failure behind AllProvidersExhausted.
    std::optional<ErrorKind> cause = std::nullopt;
};

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DeviceUnavailable: return "device_unavailable";
        case ErrorKind::RecordingTooShort: return "recording_too_short";
        case ErrorKind::NoAudio: return "no_audio";
        case ErrorKind::SegmentSizeExceeded: return "segment_size_exceeded";
        case ErrorKind::SegmentMissing: return "segment_missing";
        case ErrorKind::ProviderAuthError: return "provider_auth_error";
        case ErrorKind::ProviderRateLimited: return "provider_rate_limited";
        case ErrorKind::ProviderTransient: return "provider_transient";
        case ErrorKind::AllProvidersExhausted: return "all_providers_exhausted";
        case ErrorKind::PostProcessFailure: return "post_process_failure";
        case ErrorKind::SessionAlreadyActive: return "session_already_active";
        case ErrorKind::NotConfigured: return "not_configured";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}
