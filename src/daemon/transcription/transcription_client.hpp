#pragma once

#include "../chunker.hpp"
#include "../pipeline_error.hpp"
#include "provider.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

// Attempts per provider and the delay curve between them. Delay before
// retry n (1-based) is base * 2^(n-1), capped at max_delay.
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{4000};
    std::chrono::milliseconds attempt_timeout{60000};

    std::chrono::milliseconds delay_before_retry(int retry) const;
};

// One network call to one provider for one segment.
struct ProviderAttempt {
    std::string provider;
    int attempt = 0;
    double elapsed_s = 0.0;
    std::optional<ProviderError> error;
};

struct SegmentTranscript {
    size_t index = 0;
    std::string text;
    std::string provider;
    std::vector<ProviderAttempt> attempts;
};

struct TranscriptResult {
    std::string text;
    std::string raw_text;
    std::vector<SegmentTranscript> segments;
    bool post_processed = false;
    // Set when cleanup was requested but the raw text was kept.
    std::optional<PipelineError> post_process_error;
    double audio_duration_s = 0.0;
    double processing_s = 0.0;

    // Providers that served the segments, in segment order.
    std::vector<std::string> providers() const;
};

class TranscriptionClient {
public:
    // Waits for the given delay. Returns false if stop was requested first.
    using SleepFn = std::function<bool(std::chrono::milliseconds, std::stop_token)>;

    TranscriptionClient(std::vector<std::shared_ptr<TranscriptionProvider>> providers,
                        RetryPolicy policy, size_t max_workers, SleepFn sleep = {});

    void set_cleanup_providers(std::vector<std::shared_ptr<TextCleanupProvider>> cleaners);

    bool is_configured() const { return !providers_.empty(); }
    const RetryPolicy& policy() const { return policy_; }

    // Transcribes every segment, merges by sequence index and, when asked,
    // runs the cleanup pass. Any segment exhausting all providers fails the
    // whole call.
    std::expected<TranscriptResult, PipelineError>
        transcribe(std::span<const AudioSegment> segments, const TranscribeRequest& request,
                   bool post_process, std::stop_token stop);

    std::expected<SegmentTranscript, PipelineError>
        transcribe_segment(const AudioSegment& segment, const TranscribeRequest& request,
                           std::stop_token stop);

private:
    void post_process(TranscriptResult& result, std::stop_token stop);

    std::vector<std::shared_ptr<TranscriptionProvider>> providers_;
    std::vector<std::shared_ptr<TextCleanupProvider>> cleaners_;
    RetryPolicy policy_;
    size_t max_workers_;
    SleepFn sleep_;
};

// Joins per-segment text in index order. Fails if any index in
// [0, expected_count) is missing or duplicated.
std::expected<std::string, PipelineError>
    merge_transcripts(std::vector<SegmentTranscript>& parts, size_t expected_count);

// Rejects cleanup output that looks like a chat reply instead of the same
// text cleaned: length ratio outside [0.15, 3.0], a conversational preamble,
// or under 30% of the original words retained.
bool is_valid_cleanup(std::string_view original, std::string_view cleaned);

// Interruptible sleep used when no SleepFn is supplied.
bool interruptible_sleep(std::chrono::milliseconds delay, std::stop_token stop);
