#include "transcription_client.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <format>
#include <mutex>
#include <print>
#include <set>
#include <sstream>
#include <thread>

std::chrono::milliseconds RetryPolicy::delay_before_retry(int retry) const {
    auto delay = base_delay;
    for (int i = 1; i < retry && delay < max_delay; ++i) delay *= 2;
    return std::min(delay, max_delay);
}

std::vector<std::string> TranscriptResult::providers() const {
    std::vector<std::string> out;
    out.reserve(segments.size());
    for (auto& s : segments) out.push_back(s.provider);
    return out;
}

bool interruptible_sleep(std::chrono::milliseconds delay, std::stop_token stop) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

TranscriptionClient::TranscriptionClient(
    std::vector<std::shared_ptr<TranscriptionProvider>> providers,
    RetryPolicy policy, size_t max_workers, SleepFn sleep)
    : providers_(std::move(providers)), policy_(policy),
      max_workers_(std::max<size_t>(1, max_workers)),
      sleep_(sleep ? std::move(sleep) : SleepFn(interruptible_sleep)) {
    policy_.max_attempts = std::max(1, policy_.max_attempts);
}

void TranscriptionClient::set_cleanup_providers(
    std::vector<std::shared_ptr<TextCleanupProvider>> cleaners) {
    cleaners_ = std::move(cleaners);
}

std::expected<SegmentTranscript, PipelineError>
TranscriptionClient::transcribe_segment(const AudioSegment& segment,
                                        const TranscribeRequest& request,
                                        std::stop_token stop) {
    SegmentTranscript out;
    out.index = segment.index;

    TranscribeRequest req = request;
    req.deadline = policy_.attempt_timeout;

    std::optional<ProviderError> last;
    std::string last_provider;

    for (auto& provider : providers_) {
        for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
            if (stop.stop_requested()) {
                return std::unexpected(PipelineError{ErrorKind::Cancelled, "cancelled"});
            }

            auto started = std::chrono::steady_clock::now();
            auto result = provider->transcribe(segment, req, stop);
            double elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - started).count();

            ProviderAttempt record{.provider = provider->name(), .attempt = attempt,
                                   .elapsed_s = elapsed, .error = std::nullopt};
            if (result) {
                out.attempts.push_back(std::move(record));
                out.text = std::move(*result);
                out.provider = provider->name();
                return out;
            }

            record.error = result.error();
            out.attempts.push_back(std::move(record));
            last = result.error();
            last_provider = provider->name();

            if (result.error().kind == ProviderErrorKind::Aborted) {
                return std::unexpected(PipelineError{ErrorKind::Cancelled, "cancelled"});
            }

            std::println(stderr, "transcribe: segment {} {} attempt {}/{} failed: {} ({})",
                         segment.index, provider->name(), attempt, policy_.max_attempts,
                         to_string(result.error().kind), result.error().message);

            if (!is_retryable(result.error().kind)) break;
            if (attempt == policy_.max_attempts) break;

            if (!sleep_(policy_.delay_before_retry(attempt), stop)) {
                return std::unexpected(PipelineError{ErrorKind::Cancelled, "cancelled"});
            }
        }
    }

    if (!last) {
        return std::unexpected(PipelineError{ErrorKind::NotConfigured,
                                             "no transcription provider configured"});
    }
    return std::unexpected(PipelineError{
        .kind = ErrorKind::AllProvidersExhausted,
        .message = std::format("all providers failed for segment {}; last: {} {} ({})",
                               segment.index, last_provider, to_string(last->kind),
                               last->message),
        .cause = to_error_kind(last->kind)});
}

std::expected<TranscriptResult, PipelineError>
TranscriptionClient::transcribe(std::span<const AudioSegment> segments,
                                const TranscribeRequest& request, bool post_process_text,
                                std::stop_token stop) {
    if (providers_.empty()) {
        return std::unexpected(PipelineError{ErrorKind::NotConfigured,
                                             "no transcription provider configured"});
    }
    if (segments.empty()) {
        return std::unexpected(PipelineError{ErrorKind::NoAudio, "nothing to transcribe"});
    }

    auto started = std::chrono::steady_clock::now();
    const size_t n = segments.size();

    // Each slot is written by exactly one worker and read after the join.
    std::vector<std::optional<SegmentTranscript>> slots(n);
    std::atomic<size_t> next{0};
    std::stop_source abort;
    std::stop_callback forward(stop, [&abort] { abort.request_stop(); });
    std::mutex error_mutex;
    std::optional<PipelineError> first_error;

    auto work = [&] {
        while (!abort.stop_requested()) {
            size_t i = next.fetch_add(1);
            if (i >= n) break;
            auto r = transcribe_segment(segments[i], request, abort.get_token());
            if (!r) {
                {
                    std::lock_guard lock(error_mutex);
                    if (!first_error) first_error = std::move(r.error());
                }
                abort.request_stop();
                break;
            }
            slots[i] = std::move(*r);
        }
    };

    size_t workers = std::min(max_workers_, n);
    if (workers <= 1) {
        work();
    } else {
        std::vector<std::jthread> pool;
        pool.reserve(workers);
        for (size_t w = 0; w < workers; ++w) pool.emplace_back(work);
    }

    if (stop.stop_requested()) {
        return std::unexpected(PipelineError{ErrorKind::Cancelled, "cancelled"});
    }
    if (first_error) return std::unexpected(std::move(*first_error));

    std::vector<SegmentTranscript> parts;
    parts.reserve(n);
    for (auto& s : slots) {
        if (s) parts.push_back(std::move(*s));
    }

    auto merged = merge_transcripts(parts, n);
    if (!merged) return std::unexpected(merged.error());

    TranscriptResult result;
    result.raw_text = *merged;
    result.text = std::move(*merged);
    result.segments = std::move(parts);
    for (auto& seg : segments) result.audio_duration_s += seg.duration_s();

    if (post_process_text) {
        post_process(result, stop);
        if (stop.stop_requested()) {
            return std::unexpected(PipelineError{ErrorKind::Cancelled, "cancelled"});
        }
    }

    result.processing_s = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();
    return result;
}

void TranscriptionClient::post_process(TranscriptResult& result, std::stop_token stop) {
    if (result.raw_text.empty()) return;
    if (cleaners_.empty()) {
        result.post_process_error = PipelineError{ErrorKind::PostProcessFailure,
                                                  "no cleanup provider configured"};
        return;
    }

    for (auto& cleaner : cleaners_) {
        if (stop.stop_requested()) return;

        auto cleaned = cleaner->cleanup(result.raw_text, stop);
        if (!cleaned) {
            result.post_process_error = PipelineError{
                .kind = ErrorKind::PostProcessFailure,
                .message = std::format("{}: {} ({})", cleaner->name(),
                                       to_string(cleaned.error().kind),
                                       cleaned.error().message),
                .cause = to_error_kind(cleaned.error().kind)};
            continue;
        }
        if (!is_valid_cleanup(result.raw_text, *cleaned)) {
            result.post_process_error = PipelineError{
                ErrorKind::PostProcessFailure,
                cleaner->name() + ": reply rejected as not a cleanup"};
            continue;
        }

        result.text = std::move(*cleaned);
        result.post_processed = true;
        result.post_process_error.reset();
        return;
    }
}

std::expected<std::string, PipelineError>
merge_transcripts(std::vector<SegmentTranscript>& parts, size_t expected_count) {
    std::ranges::sort(parts, {}, &SegmentTranscript::index);

    for (size_t i = 0; i < expected_count; ++i) {
        if (i >= parts.size() || parts[i].index != i) {
            return std::unexpected(PipelineError{
                ErrorKind::SegmentMissing,
                std::format("transcript for segment {} of {} is missing", i, expected_count)});
        }
    }
    if (parts.size() != expected_count) {
        return std::unexpected(PipelineError{
            ErrorKind::SegmentMissing,
            std::format("expected {} segment transcripts, got {}", expected_count,
                        parts.size())});
    }

    std::string text;
    for (auto& part : parts) {
        if (part.text.empty()) continue;
        if (!text.empty()) text += ' ';
        text += part.text;
    }
    return text;
}

namespace {

// Lower-cased words with ASCII punctuation removed. Non-ASCII bytes count as
// word characters so accented words survive.
std::set<std::string> word_set(std::string_view text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (unsigned char c : text) {
        if (c >= 0x80 || std::isalnum(c) || c == '_') {
            cleaned += static_cast<char>(std::tolower(c));
        } else if (std::isspace(c)) {
            cleaned += ' ';
        }
    }

    std::set<std::string> words;
    std::istringstream in(cleaned);
    std::string w;
    while (in >> w) words.insert(w);
    return words;
}

constexpr std::array<std::string_view, 15> kResponsePrefixes = {
    "here is", "here's", "voici", "sure", "certainly", "of course",
    "bien sur", "i'd be happy", "je serais", "the text", "le texte",
    "this is", "ceci est", "based on", "en fonction",
};

} // namespace

bool is_valid_cleanup(std::string_view original, std::string_view cleaned) {
    double ratio = static_cast<double>(cleaned.size()) /
                   static_cast<double>(std::max<size_t>(original.size(), 1));
    if (ratio > 3.0 || ratio < 0.15) return false;

    std::string lower;
    lower.reserve(cleaned.size());
    for (unsigned char c : cleaned) lower += static_cast<char>(std::tolower(c));
    auto start = lower.find_first_not_of(" \t\n\r");
    std::string_view head = start == std::string::npos
        ? std::string_view{}
        : std::string_view(lower).substr(start);
    for (auto prefix : kResponsePrefixes) {
        if (head.starts_with(prefix)) return false;
    }

    auto original_words = word_set(original);
    if (original_words.empty()) return true;
    auto cleaned_words = word_set(cleaned);

    size_t kept = 0;
    for (auto& w : original_words) {
        if (cleaned_words.contains(w)) ++kept;
    }
    return static_cast<double>(kept) / static_cast<double>(original_words.size()) >= 0.3;
}
