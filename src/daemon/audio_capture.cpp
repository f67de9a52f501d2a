#include "audio_capture.hpp"

#include <print>

AudioCapture::AudioCapture(AudioSource& source, SampleRing& ring, uint32_t sample_rate,
                           uint16_t channels, std::chrono::milliseconds slice)
    : source_(source), ring_(ring), sample_rate_(sample_rate), channels_(channels),
      slice_(slice),
      slice_samples_(static_cast<size_t>(sample_rate) * channels * slice.count() / 1000) {
    if (slice_samples_ == 0) slice_samples_ = channels_;
}

AudioCapture::~AudioCapture() {
    cancel();
}

std::expected<std::string, PipelineError>
AudioCapture::start(const std::string& device_selector) {
    if (is_capturing()) {
        return std::unexpected(PipelineError{ErrorKind::SessionAlreadyActive,
                                             "capture already running"});
    }

    ring_.reset();
    buffer_ = AudioBuffer{.sample_rate = sample_rate_, .channels = channels_, .blocks = {}};
    pending_.clear();
    {
        std::lock_guard lock(levels_mutex_);
        levels_.clear();
    }
    current_level_.store(0.0f, std::memory_order_relaxed);

    std::expected<std::string, std::string> opened = std::unexpected(std::string());
    if (!device_selector.empty()) {
        opened = source_.open(device_selector);
        if (!opened) {
            std::println(stderr, "audio: device '{}' unavailable ({}), using system default",
                         device_selector, opened.error());
        }
    }
    if (!opened) {
        opened = source_.open("");
    }
    if (!opened) {
        return std::unexpected(PipelineError{ErrorKind::DeviceUnavailable, opened.error()});
    }

    device_ = *opened;
    paused_.store(false, std::memory_order_release);
    capturing_.store(true, std::memory_order_release);
    accumulator_ = std::jthread([this](std::stop_token st) { accumulate(st); });
    return device_;
}

void AudioCapture::pause() {
    if (!is_capturing() || is_paused()) return;
    std::lock_guard lock(consume_mutex_);
    // Keep what was captured up to the pause point.
    drain_ring();
    paused_.store(true, std::memory_order_release);
}

void AudioCapture::resume() {
    if (!is_capturing() || !is_paused()) return;
    std::lock_guard lock(consume_mutex_);
    ring_.discard();
    paused_.store(false, std::memory_order_release);
}

AudioBuffer AudioCapture::stop() {
    if (!is_capturing()) return {};

    shutdown_stream();

    std::lock_guard lock(consume_mutex_);
    if (!is_paused()) drain_ring();
    finish_block();
    paused_.store(false, std::memory_order_release);

    if (ring_.overruns() > 0) {
        std::println(stderr, "audio: {} samples dropped (ring overrun)", ring_.overruns());
    }
    return std::move(buffer_);
}

void AudioCapture::cancel() {
    if (!is_capturing()) return;

    shutdown_stream();

    std::lock_guard lock(consume_mutex_);
    ring_.discard();
    buffer_ = AudioBuffer{};
    pending_.clear();
    paused_.store(false, std::memory_order_release);
}

std::vector<float> AudioCapture::level_history() const {
    std::lock_guard lock(levels_mutex_);
    return {levels_.begin(), levels_.end()};
}

void AudioCapture::accumulate(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(wake_mutex_);
            wake_.wait_for(lock, stop, slice_, [] { return false; });
        }
        if (stop.stop_requested()) break;

        std::lock_guard lock(consume_mutex_);
        if (paused_.load(std::memory_order_acquire)) {
            ring_.discard();
        } else {
            drain_ring();
        }
    }
}

void AudioCapture::drain_ring() {
    std::vector<int16_t> chunk(slice_samples_);
    while (size_t n = ring_.pop(chunk)) {
        append_samples(chunk.data(), n);
    }
}

void AudioCapture::append_samples(const int16_t* data, size_t count) {
    while (count > 0) {
        size_t room = slice_samples_ - pending_.size();
        size_t take = std::min(room, count);
        pending_.insert(pending_.end(), data, data + take);
        data += take;
        count -= take;
        if (pending_.size() == slice_samples_) finish_block();
    }
}

void AudioCapture::finish_block() {
    if (pending_.empty()) return;

    float raw = level::rms(pending_);
    float norm = level::normalized(raw);
    buffer_.blocks.push_back(AudioBlock{.samples = std::move(pending_), .rms = raw});
    pending_ = {};
    pending_.reserve(slice_samples_);

    current_level_.store(norm, std::memory_order_relaxed);
    std::lock_guard lock(levels_mutex_);
    levels_.push_back(norm);
    while (levels_.size() > kLevelHistorySize) levels_.pop_front();
}

void AudioCapture::shutdown_stream() {
    // Close the producer first so nothing is written behind the final drain.
    source_.close();
    capturing_.store(false, std::memory_order_release);
    accumulator_.request_stop();
    if (accumulator_.joinable()) accumulator_.join();
}
