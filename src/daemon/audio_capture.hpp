#pragma once

#include "audio/audio_buffer.hpp"
#include "pipeline_error.hpp"
#include "platform/audio_source.hpp"
#include "sample_ring.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Owns the input stream for one Recording/Paused episode. The audio server
// thread only fills the SampleRing; a dedicated accumulation thread drains
// it into AudioBlocks and computes the per-slice amplitude.
class AudioCapture {
public:
    static constexpr size_t kLevelHistorySize = 48;

    AudioCapture(AudioSource& source, SampleRing& ring, uint32_t sample_rate,
                 uint16_t channels = 1,
                 std::chrono::milliseconds slice = std::chrono::milliseconds(50));
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    // Opens device_selector, falling back to the system default. Returns the
    // device actually in use.
    std::expected<std::string, PipelineError> start(const std::string& device_selector);
    void pause();
    void resume();
    // Closes the stream and hands over everything accumulated.
    AudioBuffer stop();
    // Closes the stream and discards the recording.
    void cancel();

    bool is_capturing() const { return capturing_.load(std::memory_order_acquire); }
    bool is_paused() const { return paused_.load(std::memory_order_acquire); }
    const std::string& device_in_use() const { return device_; }

    float current_level() const { return current_level_.load(std::memory_order_relaxed); }
    std::vector<float> level_history() const;

    AudioSource& source() { return source_; }

private:
    void accumulate(std::stop_token stop);
    // Requires consume_mutex_.
    void drain_ring();
    void append_samples(const int16_t* data, size_t count);
    void finish_block();
    void shutdown_stream();

    AudioSource& source_;
    SampleRing& ring_;
    uint32_t sample_rate_;
    uint16_t channels_;
    std::chrono::milliseconds slice_;
    size_t slice_samples_;

    std::atomic<bool> capturing_{false};
    std::atomic<bool> paused_{false};
    std::string device_;

    // Serialises the ring's consumer side between the accumulation thread
    // and pause/resume/stop callers.
    std::mutex consume_mutex_;
    AudioBuffer buffer_;
    std::vector<int16_t> pending_;

    std::atomic<float> current_level_{0.0f};
    mutable std::mutex levels_mutex_;
    std::deque<float> levels_;

    std::mutex wake_mutex_;
    std::condition_variable_any wake_;
    std::jthread accumulator_;
};
