#pragma once

#include "platform/audio_source.hpp"
#include "sample_ring.hpp"

#include <atomic>
#include <cstdint>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

class PipeWireSource : public AudioSource {
public:
    PipeWireSource(SampleRing& ring, uint32_t sample_rate = 16000, uint16_t channels = 1);
    ~PipeWireSource() override;

    PipeWireSource(const PipeWireSource&) = delete;
    PipeWireSource& operator=(const PipeWireSource&) = delete;

    // Audio/Source nodes, found with a registry roundtrip on a private loop.
    std::vector<InputDevice> list_devices() override;

    std::expected<std::string, std::string> open(const std::string& device_id) override;
    void close() override;
    bool is_open() const override { return capturing_.load(std::memory_order_relaxed); }

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    SampleRing& ring_;
    uint32_t sample_rate_;
    uint16_t channels_;
    std::atomic<bool> capturing_{false};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
