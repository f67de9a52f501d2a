#pragma once

#include "audio/audio_buffer.hpp"
#include "pipeline_error.hpp"
#include "transcription/transcription_client.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

enum class SessionState { Idle, Recording, Paused, Transcribing, Completed, Failed, Cancelled };

enum class SessionEvent {
    Start,
    Stop,
    Pause,
    Resume,
    Cancel,
    Reject,       // stop with nothing worth transcribing
    Success,
    Failure,
    Acknowledge,
};

// Transition table. Unmapped (state, event) pairs return nullopt and are
// treated as no-ops by the controller.
std::optional<SessionState> next_state(SessionState from, SessionEvent event);

constexpr bool is_terminal(SessionState s) {
    return s == SessionState::Completed || s == SessionState::Failed ||
           s == SessionState::Cancelled;
}

std::string_view to_string(SessionState s);
std::string_view to_string(SessionEvent e);

// One recording-to-transcript attempt. Only touched under the controller's
// session lock.
class Session {
public:
    using Clock = std::chrono::steady_clock;

    Session(uint64_t id, std::string device, Clock::time_point now = Clock::now());

    uint64_t id() const { return id_; }
    SessionState state() const { return state_; }
    const std::string& device() const { return device_; }

    // Applies event if the table maps it. Returns false for a no-op.
    bool apply(SessionEvent event, Clock::time_point now = Clock::now());

    // Recorded time excluding pauses; frozen while Paused and after stop.
    double elapsed_s(Clock::time_point now = Clock::now()) const;

    AudioBuffer& audio() { return audio_; }
    void set_audio(AudioBuffer audio) { audio_ = std::move(audio); }
    AudioBuffer take_audio() { return std::move(audio_); }

    const std::optional<TranscriptResult>& result() const { return result_; }
    const std::optional<PipelineError>& error() const { return error_; }
    void set_result(TranscriptResult r) { result_ = std::move(r); }
    void set_error(PipelineError e) { error_ = std::move(e); }

private:
    uint64_t id_;
    SessionState state_ = SessionState::Idle;
    std::string device_;
    Clock::time_point started_at_;
    Clock::duration paused_total_{};
    std::optional<Clock::time_point> paused_since_;
    std::optional<Clock::time_point> stopped_at_;
    AudioBuffer audio_;
    std::optional<TranscriptResult> result_;
    std::optional<PipelineError> error_;
};
