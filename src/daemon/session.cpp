#include "session.hpp"

std::optional<SessionState> next_state(SessionState from, SessionEvent event) {
    using S = SessionState;
    using E = SessionEvent;

    switch (from) {
        case S::Idle:
            if (event == E::Start) return S::Recording;
            break;
        case S::Recording:
            switch (event) {
                case E::Stop: return S::Transcribing;
                case E::Pause: return S::Paused;
                case E::Cancel: return S::Cancelled;
                case E::Reject: return S::Failed;
                default: break;
            }
            break;
        case S::Paused:
            switch (event) {
                case E::Resume: return S::Recording;
                case E::Stop: return S::Transcribing;
                case E::Cancel: return S::Cancelled;
                case E::Reject: return S::Failed;
                default: break;
            }
            break;
        case S::Transcribing:
            switch (event) {
                case E::Success: return S::Completed;
                case E::Failure: return S::Failed;
                case E::Cancel: return S::Cancelled;
                default: break;
            }
            break;
        case S::Completed:
        case S::Failed:
        case S::Cancelled:
            if (event == E::Acknowledge) return S::Idle;
            break;
    }
    return std::nullopt;
}

std::string_view to_string(SessionState s) {
    switch (s) {
        case SessionState::Idle: return "idle";
        case SessionState::Recording: return "recording";
        case SessionState::Paused: return "paused";
        case SessionState::Transcribing: return "transcribing";
        case SessionState::Completed: return "completed";
        case SessionState::Failed: return "failed";
        case SessionState::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string_view to_string(SessionEvent e) {
    switch (e) {
        case SessionEvent::Start: return "start";
        case SessionEvent::Stop: return "stop";
        case SessionEvent::Pause: return "pause";
        case SessionEvent::Resume: return "resume";
        case SessionEvent::Cancel: return "cancel";
        case SessionEvent::Reject: return "reject";
        case SessionEvent::Success: return "success";
        case SessionEvent::Failure: return "failure";
        case SessionEvent::Acknowledge: return "acknowledge";
    }
    return "unknown";
}

Session::Session(uint64_t id, std::string device, Clock::time_point now)
    : id_(id), device_(std::move(device)), started_at_(now) {}

bool Session::apply(SessionEvent event, Clock::time_point now) {
    auto next = next_state(state_, event);
    if (!next) return false;

    if (event == SessionEvent::Pause) {
        paused_since_ = now;
    } else if (state_ == SessionState::Paused && paused_since_) {
        paused_total_ += now - *paused_since_;
        paused_since_.reset();
    }

    if ((state_ == SessionState::Recording || state_ == SessionState::Paused) &&
        *next != SessionState::Recording && *next != SessionState::Paused) {
        stopped_at_ = now;
    }

    state_ = *next;
    return true;
}

double Session::elapsed_s(Clock::time_point now) const {
    Clock::time_point end = now;
    if (stopped_at_) end = *stopped_at_;
    else if (paused_since_) end = *paused_since_;
    return std::chrono::duration<double>(end - started_at_ - paused_total_).count();
}
