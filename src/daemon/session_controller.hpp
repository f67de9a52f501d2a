#pragma once

#include "audio_capture.hpp"
#include "chunker.hpp"
#include "pipeline_error.hpp"
#include "session.hpp"
#include "transcription/transcription_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

enum class CommandType { Start, Stop, Pause, Resume, Cancel, Acknowledge };

std::string_view to_string(CommandType c);

struct Command {
    CommandType type;
    std::string device;       // Start: device selector, empty = configured default
    uint64_t session_id = 0;  // Acknowledge: 0 = whichever session is terminal
};

struct CommandOutcome {
    bool applied = false;         // false: rejected or a no-op
    SessionState state = SessionState::Idle;
    uint64_t session_id = 0;
    std::optional<PipelineError> error;
};

struct StateEvent {
    uint64_t session_id = 0;
    SessionState state = SessionState::Idle;
    std::chrono::system_clock::time_point timestamp;
    std::string device;
    double elapsed_s = 0.0;
};

// Delivered exactly once per session, on reaching a terminal state.
struct ResultEvent {
    uint64_t session_id = 0;
    SessionState state = SessionState::Idle;
    std::optional<TranscriptResult> transcript;
    std::optional<PipelineError> error;
    double recorded_s = 0.0;
    std::string device;
};

struct SessionSnapshot {
    uint64_t session_id = 0;
    SessionState state = SessionState::Idle;
    std::string device;
    double elapsed_s = 0.0;
    float level = 0.0f;
    std::vector<float> levels;
};

// Called on the controller's dispatch thread, never while the session lock
// is held. Handlers must not block on the controller: use post(), not
// execute(), to acknowledge from inside a handler.
class SessionObserver {
public:
    virtual ~SessionObserver() = default;
    virtual void on_state_changed(const StateEvent& event) = 0;
    virtual void on_result(const ResultEvent& event) = 0;
    virtual void on_rejected(CommandType /*command*/, const PipelineError& /*error*/) {}
};

struct ControllerOptions {
    std::chrono::milliseconds min_recording{500};
    std::string default_device;
    TranscribeRequest request;
    bool post_process = false;
};

class SessionController {
public:
    SessionController(ControllerOptions options, AudioCapture& capture, Chunker& chunker,
                      TranscriptionClient& client);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Register before the first command.
    void add_observer(SessionObserver* observer);

    // Enqueue and return immediately. Safe from any thread.
    void post(Command cmd);
    // Enqueue; the future resolves once the command has been applied and
    // its events delivered.
    std::future<CommandOutcome> submit(Command cmd);
    CommandOutcome execute(Command cmd) { return submit(std::move(cmd)).get(); }

    SessionSnapshot snapshot() const;

    // Cancels any active session and stops the dispatch thread.
    void shutdown();

private:
    struct CommandItem {
        Command cmd;
        std::optional<std::promise<CommandOutcome>> reply;
    };
    struct CompletionItem {
        uint64_t session_id;
        std::expected<TranscriptResult, PipelineError> result;
    };
    using QueueItem = std::variant<CommandItem, CompletionItem>;
    using Emission = std::variant<StateEvent, ResultEvent>;

    void enqueue(QueueItem item);
    void dispatch(std::stop_token stop);

    // All of these require mutex_.
    CommandOutcome handle(const Command& cmd, std::vector<Emission>& out);
    CommandOutcome handle_start(const Command& cmd, std::vector<Emission>& out);
    CommandOutcome handle_stop(std::vector<Emission>& out);
    CommandOutcome handle_pause(std::vector<Emission>& out);
    CommandOutcome handle_resume(std::vector<Emission>& out);
    CommandOutcome handle_cancel(std::vector<Emission>& out);
    CommandOutcome handle_acknowledge(const Command& cmd, std::vector<Emission>& out);
    void handle_completion(CompletionItem& item, std::vector<Emission>& out);
    void finish(SessionEvent event, std::vector<Emission>& out);
    void launch_transcription(uint64_t session_id, AudioBuffer audio);
    void retire_worker();
    StateEvent state_event() const;
    CommandOutcome outcome(bool applied) const;
    CommandOutcome rejected(ErrorKind kind, std::string message) const;

    void emit(const std::vector<Emission>& events);

    ControllerOptions options_;
    AudioCapture& capture_;
    Chunker& chunker_;
    TranscriptionClient& client_;
    std::vector<SessionObserver*> observers_;

    mutable std::mutex mutex_;
    std::optional<Session> session_;
    uint64_t next_id_ = 0;

    // Transcription job for the current session. Cancelled jobs are parked
    // in retired_ until they notice the stop request and exit.
    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    Worker worker_;
    std::vector<Worker> retired_;

    std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::deque<QueueItem> queue_;
    bool stopped_ = false;

    std::jthread dispatcher_;
};
