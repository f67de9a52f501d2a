#pragma once

#include "audio_capture.hpp"
#include "chunker.hpp"
#include "config.hpp"
#include "output/output.hpp"
#include "platform/audio_compressor.hpp"
#include "platform/audio_source.hpp"
#include "platform/ipc_server.hpp"
#include "sample_ring.hpp"
#include "session_controller.hpp"
#include "storage/history_db.hpp"
#include "transcription/provider_factory.hpp"
#include "transcription/transcription_client.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Command handling and result delivery. Lives on the event loop thread;
// controller callbacks arrive on the controller's thread and are handed
// over through notify().
class DaemonCore : public SessionObserver {
public:
    // Returns nullptr for an unknown method name.
    using OutputFactory = std::function<std::unique_ptr<OutputMethod>(const std::string&)>;
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose, ProviderSet providers,
               AudioSource& source, SampleRing& ring, AudioCompressor* compressor,
               IpcServer& ipc, OutputFactory output_factory, NotifyCallback notify);
    ~DaemonCore() override;

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Opens the history database. Returns false on unrecoverable errors.
    bool init(const std::string& history_path);

    // A "transcribing" status means the reply is deferred until the session
    // ends; the caller registers the client with add_waiting_client().
    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Drains results queued by the controller. Event loop thread only.
    void on_session_event();

    // Stops a recording that has run for audio.max_seconds (0 = no limit).
    // Returns true if a stop was issued.
    bool enforce_recording_limit();
    bool is_recording() const;

    void add_waiting_client(int fd);
    void remove_waiting_client(int fd);

    SessionSnapshot snapshot() const { return controller_.snapshot(); }

    void shutdown();

    // SessionObserver
    void on_state_changed(const StateEvent& event) override;
    void on_result(const ResultEvent& event) override;
    void on_rejected(CommandType command, const PipelineError& error) override;

private:
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_pause(const nlohmann::json& cmd);
    nlohmann::json handle_resume(const nlohmann::json& cmd);
    nlohmann::json handle_cancel(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_devices(const nlohmann::json& cmd);

    nlohmann::json deliver_result(const ResultEvent& ev);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    IpcServer& ipc_;
    OutputFactory output_factory_;
    NotifyCallback notify_;

    AudioCapture capture_;
    Chunker chunker_;
    TranscriptionClient client_;
    SessionController controller_;

    HistoryDb history_db_;
    std::unique_ptr<OutputMethod> output_;  // chosen by the last start
    std::vector<int> waiting_clients_;

    std::mutex pending_mutex_;
    std::vector<ResultEvent> pending_;
};

// Wire form of an error: {"status": "error", "error": kind, "message": ...}
nlohmann::json error_response(const PipelineError& error);
