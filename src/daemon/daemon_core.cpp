#include "daemon_core.hpp"

#include <algorithm>
#include <format>
#include <print>

namespace {

RetryPolicy retry_policy(const Config::Transcription& t) {
    return RetryPolicy{
        .max_attempts = static_cast<int>(t.max_attempts),
        .base_delay = std::chrono::milliseconds(t.backoff_base_ms),
        .max_delay = std::chrono::milliseconds(t.backoff_cap_ms),
        .attempt_timeout = std::chrono::seconds(t.attempt_timeout_s),
    };
}

ControllerOptions controller_options(const Config& config) {
    return ControllerOptions{
        .min_recording = std::chrono::milliseconds(config.audio.min_duration_ms),
        .default_device = config.audio.device,
        .request = TranscribeRequest{
            .language = config.transcription.language,
            .prompt = config.transcription.prompt,
            .deadline = std::chrono::seconds(config.transcription.attempt_timeout_s),
        },
        .post_process = config.transcription.post_process,
    };
}

std::string join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out;
    for (auto& s : items) {
        if (!out.empty()) out += sep;
        out += s;
    }
    return out;
}

} // namespace

nlohmann::json error_response(const PipelineError& error) {
    nlohmann::json resp = {{"status", "error"},
                           {"error", std::string(to_string(error.kind))},
                           {"message", error.message}};
    if (error.cause) resp["cause"] = std::string(to_string(*error.cause));
    return resp;
}

DaemonCore::DaemonCore(Config config, bool verbose, ProviderSet providers,
                       AudioSource& source, SampleRing& ring, AudioCompressor* compressor,
                       IpcServer& ipc, OutputFactory output_factory, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      ipc_(ipc),
      output_factory_(std::move(output_factory)),
      notify_(std::move(notify)),
      capture_(source, ring, config_.audio.sample_rate, config_.audio.channels),
      chunker_(ChunkerOptions{.max_segment_bytes = config_.chunker.max_segment_bytes,
                              .compress = config_.chunker.compress},
               config_.chunker.compress ? compressor : nullptr),
      client_(std::move(providers.transcribers), retry_policy(config_.transcription),
              config_.transcription.max_workers),
      controller_(controller_options(config_), capture_, chunker_, client_) {
    client_.set_cleanup_providers(std::move(providers.cleaners));
    controller_.add_observer(this);

    for (auto& name : providers.skipped) {
        std::println(stderr, "config: provider {} has no API key, skipped", name);
    }
}

DaemonCore::~DaemonCore() {
    controller_.shutdown();
}

bool DaemonCore::init(const std::string& history_path) {
    if (!client_.is_configured()) {
        std::println(stderr, "Warning: no transcription provider configured, "
                             "recordings will be rejected");
    }

    if (config_.history.enabled && !history_db_.open(history_path)) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }

    return true;
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    if (cmd_str == "start") return handle_start(cmd);
    if (cmd_str == "stop") return handle_stop(cmd);
    if (cmd_str == "toggle") return handle_toggle(cmd);
    if (cmd_str == "pause") return handle_pause(cmd);
    if (cmd_str == "resume") return handle_resume(cmd);
    if (cmd_str == "cancel") return handle_cancel(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "devices") return handle_devices(cmd);
    return {{"status", "error"}, {"message", "unknown command"}};
}

nlohmann::json DaemonCore::handle_start(const nlohmann::json& cmd) {
    auto method = cmd.value("output", config_.output.default_method);
    auto output = output_factory_(method);
    if (!output) {
        return {{"status", "error"}, {"message", "unknown output method: " + method}};
    }

    auto outcome = controller_.execute(
        Command{.type = CommandType::Start, .device = cmd.value("device", ""), .session_id = 0});
    if (!outcome.applied) {
        if (outcome.error) return error_response(*outcome.error);
        return {{"status", "error"}, {"message", "could not start recording"}};
    }

    output_ = std::move(output);

    auto snap = controller_.snapshot();
    log("Recording started on " + snap.device);
    return {{"status", "ok"}, {"message", "recording"},
            {"session_id", outcome.session_id}, {"device", snap.device}};
}

nlohmann::json DaemonCore::handle_stop(const nlohmann::json& /*cmd*/) {
    auto outcome = controller_.execute(
        Command{.type = CommandType::Stop, .device = {}, .session_id = 0});
    if (!outcome.applied) {
        return {{"status", "error"}, {"message", "not recording"}};
    }

    // Even a recording rejected as too short ends with a queued result, so
    // the client always waits for it.
    return {{"status", "transcribing"}, {"session_id", outcome.session_id}};
}

nlohmann::json DaemonCore::handle_toggle(const nlohmann::json& cmd) {
    switch (controller_.snapshot().state) {
        case SessionState::Idle:
            return handle_start(cmd);
        case SessionState::Recording:
        case SessionState::Paused:
            return handle_stop(cmd);
        default:
            return {{"status", "error"}, {"message", "busy transcribing"}};
    }
}

nlohmann::json DaemonCore::handle_pause(const nlohmann::json& cmd) {
    if (controller_.snapshot().state == SessionState::Paused) return handle_resume(cmd);

    auto outcome = controller_.execute(
        Command{.type = CommandType::Pause, .device = {}, .session_id = 0});
    if (!outcome.applied) return {{"status", "error"}, {"message", "not recording"}};
    return {{"status", "ok"}, {"state", std::string(to_string(outcome.state))}};
}

nlohmann::json DaemonCore::handle_resume(const nlohmann::json& /*cmd*/) {
    auto outcome = controller_.execute(
        Command{.type = CommandType::Resume, .device = {}, .session_id = 0});
    if (!outcome.applied) return {{"status", "error"}, {"message", "not paused"}};
    return {{"status", "ok"}, {"state", std::string(to_string(outcome.state))}};
}

nlohmann::json DaemonCore::handle_cancel(const nlohmann::json& /*cmd*/) {
    auto outcome = controller_.execute(
        Command{.type = CommandType::Cancel, .device = {}, .session_id = 0});
    if (!outcome.applied) return {{"status", "error"}, {"message", "nothing to cancel"}};
    return {{"status", "ok"}, {"state", std::string(to_string(outcome.state))}};
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    auto snap = controller_.snapshot();

    nlohmann::json resp = {{"status", "ok"}, {"state", std::string(to_string(snap.state))}};
    if (snap.state == SessionState::Idle) return resp;

    resp["session_id"] = snap.session_id;
    resp["device"] = snap.device;
    resp["duration"] = snap.elapsed_s;
    if (snap.state == SessionState::Recording || snap.state == SessionState::Paused) {
        resp["level"] = snap.level;
        resp["levels"] = snap.levels;
    }
    return resp;
}

nlohmann::json DaemonCore::handle_history(const nlohmann::json& cmd) {
    if (!history_db_.is_open()) {
        return {{"status", "error"}, {"message", "history disabled"}};
    }

    int limit = std::clamp(cmd.value("limit", 10), 1, 1000);
    auto entries = history_db_.recent(limit);

    nlohmann::json resp = {{"status", "ok"}, {"entries", nlohmann::json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"text", e.record.text},
            {"audio_duration", e.record.audio_duration},
            {"processing_time", e.record.processing_time},
            {"segments", e.record.segment_count},
            {"providers", e.record.providers},
            {"device", e.record.device},
        });
    }
    return resp;
}

nlohmann::json DaemonCore::handle_devices(const nlohmann::json& /*cmd*/) {
    nlohmann::json resp = {{"status", "ok"}, {"devices", nlohmann::json::array()}};
    for (auto& d : capture_.source().list_devices()) {
        resp["devices"].push_back({
            {"id", d.id},
            {"description", d.description},
            {"default", d.is_default},
        });
    }
    return resp;
}

void DaemonCore::on_state_changed(const StateEvent& event) {
    log(std::format("Session {} -> {}", event.session_id, to_string(event.state)));
}

void DaemonCore::on_result(const ResultEvent& event) {
    {
        std::lock_guard lock(pending_mutex_);
        pending_.push_back(event);
    }
    notify_();
}

void DaemonCore::on_rejected(CommandType command, const PipelineError& error) {
    log(std::format("{} rejected: {} ({})", to_string(command), to_string(error.kind),
                    error.message));
}

void DaemonCore::on_session_event() {
    std::vector<ResultEvent> events;
    {
        std::lock_guard lock(pending_mutex_);
        events.swap(pending_);
    }

    for (auto& ev : events) {
        auto response = deliver_result(ev);

        for (int fd : waiting_clients_) {
            if (!ipc_.send_response(fd, response)) log(std::format("Client {} went away", fd));
        }
        waiting_clients_.clear();

        controller_.post(Command{.type = CommandType::Acknowledge, .device = {},
                                 .session_id = ev.session_id});
    }
}

nlohmann::json DaemonCore::deliver_result(const ResultEvent& ev) {
    if (ev.state != SessionState::Completed || !ev.transcript) {
        PipelineError err = ev.error.value_or(
            PipelineError{ErrorKind::Cancelled, "session ended without a transcript"});
        if (err.kind == ErrorKind::Cancelled) {
            log(std::format("Session {} cancelled", ev.session_id));
        } else {
            std::println(stderr, "session {}: {}: {}", ev.session_id, to_string(err.kind),
                         err.message);
        }
        return error_response(err);
    }

    auto& tr = *ev.transcript;
    auto providers = tr.providers();
    log(std::format("Transcription complete: {} segment(s), {:.1f}s audio, {:.1f}s processing, "
                    "{} chars via {}",
                    tr.segments.size(), tr.audio_duration_s, tr.processing_s, tr.text.size(),
                    join(providers, ",")));
    if (tr.post_process_error) {
        log(std::format("Cleanup skipped: {}: {}", to_string(tr.post_process_error->kind),
                        tr.post_process_error->message));
    }

    std::string delivery_error;
    if (!tr.text.empty() && output_) {
        auto res = output_->deliver(tr.text);
        if (res) {
            log(std::format("Delivered via {}", output_->name()));
        } else {
            delivery_error = res.error();
            std::println(stderr, "output: {}: {}", output_->name(), res.error());
        }
    }

    if (history_db_.is_open()) {
        bool saved = history_db_.insert(HistoryRecord{
            .text = tr.text,
            .raw_text = tr.post_processed ? tr.raw_text : std::string{},
            .audio_duration = tr.audio_duration_s,
            .processing_time = tr.processing_s,
            .segment_count = static_cast<int>(tr.segments.size()),
            .providers = join(providers, ","),
            .device = ev.device,
            .language = config_.transcription.language,
        });
        if (!saved) log("History entry not saved");
    }

    nlohmann::json response = {
        {"status", "ok"},
        {"text", tr.text},
        {"duration", tr.audio_duration_s},
        {"processing_time", tr.processing_s},
        {"segments", tr.segments.size()},
        {"providers", providers},
        {"post_processed", tr.post_processed},
    };
    if (!delivery_error.empty()) response["output_error"] = delivery_error;
    if (tr.post_process_error) {
        response["post_process_error"] = std::string(to_string(tr.post_process_error->kind));
    }
    return response;
}

bool DaemonCore::enforce_recording_limit() {
    if (config_.audio.max_seconds == 0) return false;

    auto snap = controller_.snapshot();
    if (snap.state != SessionState::Recording || snap.elapsed_s < config_.audio.max_seconds) {
        return false;
    }

    log(std::format("Recording reached {}s limit, stopping", config_.audio.max_seconds));
    return handle_stop(nlohmann::json::object())["status"] == "transcribing";
}

bool DaemonCore::is_recording() const {
    auto state = controller_.snapshot().state;
    return state == SessionState::Recording || state == SessionState::Paused;
}

void DaemonCore::add_waiting_client(int fd) {
    waiting_clients_.push_back(fd);
}

void DaemonCore::remove_waiting_client(int fd) {
    std::erase(waiting_clients_, fd);
}

void DaemonCore::shutdown() {
    auto state = controller_.snapshot().state;
    if (state != SessionState::Idle) {
        log(std::format("Shutting down with session {}", to_string(state)));
    }
    controller_.shutdown();

    nlohmann::json response = {{"status", "error"}, {"error", "cancelled"},
                               {"message", "daemon shutting down"}};
    for (int fd : waiting_clients_) {
        if (!ipc_.send_response(fd, response)) log(std::format("Client {} went away", fd));
    }
    waiting_clients_.clear();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[mindscribe] {}", msg);
    }
}
