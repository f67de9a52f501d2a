#include "session_controller.hpp"

#include <format>

std::string_view to_string(CommandType c) {
    switch (c) {
        case CommandType::Start: return "start";
        case CommandType::Stop: return "stop";
        case CommandType::Pause: return "pause";
        case CommandType::Resume: return "resume";
        case CommandType::Cancel: return "cancel";
        case CommandType::Acknowledge: return "acknowledge";
    }
    return "unknown";
}

SessionController::SessionController(ControllerOptions options, AudioCapture& capture,
                                     Chunker& chunker, TranscriptionClient& client)
    : options_(std::move(options)), capture_(capture), chunker_(chunker), client_(client) {
    dispatcher_ = std::jthread([this](std::stop_token st) { dispatch(st); });
}

SessionController::~SessionController() {
    shutdown();
}

void SessionController::add_observer(SessionObserver* observer) {
    observers_.push_back(observer);
}

void SessionController::post(Command cmd) {
    enqueue(CommandItem{.cmd = std::move(cmd), .reply = std::nullopt});
}

std::future<CommandOutcome> SessionController::submit(Command cmd) {
    std::promise<CommandOutcome> reply;
    auto future = reply.get_future();
    {
        std::lock_guard lock(queue_mutex_);
        if (stopped_) {
            reply.set_value(CommandOutcome{});
            return future;
        }
        queue_.push_back(CommandItem{.cmd = std::move(cmd), .reply = std::move(reply)});
    }
    queue_cv_.notify_one();
    return future;
}

void SessionController::enqueue(QueueItem item) {
    {
        std::lock_guard lock(queue_mutex_);
        if (stopped_) return;
        queue_.push_back(std::move(item));
    }
    queue_cv_.notify_one();
}

SessionSnapshot SessionController::snapshot() const {
    std::lock_guard lock(mutex_);
    SessionSnapshot snap;
    if (!session_) return snap;

    snap.session_id = session_->id();
    snap.state = session_->state();
    snap.device = session_->device();
    snap.elapsed_s = session_->elapsed_s();
    if (snap.state == SessionState::Recording || snap.state == SessionState::Paused) {
        snap.level = capture_.current_level();
        snap.levels = capture_.level_history();
    }
    return snap;
}

void SessionController::shutdown() {
    {
        std::lock_guard lock(queue_mutex_);
        if (stopped_) return;
        stopped_ = true;
    }
    dispatcher_.request_stop();
    if (dispatcher_.joinable()) dispatcher_.join();

    {
        std::lock_guard lock(mutex_);
        if (session_) {
            auto s = session_->state();
            if (s == SessionState::Recording || s == SessionState::Paused) capture_.cancel();
        }
        retire_worker();
    }
    retired_.clear();

    std::deque<QueueItem> leftover;
    {
        std::lock_guard lock(queue_mutex_);
        leftover.swap(queue_);
    }
    for (auto& item : leftover) {
        if (auto* c = std::get_if<CommandItem>(&item); c && c->reply) {
            c->reply->set_value(CommandOutcome{});
        }
    }
}

void SessionController::dispatch(std::stop_token stop) {
    while (true) {
        std::optional<QueueItem> item;
        {
            std::unique_lock lock(queue_mutex_);
            if (!queue_cv_.wait(lock, stop, [this] { return !queue_.empty(); })) break;
            item.emplace(std::move(queue_.front()));
            queue_.pop_front();
        }

        std::vector<Emission> out;
        if (auto* c = std::get_if<CommandItem>(&*item)) {
            CommandOutcome result;
            {
                std::lock_guard lock(mutex_);
                result = handle(c->cmd, out);
            }
            emit(out);
            if (!result.applied && result.error) {
                for (auto* obs : observers_) obs->on_rejected(c->cmd.type, *result.error);
            }
            if (c->reply) c->reply->set_value(std::move(result));
        } else {
            auto& done = std::get<CompletionItem>(*item);
            {
                std::lock_guard lock(mutex_);
                handle_completion(done, out);
            }
            emit(out);
        }
    }
}

void SessionController::emit(const std::vector<Emission>& events) {
    for (auto& ev : events) {
        if (auto* st = std::get_if<StateEvent>(&ev)) {
            for (auto* obs : observers_) obs->on_state_changed(*st);
        } else {
            auto& res = std::get<ResultEvent>(ev);
            for (auto* obs : observers_) obs->on_result(res);
        }
    }
}

CommandOutcome SessionController::handle(const Command& cmd, std::vector<Emission>& out) {
    switch (cmd.type) {
        case CommandType::Start: return handle_start(cmd, out);
        case CommandType::Stop: return handle_stop(out);
        case CommandType::Pause: return handle_pause(out);
        case CommandType::Resume: return handle_resume(out);
        case CommandType::Cancel: return handle_cancel(out);
        case CommandType::Acknowledge: return handle_acknowledge(cmd, out);
    }
    return outcome(false);
}

CommandOutcome SessionController::handle_start(const Command& cmd, std::vector<Emission>& out) {
    // A start while any session exists is rejected, never queued.
    if (session_) {
        return rejected(ErrorKind::SessionAlreadyActive, "a session is already active");
    }
    if (!client_.is_configured()) {
        return rejected(ErrorKind::NotConfigured, "no transcription provider configured");
    }

    auto device = capture_.start(cmd.device.empty() ? options_.default_device : cmd.device);
    if (!device) {
        CommandOutcome r = outcome(false);
        r.error = device.error();
        return r;
    }

    session_.emplace(++next_id_, *device);
    session_->apply(SessionEvent::Start);
    out.emplace_back(state_event());
    return outcome(true);
}

CommandOutcome SessionController::handle_stop(std::vector<Emission>& out) {
    if (!session_) return outcome(false);
    auto state = session_->state();
    if (state != SessionState::Recording && state != SessionState::Paused) return outcome(false);

    session_->set_audio(capture_.stop());
    const auto& audio = session_->audio();

    auto recorded = std::chrono::duration<double>(audio.duration_s());
    if (recorded < options_.min_recording) {
        session_->set_error({ErrorKind::RecordingTooShort,
                             std::format("recording of {:.0f} ms is shorter than {} ms",
                                         audio.duration_s() * 1000.0,
                                         options_.min_recording.count())});
        session_->take_audio();
        finish(SessionEvent::Reject, out);
        return outcome(true);
    }
    if (audio.empty()) {
        session_->set_error({ErrorKind::NoAudio, "no audio captured"});
        finish(SessionEvent::Reject, out);
        return outcome(true);
    }

    session_->apply(SessionEvent::Stop);
    out.emplace_back(state_event());
    launch_transcription(session_->id(), session_->take_audio());
    return outcome(true);
}

CommandOutcome SessionController::handle_pause(std::vector<Emission>& out) {
    if (!session_ || session_->state() != SessionState::Recording) return outcome(false);
    capture_.pause();
    session_->apply(SessionEvent::Pause);
    out.emplace_back(state_event());
    return outcome(true);
}

CommandOutcome SessionController::handle_resume(std::vector<Emission>& out) {
    if (!session_ || session_->state() != SessionState::Paused) return outcome(false);
    capture_.resume();
    session_->apply(SessionEvent::Resume);
    out.emplace_back(state_event());
    return outcome(true);
}

CommandOutcome SessionController::handle_cancel(std::vector<Emission>& out) {
    if (!session_) return outcome(false);

    switch (session_->state()) {
        case SessionState::Recording:
        case SessionState::Paused:
            capture_.cancel();
            break;
        case SessionState::Transcribing:
            retire_worker();
            break;
        default:
            return outcome(false);
    }

    session_->take_audio();
    session_->set_error({ErrorKind::Cancelled, "cancelled"});
    finish(SessionEvent::Cancel, out);
    return outcome(true);
}

CommandOutcome SessionController::handle_acknowledge(const Command& cmd,
                                                     std::vector<Emission>& out) {
    if (!session_ || !is_terminal(session_->state())) return outcome(false);
    if (cmd.session_id != 0 && cmd.session_id != session_->id()) return outcome(false);

    uint64_t id = session_->id();
    session_->apply(SessionEvent::Acknowledge);
    session_.reset();
    out.emplace_back(StateEvent{.session_id = id, .state = SessionState::Idle,
                                .timestamp = std::chrono::system_clock::now(),
                                .device = {}, .elapsed_s = 0.0});
    return CommandOutcome{.applied = true, .state = SessionState::Idle,
                          .session_id = id, .error = std::nullopt};
}

void SessionController::handle_completion(CompletionItem& item, std::vector<Emission>& out) {
    // Responses for a cancelled or superseded session are dropped here.
    if (!session_ || session_->id() != item.session_id ||
        session_->state() != SessionState::Transcribing) {
        return;
    }

    if (item.result) {
        session_->set_result(std::move(*item.result));
        finish(SessionEvent::Success, out);
    } else {
        session_->set_error(std::move(item.result.error()));
        finish(SessionEvent::Failure, out);
    }
}

void SessionController::finish(SessionEvent event, std::vector<Emission>& out) {
    session_->apply(event);
    out.emplace_back(state_event());
    out.emplace_back(ResultEvent{
        .session_id = session_->id(),
        .state = session_->state(),
        .transcript = session_->result(),
        .error = session_->error(),
        .recorded_s = session_->elapsed_s(),
        .device = session_->device(),
    });
}

void SessionController::launch_transcription(uint64_t session_id, AudioBuffer audio) {
    std::erase_if(retired_, [](const Worker& w) { return w.done->load(); });
    retire_worker();

    auto done = std::make_shared<std::atomic<bool>>(false);
    worker_.done = done;
    worker_.thread = std::jthread([this, session_id, done, audio = std::move(audio)]
                                  (std::stop_token st) mutable {
        std::expected<TranscriptResult, PipelineError> result =
            std::unexpected(PipelineError{ErrorKind::NoAudio, "nothing to transcribe"});

        auto segments = chunker_.split(std::move(audio), st);
        if (!segments) {
            result = std::unexpected(segments.error());
        } else if (!segments->empty()) {
            result = client_.transcribe(*segments, options_.request, options_.post_process, st);
        }

        enqueue(CompletionItem{.session_id = session_id, .result = std::move(result)});
        done->store(true);
    });
}

void SessionController::retire_worker() {
    if (!worker_.thread.joinable()) return;
    worker_.thread.request_stop();
    retired_.push_back(std::move(worker_));
    worker_ = Worker{};
}

StateEvent SessionController::state_event() const {
    return StateEvent{
        .session_id = session_->id(),
        .state = session_->state(),
        .timestamp = std::chrono::system_clock::now(),
        .device = session_->device(),
        .elapsed_s = session_->elapsed_s(),
    };
}

CommandOutcome SessionController::outcome(bool applied) const {
    CommandOutcome r;
    r.applied = applied;
    if (session_) {
        r.state = session_->state();
        r.session_id = session_->id();
    }
    return r;
}

CommandOutcome SessionController::rejected(ErrorKind kind, std::string message) const {
    CommandOutcome r = outcome(false);
    r.error = PipelineError{kind, std::move(message)};
    return r;
}
