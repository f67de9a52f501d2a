#include <catch2/catch_test_macros.hpp>

#include "audio_capture.hpp"
#include "chunker.hpp"
#include "platform/audio_source.hpp"
#include "sample_ring.hpp"
#include "session_controller.hpp"
#include "transcription/transcription_client.hpp"

#include <condition_variable>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

class MockAudioSource : public AudioSource {
public:
    explicit MockAudioSource(SampleRing& ring) : ring_(ring) {}

    std::vector<InputDevice> list_devices() override {
        return {{.id = "default-mic", .description = "Built-in", .is_default = true}};
    }

    std::expected<std::string, std::string> open(const std::string& device_id) override {
        if (unavailable.contains(device_id)) return std::unexpected("no such device");
        open_ = true;
        return device_id.empty() ? std::string("default-mic") : device_id;
    }

    void close() override { open_ = false; }
    bool is_open() const override { return open_; }

    void feed_seconds(double seconds) {
        std::vector<int16_t> samples(static_cast<size_t>(seconds * 16000), 1200);
        ring_.push(samples);
    }

    std::set<std::string> unavailable;

private:
    SampleRing& ring_;
    bool open_ = false;
};

// Answers with a fixed reply; in blocking mode holds every call until
// release() regardless of cancellation.
class ScriptedProvider : public TranscriptionProvider {
public:
    const std::string& name() const override { return name_; }

    std::expected<std::string, ProviderError>
    transcribe(const AudioSegment& segment, const TranscribeRequest&, std::stop_token) override {
        std::unique_lock lock(mutex_);
        ++calls_;
        frames_ += segment.frame_count;
        entered_ = true;
        cv_.notify_all();
        if (blocking) cv_.wait(lock, [this] { return released_; });
        returned_ = true;
        cv_.notify_all();
        return reply;
    }

    void release() {
        std::lock_guard lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

    bool wait_entered() {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, 5s, [this] { return entered_; });
    }

    bool wait_returned() {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, 5s, [this] { return returned_; });
    }

    int calls() {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    size_t frames() {
        std::lock_guard lock(mutex_);
        return frames_;
    }

    std::expected<std::string, ProviderError> reply = std::string("hello world");
    bool blocking = false;

private:
    std::string name_ = "mock";
    std::mutex mutex_;
    std::condition_variable cv_;
    int calls_ = 0;
    size_t frames_ = 0;
    bool entered_ = false;
    bool released_ = false;
    bool returned_ = false;
};

// Holds every call until the caller's stop token fires.
class StallingCompressor : public AudioCompressor {
public:
    std::expected<CompressedAudio, std::string>
    compress(std::span<const uint8_t>, std::stop_token stop) override {
        std::unique_lock lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, stop, [] { return false; });
        returned_ = true;
        cv_.notify_all();
        return std::unexpected(std::string("stopped"));
    }

    bool wait_entered() {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, 5s, [this] { return entered_; });
    }

    bool wait_returned() {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, 5s, [this] { return returned_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable_any cv_;
    bool entered_ = false;
    bool returned_ = false;
};

class RecordingObserver : public SessionObserver {
public:
    void on_state_changed(const StateEvent& event) override {
        std::lock_guard lock(mutex_);
        states_.push_back(event.state);
        cv_.notify_all();
    }

    void on_result(const ResultEvent& event) override {
        std::lock_guard lock(mutex_);
        results_.push_back(event);
        cv_.notify_all();
    }

    void on_rejected(CommandType, const PipelineError& error) override {
        std::lock_guard lock(mutex_);
        rejections_.push_back(error.kind);
    }

    bool wait_results(size_t n) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, 5s, [&] { return results_.size() >= n; });
    }

    std::vector<SessionState> states() {
        std::lock_guard lock(mutex_);
        return states_;
    }

    std::vector<ResultEvent> results() {
        std::lock_guard lock(mutex_);
        return results_;
    }

    std::vector<ErrorKind> rejections() {
        std::lock_guard lock(mutex_);
        return rejections_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<SessionState> states_;
    std::vector<ResultEvent> results_;
    std::vector<ErrorKind> rejections_;
};

std::vector<std::shared_ptr<TranscriptionProvider>> providers_for(
    const std::shared_ptr<ScriptedProvider>& p, bool configured) {
    if (!configured) return {};
    return {p};
}

struct Harness {
    explicit Harness(bool configured = true,
                     std::chrono::milliseconds min_recording = 500ms,
                     AudioCompressor* compressor = nullptr)
        : source(ring), capture(source, ring, 16000),
          chunker(ChunkerOptions{.max_segment_bytes = compressor ? 4096 : 25 * 1024 * 1024,
                                 .compress = compressor != nullptr},
                  compressor),
          provider(std::make_shared<ScriptedProvider>()),
          client(providers_for(provider, configured), RetryPolicy{}, 3,
                 [](std::chrono::milliseconds, std::stop_token) { return true; }),
          controller(ControllerOptions{.min_recording = min_recording, .default_device = {},
                                       .request = {.language = "fr", .prompt = {},
                                                   .deadline = 60000ms},
                                       .post_process = false},
                     capture, chunker, client) {
        controller.add_observer(&observer);
    }

    ~Harness() { provider->release(); }

    CommandOutcome run(CommandType type) { return controller.execute(Command{.type = type}); }

    SampleRing ring{16000 * 10};
    MockAudioSource source;
    AudioCapture capture;
    Chunker chunker;
    std::shared_ptr<ScriptedProvider> provider;
    TranscriptionClient client;
    RecordingObserver observer;
    SessionController controller;
};

} // namespace

TEST_CASE("SessionController lifecycle", "[controller]") {
    Harness h;

    SECTION("RecordAndTranscribe") {
        auto started = h.run(CommandType::Start);
        REQUIRE(started.applied);
        REQUIRE(started.state == SessionState::Recording);
        REQUIRE(started.session_id == 1);

        h.source.feed_seconds(1.0);
        auto stopped = h.run(CommandType::Stop);
        REQUIRE(stopped.applied);
        REQUIRE(stopped.state == SessionState::Transcribing);

        REQUIRE(h.observer.wait_results(1));
        auto results = h.observer.results();
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].session_id == 1);
        REQUIRE(results[0].state == SessionState::Completed);
        REQUIRE(results[0].transcript.has_value());
        REQUIRE(results[0].transcript->text == "hello world");
        REQUIRE(results[0].device == "default-mic");
        REQUIRE(h.provider->frames() == 16000);

        REQUIRE(h.observer.states() == std::vector<SessionState>{
            SessionState::Recording, SessionState::Transcribing, SessionState::Completed});
        REQUIRE(h.controller.snapshot().state == SessionState::Completed);

        auto acked = h.run(CommandType::Acknowledge);
        REQUIRE(acked.applied);
        REQUIRE(acked.state == SessionState::Idle);
        REQUIRE(h.controller.snapshot().state == SessionState::Idle);
        REQUIRE(h.controller.snapshot().session_id == 0);
        REQUIRE(h.observer.results().size() == 1);
    }

    SECTION("PauseDiscardsAudioUntilResume") {
        REQUIRE(h.run(CommandType::Start).applied);
        h.source.feed_seconds(1.0);

        auto paused = h.run(CommandType::Pause);
        REQUIRE(paused.applied);
        REQUIRE(paused.state == SessionState::Paused);
        REQUIRE_FALSE(h.run(CommandType::Pause).applied);

        h.source.feed_seconds(0.5);
        REQUIRE(h.run(CommandType::Resume).applied);
        h.source.feed_seconds(0.5);

        REQUIRE(h.run(CommandType::Stop).applied);
        REQUIRE(h.observer.wait_results(1));
        REQUIRE(h.observer.results()[0].state == SessionState::Completed);
        REQUIRE(h.provider->frames() == 24000);
        REQUIRE(h.observer.states() == std::vector<SessionState>{
            SessionState::Recording, SessionState::Paused, SessionState::Recording,
            SessionState::Transcribing, SessionState::Completed});
    }

    SECTION("StopWhilePausedTranscribes") {
        REQUIRE(h.run(CommandType::Start).applied);
        h.source.feed_seconds(1.0);
        REQUIRE(h.run(CommandType::Pause).applied);

        auto stopped = h.run(CommandType::Stop);
        REQUIRE(stopped.applied);
        REQUIRE(stopped.state == SessionState::Transcribing);
        REQUIRE(h.observer.wait_results(1));
        REQUIRE(h.observer.results()[0].state == SessionState::Completed);
    }

    SECTION("TooShortRecordingNeverReachesProvider") {
        REQUIRE(h.run(CommandType::Start).applied);
        h.source.feed_seconds(0.2);

        auto stopped = h.run(CommandType::Stop);
        REQUIRE(stopped.applied);
        REQUIRE(stopped.state == SessionState::Failed);

        auto results = h.observer.results();
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].state == SessionState::Failed);
        REQUIRE(results[0].error.has_value());
        REQUIRE(results[0].error->kind == ErrorKind::RecordingTooShort);
        REQUIRE(h.provider->calls() == 0);
    }

    SECTION("ImmediateStopIsTooShort") {
        REQUIRE(h.run(CommandType::Start).applied);
        auto stopped = h.run(CommandType::Stop);
        REQUIRE(stopped.state == SessionState::Failed);

        auto results = h.observer.results();
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].error->kind == ErrorKind::RecordingTooShort);
        REQUIRE(h.provider->calls() == 0);
    }

    SECTION("ProviderFailureFailsTheSession") {
        h.provider->reply = std::unexpected(ProviderError{ProviderErrorKind::Auth, 401, "bad key"});
        REQUIRE(h.run(CommandType::Start).applied);
        h.source.feed_seconds(1.0);
        REQUIRE(h.run(CommandType::Stop).applied);

        REQUIRE(h.observer.wait_results(1));
        auto results = h.observer.results();
        REQUIRE(results[0].state == SessionState::Failed);
        REQUIRE(results[0].error->kind == ErrorKind::AllProvidersExhausted);
        REQUIRE_FALSE(results[0].transcript.has_value());
    }

    SECTION("NextSessionAfterAcknowledge") {
        REQUIRE(h.run(CommandType::Start).applied);
        REQUIRE(h.run(CommandType::Stop).state == SessionState::Failed);
        REQUIRE(h.run(CommandType::Acknowledge).applied);

        auto again = h.run(CommandType::Start);
        REQUIRE(again.applied);
        REQUIRE(again.session_id == 2);
        REQUIRE(h.run(CommandType::Cancel).applied);
    }
}

TEST_CASE("SessionController without a minimum duration", "[controller]") {
    Harness h(true, 0ms);

    SECTION("EmptyCaptureIsNoAudio") {
        REQUIRE(h.run(CommandType::Start).applied);
        auto stopped = h.run(CommandType::Stop);
        REQUIRE(stopped.state == SessionState::Failed);
        REQUIRE(h.observer.results()[0].error->kind == ErrorKind::NoAudio);
        REQUIRE(h.provider->calls() == 0);
    }

    SECTION("ShortCaptureIsTranscribed") {
        REQUIRE(h.run(CommandType::Start).applied);
        h.source.feed_seconds(0.2);
        REQUIRE(h.run(CommandType::Stop).state == SessionState::Transcribing);
        REQUIRE(h.observer.wait_results(1));
        REQUIRE(h.observer.results()[0].state == SessionState::Completed);
        REQUIRE(h.provider->frames() == 3200);
    }
}

TEST_CASE("SessionController rejections", "[controller]") {
    SECTION("StartWhileActive") {
        Harness h;
        REQUIRE(h.run(CommandType::Start).applied);

        auto second = h.run(CommandType::Start);
        REQUIRE_FALSE(second.applied);
        REQUIRE(second.error.has_value());
        REQUIRE(second.error->kind == ErrorKind::SessionAlreadyActive);
        REQUIRE(second.session_id == 1);
        REQUIRE(h.observer.rejections() == std::vector<ErrorKind>{ErrorKind::SessionAlreadyActive});
        REQUIRE(h.controller.snapshot().state == SessionState::Recording);
    }

    SECTION("StartWhileAwaitingAcknowledge") {
        Harness h;
        REQUIRE(h.run(CommandType::Start).applied);
        REQUIRE(h.run(CommandType::Stop).state == SessionState::Failed);

        auto second = h.run(CommandType::Start);
        REQUIRE_FALSE(second.applied);
        REQUIRE(second.error->kind == ErrorKind::SessionAlreadyActive);
    }

    SECTION("CommandsWhileIdleAreNoOps") {
        Harness h;
        for (auto type : {CommandType::Stop, CommandType::Pause, CommandType::Resume,
                          CommandType::Cancel, CommandType::Acknowledge}) {
            auto r = h.run(type);
            REQUIRE_FALSE(r.applied);
            REQUIRE_FALSE(r.error.has_value());
            REQUIRE(r.state == SessionState::Idle);
        }
        REQUIRE(h.observer.states().empty());
        REQUIRE(h.observer.results().empty());
    }

    SECTION("AcknowledgeForAnotherSession") {
        Harness h;
        REQUIRE(h.run(CommandType::Start).applied);
        REQUIRE(h.run(CommandType::Stop).state == SessionState::Failed);

        auto r = h.controller.execute(Command{.type = CommandType::Acknowledge, .device = {},
                                              .session_id = 42});
        REQUIRE_FALSE(r.applied);
        REQUIRE(h.controller.snapshot().state == SessionState::Failed);
    }

    SECTION("NotConfigured") {
        Harness h(false);
        auto r = h.run(CommandType::Start);
        REQUIRE_FALSE(r.applied);
        REQUIRE(r.error->kind == ErrorKind::NotConfigured);
        REQUIRE(h.controller.snapshot().state == SessionState::Idle);
        REQUIRE_FALSE(h.source.is_open());
    }

    SECTION("NoInputDevice") {
        Harness h;
        h.source.unavailable = {"usb-mic", ""};
        auto r = h.controller.execute(Command{.type = CommandType::Start, .device = "usb-mic",
                                              .session_id = 0});
        REQUIRE_FALSE(r.applied);
        REQUIRE(r.error->kind == ErrorKind::DeviceUnavailable);
        REQUIRE(h.controller.snapshot().state == SessionState::Idle);
        REQUIRE(h.observer.states().empty());
    }
}

TEST_CASE("SessionController cancellation", "[controller]") {
    Harness h;

    SECTION("WhileRecording") {
        REQUIRE(h.run(CommandType::Start).applied);
        h.source.feed_seconds(1.0);

        auto r = h.run(CommandType::Cancel);
        REQUIRE(r.applied);
        REQUIRE(r.state == SessionState::Cancelled);
        REQUIRE_FALSE(h.source.is_open());
        REQUIRE(h.provider->calls() == 0);

        auto results = h.observer.results();
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].state == SessionState::Cancelled);
        REQUIRE(results[0].error->kind == ErrorKind::Cancelled);
    }

    SECTION("WhilePaused") {
        REQUIRE(h.run(CommandType::Start).applied);
        h.source.feed_seconds(1.0);
        REQUIRE(h.run(CommandType::Pause).applied);

        auto r = h.run(CommandType::Cancel);
        REQUIRE(r.applied);
        REQUIRE(r.state == SessionState::Cancelled);
        REQUIRE_FALSE(h.source.is_open());
        REQUIRE(h.provider->calls() == 0);

        auto results = h.observer.results();
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].state == SessionState::Cancelled);
        REQUIRE(results[0].error->kind == ErrorKind::Cancelled);
        REQUIRE_FALSE(results[0].transcript.has_value());
        REQUIRE(h.observer.states() == std::vector<SessionState>{
            SessionState::Recording, SessionState::Paused, SessionState::Cancelled});

        REQUIRE(h.run(CommandType::Acknowledge).applied);
        REQUIRE(h.run(CommandType::Start).applied);
    }

    SECTION("LateResponseIsDiscarded") {
        h.provider->blocking = true;
        REQUIRE(h.run(CommandType::Start).applied);
        h.source.feed_seconds(1.0);
        REQUIRE(h.run(CommandType::Stop).applied);
        REQUIRE(h.provider->wait_entered());

        auto r = h.run(CommandType::Cancel);
        REQUIRE(r.applied);
        REQUIRE(r.state == SessionState::Cancelled);

        h.provider->release();
        REQUIRE(h.provider->wait_returned());
        std::this_thread::sleep_for(100ms);

        auto results = h.observer.results();
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].state == SessionState::Cancelled);
        REQUIRE_FALSE(results[0].transcript.has_value());
        REQUIRE(h.controller.snapshot().state == SessionState::Cancelled);
    }

    SECTION("CancelAfterCompletionIsNoOp") {
        REQUIRE(h.run(CommandType::Start).applied);
        h.source.feed_seconds(1.0);
        REQUIRE(h.run(CommandType::Stop).applied);
        REQUIRE(h.observer.wait_results(1));

        REQUIRE_FALSE(h.run(CommandType::Cancel).applied);
        REQUIRE(h.controller.snapshot().state == SessionState::Completed);
    }

    SECTION("ShutdownWhileRecording") {
        REQUIRE(h.run(CommandType::Start).applied);
        h.controller.shutdown();
        REQUIRE_FALSE(h.source.is_open());
        auto r = h.run(CommandType::Stop);
        REQUIRE_FALSE(r.applied);
    }
}

TEST_CASE("SessionController cancellation during compression", "[controller]") {
    StallingCompressor compressor;
    Harness h(true, 500ms, &compressor);

    REQUIRE(h.run(CommandType::Start).applied);
    h.source.feed_seconds(1.0);
    REQUIRE(h.run(CommandType::Stop).state == SessionState::Transcribing);
    REQUIRE(compressor.wait_entered());

    auto r = h.run(CommandType::Cancel);
    REQUIRE(r.applied);
    REQUIRE(r.state == SessionState::Cancelled);
    REQUIRE(compressor.wait_returned());

    std::this_thread::sleep_for(100ms);
    REQUIRE(h.provider->calls() == 0);
    auto results = h.observer.results();
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].state == SessionState::Cancelled);
}
