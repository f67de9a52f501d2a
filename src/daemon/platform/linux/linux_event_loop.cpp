#include "platform/linux/linux_event_loop.hpp"

#include "platform/linux/wayland_clipboard_output.hpp"
#include "platform/linux/wayland_paste_output.hpp"
#include "platform/platform_paths.hpp"
#include "transcription/provider_factory.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      ring_(config_.audio.ring_capacity_samples()),
      audio_source_(ring_, config_.audio.sample_rate, config_.audio.channels),
      compressor_(config_.chunker.bitrate),
      core_(config_, verbose_, build_providers(config_),
            audio_source_, ring_, &compressor_, ipc_server_,
            // OutputFactory
            [](const std::string& method) -> std::unique_ptr<OutputMethod> {
                if (method == "clipboard") return std::make_unique<WaylandClipboardOutput>();
                if (method == "paste") return std::make_unique<WaylandPasteOutput>();
                return nullptr;
            },
            // NotifyCallback
            [this]() {
                uint64_t val = 1;
                if (::write(session_event_fd_, &val, sizeof(val)) < 0) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (session_event_fd_ >= 0) ::close(session_event_fd_);
}

bool LinuxEventLoop::init() {
    // Created first: controller callbacks may fire as soon as a command runs.
    session_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (session_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    auto data = platform::data_dir();
    auto db_path = data.empty() ? std::string("/tmp/mindscribe/history.db")
                                : (std::filesystem::path(data) / "history.db").string();
    if (!core_.init(db_path)) return false;

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd. SIGPIPE is ignored so a child that
    // closes its stdin early cannot take the daemon down.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);
    ::signal(SIGPIPE, SIG_IGN);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0) return true;
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(session_event_fd_, EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    // Wake-up period for the recording length check.
    constexpr int kLimitCheckMs = 250;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int timeout = core_.is_recording() ? kLimitCheckMs : -1;
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, timeout);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log("Received signal, shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
                        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == session_event_fd_) {
                uint64_t val;
                while (::read(session_event_fd_, &val, sizeof(val)) > 0) {}
                core_.on_session_event();
                continue;
            }

            handle_client(fd);
        }

        core_.enforce_recording_limit();
    }

    core_.shutdown();
}

void LinuxEventLoop::handle_client(int fd) {
    std::vector<nlohmann::json> cmds;
    bool connected = ipc_server_.read_commands(fd, cmds);

    for (auto& cmd : cmds) {
        std::string cmd_str = cmd.value("cmd", "");
        auto response = core_.handle_command(cmd_str, cmd);

        if (response.value("status", "") == "transcribing") {
            core_.add_waiting_client(fd);
        } else if (!ipc_server_.send_response(fd, response)) {
            connected = false;
        }
    }

    if (!connected) drop_client(fd);
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ipc_server_.close_client(fd);
    core_.remove_waiting_client(fd);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[mindscribe] {}", msg);
    }
}
