#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start [--output clipboard|paste] [--device ID]   Start recording");
    std::println(stderr, "  stop                                  Stop recording and transcribe");
    std::println(stderr, "  toggle [--output clipboard|paste] [--device ID]  Toggle recording");
    std::println(stderr, "  pause                                 Pause (or resume) recording");
    std::println(stderr, "  resume                                Resume a paused recording");
    std::println(stderr, "  cancel                                Discard the current session");
    std::println(stderr, "  status                                Show daemon status");
    std::println(stderr, "  history [--limit N]                   Show transcription history");
    std::println(stderr, "  devices                               List audio input devices");
}

// Renders the latest amplitude values as a one-line meter.
static std::string level_meter(const json& levels) {
    static const char* bars[] = {" ", "▁", "▂", "▃", "▄", "▅", "▆", "▇", "█"};
    std::string out;
    for (auto& v : levels) {
        int idx = static_cast<int>(v.get<double>() * 8.0 + 0.5);
        out += bars[std::clamp(idx, 0, 8)];
    }
    return out;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string output_method;
    std::string device;
    int limit = 10;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--output" && i + 1 < argc) {
            output_method = argv[++i];
        } else if (arg == "--device" && i + 1 < argc) {
            device = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        }
    }

    static const std::vector<std::string> known = {
        "start", "stop", "toggle", "pause", "resume", "cancel", "status", "history", "devices"};
    if (std::find(known.begin(), known.end(), command) == known.end()) {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    json cmd = {{"cmd", command}};
    if (command == "start" || command == "toggle") {
        if (!output_method.empty()) cmd["output"] = output_method;
        if (!device.empty()) cmd["device"] = device;
    } else if (command == "history") {
        cmd["limit"] = limit;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is mindscribe running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    // stop (and a toggle that stops) replies only once the transcript is
    // ready, which can take several provider retries.
    IpcClient::Timeout timeout = std::chrono::seconds(30);
    if (command == "stop" || command == "toggle") timeout = std::nullopt;

    json response;
    if (!client.recv(response, timeout)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    auto status = response.value("status", "");

    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "status") {
        auto state = response.value("state", "unknown");
        std::println("State: {}", state);
        if (response.contains("device")) {
            std::println("Device: {}", response["device"].get<std::string>());
        }
        if (response.contains("duration")) {
            std::println("Recording duration: {:.1f}s", response["duration"].get<double>());
        }
        if (response.contains("levels")) {
            std::println("Level: [{}]", level_meter(response["levels"]));
        }
    } else if (command == "history") {
        if (response.contains("entries")) {
            for (auto& entry : response["entries"]) {
                std::println("[{}] {}", entry.value("timestamp", ""), entry.value("text", ""));
                if (entry.contains("providers") && entry["providers"].is_string()) {
                    std::println("  {:.1f}s audio via {}", entry.value("audio_duration", 0.0),
                                 entry["providers"].get<std::string>());
                }
            }
        }
    } else if (command == "devices") {
        for (auto& d : response.value("devices", json::array())) {
            std::println("{} {}  ({})", d.value("default", false) ? "*" : " ",
                         d.value("id", ""), d.value("description", ""));
        }
    } else if (response.contains("text")) {
        std::println("{}", response["text"].get<std::string>());
        if (response.contains("output_error")) {
            std::println(stderr, "Warning: {}", response["output_error"].get<std::string>());
        }
    } else if (response.contains("state")) {
        std::println("{}", response["state"].get<std::string>());
    } else if (response.contains("message")) {
        std::println("{}", response["message"].get<std::string>());
    } else {
        std::println("OK");
    }

    return 0;
}
