#include "platform/linux/wayland_clipboard_output.hpp"

#include "platform/linux/subprocess.hpp"

std::expected<void, std::string> WaylandClipboardOutput::deliver(const std::string& text) {
    auto res = subprocess::run({"wl-copy"}, text);
    if (!res) return std::unexpected(res.error());

    if (res->exit_code == subprocess::kExecFailed) {
        return std::unexpected(std::string("wl-copy not found"));
    }
    if (res->exit_code != 0) {
        return std::unexpected("wl-copy exited with code " + std::to_string(res->exit_code));
    }
    return {};
}
