#include "platform/linux/wayland_paste_output.hpp"

#include "platform/linux/subprocess.hpp"
#include "platform/linux/wayland_clipboard_output.hpp"

#include <unistd.h>

std::expected<void, std::string> WaylandPasteOutput::deliver(const std::string& text) {
    WaylandClipboardOutput clip;
    auto copied = clip.deliver(text);
    if (!copied) return copied;

    // Give the compositor a moment to publish the new selection.
    ::usleep(10000);

    auto res = subprocess::run({"wtype", "-M", "ctrl", "-k", "v"}, {});
    if (!res) return std::unexpected(res.error());

    if (res->exit_code == subprocess::kExecFailed) {
        return std::unexpected(std::string("wtype not found, text left on clipboard"));
    }
    if (res->exit_code != 0) {
        return std::unexpected("wtype paste failed with code " + std::to_string(res->exit_code));
    }
    return {};
}
