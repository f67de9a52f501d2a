#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

constexpr const char* kAppDir = "/mindscribe";

// $var/mindscribe, else $HOME/home_fallback/mindscribe.
std::string xdg_dir(const char* var, const char* home_fallback) {
    const char* xdg = std::getenv(var);
    if (xdg && *xdg) return std::string(xdg) + kAppDir;
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + home_fallback + kAppDir;
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", "/.config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", "/.local/share");
}

std::string ipc_endpoint() {
    const char* runtime = std::getenv("XDG_RUNTIME_DIR");
    if (runtime && *runtime) return std::string(runtime) + "/mindscribe.sock";
    return "/tmp/mindscribe.sock";
}

} // namespace platform
