#pragma once

#include <string>

namespace platform {

// Per-user directories; empty when no home directory can be determined.
std::string config_dir();
std::string data_dir();
std::string ipc_endpoint();

} // namespace platform
