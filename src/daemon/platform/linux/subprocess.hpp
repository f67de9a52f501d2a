#pragma once

#include <expected>
#include <string>
#include <stop_token>
#include <string_view>
#include <vector>

namespace subprocess {

// Exit code reported when the program could not be executed.
inline constexpr int kExecFailed = 127;

struct Result {
    int exit_code = 0;
    std::string output;  // stdout, only when captured
};

// fork/exec argv[0] from PATH, feed input on its stdin and wait for it.
// stdout is captured only when capture_output is set; otherwise it is
// inherited, so a child that daemonizes (wl-copy) does not hold us open.
// The caller must ignore SIGPIPE: a child may exit before reading all input.
// A stop request kills the child and reports an error.
std::expected<Result, std::string> run(const std::vector<std::string>& argv,
                                       std::string_view input, bool capture_output = false,
                                       std::stop_token stop = {});

} // namespace subprocess
