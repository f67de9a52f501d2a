#include "dotenv.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace dotenv {

namespace {

std::string_view trim(std::string_view s) {
    auto b = s.find_first_not_of(" \t\r");
    if (b == std::string_view::npos) return {};
    auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

} // namespace

std::map<std::string, std::string> parse(std::string_view content) {
    std::map<std::string, std::string> vars;

    while (!content.empty()) {
        auto nl = content.find('\n');
        auto line = trim(content.substr(0, nl));
        content = nl == std::string_view::npos ? std::string_view{} : content.substr(nl + 1);

        if (line.empty() || line.front() == '#') continue;
        if (line.starts_with("export ")) line = trim(line.substr(7));

        auto eq = line.find('=');
        if (eq == std::string_view::npos) continue;

        auto key = trim(line.substr(0, eq));
        auto value = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else if (auto hash = value.find(" #"); hash != std::string_view::npos) {
            value = trim(value.substr(0, hash));
        }

        vars[std::string(key)] = std::string(value);
    }
    return vars;
}

int load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) return -1;

    std::stringstream ss;
    ss << f.rdbuf();

    int count = 0;
    for (auto& [key, value] : parse(ss.str())) {
        if (::setenv(key.c_str(), value.c_str(), 0) == 0) ++count;
    }
    return count;
}

int load_first(std::initializer_list<std::string> dirs) {
    for (auto& dir : dirs) {
        if (dir.empty()) continue;
        auto path = std::filesystem::path(dir) / ".env";
        if (std::filesystem::exists(path)) return load(path.string());
    }
    return -1;
}

} // namespace dotenv
