#pragma once

#include <initializer_list>
#include <map>
#include <string>
#include <string_view>

namespace dotenv {

// Parses KEY=VALUE lines. Blank lines and '#' comments are skipped, an
// "export " prefix is accepted and matching single or double quotes around
// the value are removed.
std::map<std::string, std::string> parse(std::string_view content);

// Loads path into the process environment without overriding variables
// that are already set. Returns the number of entries read, or -1 when the
// file cannot be read.
int load(const std::string& path);

// Loads the first .env found in the given directories.
int load_first(std::initializer_list<std::string> dirs);

} // namespace dotenv
