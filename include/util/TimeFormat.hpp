#pragma once

#include <ctime>
#include <optional>
#include <string>

namespace musician::util {

// Local time as "YYYY-MM-DD HH:MM:SS" (the text form SQLite date functions accept)
std::string format_local_time(std::time_t t);

// Inverse of format_local_time; nullopt on malformed input
std::optional<std::time_t> parse_local_time(const std::string& text);

}  // namespace musician::util
