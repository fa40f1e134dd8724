#pragma once

#include <filesystem>
#include <string>

namespace musician::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Opens (truncates) the log file and sets the minimum level written.
    static void init(const std::filesystem::path& path, Level min_level = Level::Info);
    static Level parse_level(const std::string& name);
    static std::filesystem::path default_path();

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace musician::util
