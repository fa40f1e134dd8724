#pragma once

#include <filesystem>
#include <string>

namespace musician::util {

// XDG-style locations. None of these log: the logger resolves its own default
// path through here.
class Platform {
public:
    static std::filesystem::path get_config_directory();
    static std::filesystem::path get_cache_directory();
    static std::filesystem::path get_data_directory();

    static std::string get_env_or(const char* key, const std::string& defval);
};

}  // namespace musician::util
