#include "util/Platform.hpp"
#include <cstdlib>

namespace musician::util {

namespace {
    std::filesystem::path xdg_or_home(const char* xdg_var, const char* home_suffix, const char* fallback) {
        if (const char* xdg = std::getenv(xdg_var); xdg && *xdg) {
            return std::filesystem::path(xdg) / "musician";
        }
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / home_suffix / "musician";
        }
        return fallback;
    }
}

std::filesystem::path Platform::get_config_directory() {
    return xdg_or_home("XDG_CONFIG_HOME", ".config", ".config/musician");
}

std::filesystem::path Platform::get_cache_directory() {
    return xdg_or_home("XDG_CACHE_HOME", ".cache", "/tmp/musician_cache");
}

std::filesystem::path Platform::get_data_directory() {
    return xdg_or_home("XDG_DATA_HOME", ".local/share", ".local/share/musician");
}

std::string Platform::get_env_or(const char* key, const std::string& defval) {
    if (const char* v = std::getenv(key)) return std::string(v);
    return defval;
}

}  // namespace musician::util
