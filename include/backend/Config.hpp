#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace musician::backend {

struct Config {
    // Catalog settings
    std::filesystem::path database;
    int busy_timeout_ms = 5000;
    int retry_attempts = 3;
    int retry_backoff_ms = 100;

    // Scan settings
    int scan_progress_interval = 500;
    size_t hash_chunk_size = 4096;
    std::vector<std::string> exclude_extensions = {"plist", "jpg"};
    std::vector<std::string> exclude_names = {".DS_Store"};

    // Copy settings
    int copy_progress_interval = 250;

    // Log settings
    std::filesystem::path log_file;
    std::string log_level = "info";
};

class ConfigLoader {
public:
    // Reads $MUSICIAN_CONFIG or the default config file, then applies
    // the MUSICIAN_DB override.
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static void save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();
    static Config create_default_config();

    // "plist, .JPG ,jpg" -> {"plist", "jpg"}
    static std::vector<std::string> split_list(const std::string& value, bool as_extensions);
};

}  // namespace musician::backend
