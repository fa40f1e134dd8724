#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace musician::backend {

namespace {
    std::string trim(const std::string& s) {
        auto start = s.find_first_not_of(" \t\r");
        if (start == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\r");
        return s.substr(start, end - start + 1);
    }

    template <typename T>
    void parse_number(const std::string& value, T& out) {
        try {
            long long v = std::stoll(value);
            if (v >= 0) out = static_cast<T>(v);
        } catch (const std::exception&) {
            // Keep the default on malformed input
        }
    }

    std::string join(const std::vector<std::string>& items) {
        std::string out;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i) out += ", ";
            out += items[i];
        }
        return out;
    }
}

Config ConfigLoader::load_config() {
    auto config_file = get_config_file();
    Config cfg;
    if (std::filesystem::exists(config_file)) {
        cfg = load_from_file(config_file);
    } else {
        cfg = create_default_config();
    }

    auto db_override = util::Platform::get_env_or("MUSICIAN_DB", "");
    if (!db_override.empty()) {
        cfg.database = db_override;
    }

    return cfg;
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    Config cfg = create_default_config();

    std::ifstream file(path);
    if (!file) return cfg;

    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.length() - 2);
            continue;
        }

        // Key = value
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "catalog") {
            if (key == "database") cfg.database = std::filesystem::path(value);
            else if (key == "busy_timeout_ms") parse_number(value, cfg.busy_timeout_ms);
            else if (key == "retry_attempts") parse_number(value, cfg.retry_attempts);
            else if (key == "retry_backoff_ms") parse_number(value, cfg.retry_backoff_ms);
        }
        else if (current_section == "scan") {
            if (key == "progress_interval") parse_number(value, cfg.scan_progress_interval);
            else if (key == "hash_chunk_size") parse_number(value, cfg.hash_chunk_size);
            else if (key == "exclude_extensions") cfg.exclude_extensions = split_list(value, true);
            else if (key == "exclude_names") cfg.exclude_names = split_list(value, false);
        }
        else if (current_section == "copy") {
            if (key == "progress_interval") parse_number(value, cfg.copy_progress_interval);
        }
        else if (current_section == "log") {
            if (key == "file") cfg.log_file = std::filesystem::path(value);
            else if (key == "level") cfg.log_level = value;
        }
    }

    return cfg;
}

void ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(path);
    if (!file) return;

    file << "# musician config\n\n";

    file << "[catalog]\n";
    file << "# SQLite database file (MUSICIAN_DB overrides)\n";
    file << "database = \"" << cfg.database.string() << "\"\n";
    file << "busy_timeout_ms = " << cfg.busy_timeout_ms << "\n";
    file << "# Retries for a locked/busy database before giving up\n";
    file << "retry_attempts = " << cfg.retry_attempts << "\n";
    file << "retry_backoff_ms = " << cfg.retry_backoff_ms << "\n\n";

    file << "[scan]\n";
    file << "progress_interval = " << cfg.scan_progress_interval << "\n";
    file << "hash_chunk_size = " << cfg.hash_chunk_size << "\n";
    file << "exclude_extensions = \"" << join(cfg.exclude_extensions) << "\"\n";
    file << "exclude_names = \"" << join(cfg.exclude_names) << "\"\n\n";

    file << "[copy]\n";
    file << "progress_interval = " << cfg.copy_progress_interval << "\n\n";

    file << "[log]\n";
    file << "file = \"" << cfg.log_file.string() << "\"\n";
    file << "# debug, info, warn, error\n";
    file << "level = \"" << cfg.log_level << "\"\n";
}

std::filesystem::path ConfigLoader::get_config_file() {
    auto explicit_path = util::Platform::get_env_or("MUSICIAN_CONFIG", "");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return util::Platform::get_config_directory() / "config.toml";
}

Config ConfigLoader::create_default_config() {
    Config cfg;
    cfg.database = util::Platform::get_data_directory() / "catalog.db";
    cfg.log_file = util::Logger::default_path();
    return cfg;
}

std::vector<std::string> ConfigLoader::split_list(const std::string& value, bool as_extensions) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (as_extensions) {
            if (!item.empty() && item[0] == '.') item.erase(0, 1);
            std::transform(item.begin(), item.end(), item.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        }
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

}  // namespace musician::backend
