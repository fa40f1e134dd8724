#include "cli/CommandLine.hpp"
#include "backend/CatalogStore.hpp"
#include "backend/Config.hpp"
#include "backend/Materializer.hpp"
#include "backend/MetadataExtractor.hpp"
#include "backend/Reconciler.hpp"
#include "backend/ScanRecorder.hpp"
#include "util/Logger.hpp"
#include "util/TimeFormat.hpp"
#include <charconv>
#include <format>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace musician::cli {

namespace {

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " <command> [options]\n"
              << "\n"
              << "Catalogue music trees into a database and copy what one scan has that another lacks.\n"
              << "\n"
              << "Commands:\n"
              << "  init-store                                         Create the catalog schema (idempotent)\n"
              << "  scan --path <dir> --scan-name <name>               Record every file under <dir>\n"
              << "  scans                                              List scan sessions\n"
              << "  exts [--scan-name <name>]                          Count files per extension\n"
              << "  list-files --ext <ext> [--limit 25] [--offset 0]   Show records with an extension\n"
              << "  diff-count --origin-scan <a> --dest-scan <b>       Count files in <a> missing from <b>\n"
              << "  diff-list --origin-scan <a> --dest-scan <b>        Print paths in <a> missing from <b>\n"
              << "  copy-diff --origin-scan <a> --dest-scan <b> --folder <dir>\n"
              << "                                                     Copy files in <a> missing from <b> into <dir>\n"
              << "\n"
              << "Environment:\n"
              << "  MUSICIAN_CONFIG   config file (default ~/.config/musician/config.toml)\n"
              << "  MUSICIAN_DB       catalog database, overrides [catalog] database\n";
}

const std::string& require(const Args& args, const std::string& key) {
    auto it = args.find(key);
    if (it == args.end() || it->second.empty()) {
        throw UsageError("Missing required argument --" + key);
    }
    return it->second;
}

std::optional<std::string> optional_arg(const Args& args, const std::string& key) {
    auto it = args.find(key);
    if (it == args.end()) return std::nullopt;
    return it->second;
}

int int_arg(const Args& args, const std::string& key, int defval) {
    auto it = args.find(key);
    if (it == args.end()) return defval;
    return std::stoi(it->second);
}

template <typename T>
std::string or_dash(const std::optional<T>& value) {
    if (!value) return "-";
    if constexpr (std::is_same_v<T, std::string>) return *value;
    else return std::format("{}", *value);
}

void warn_unknown_scan(const backend::CatalogStore& store, const std::string& scan_name) {
    if (!store.scan_exists(scan_name)) {
        std::cerr << "Warning: scan '" << scan_name << "' is not in the catalog, treating it as empty\n";
    }
}

// Commands

int cmd_init_store(backend::CatalogStore& store, const backend::Config&, const Args&) {
    store.init_schema();
    std::cout << "Catalog initialized at: " << store.path().string() << "\n";
    return 0;
}

int cmd_scan(backend::CatalogStore& store, const backend::Config& config, const Args& args) {
    const std::string& path = require(args, "path");
    const std::string& scan_name = require(args, "scan-name");

    backend::ScanOptions options;
    options.progress_interval = config.scan_progress_interval;
    options.hash_chunk_size = config.hash_chunk_size;
    options.exclude_extensions = config.exclude_extensions;
    options.exclude_names = config.exclude_names;

    backend::MetadataExtractor extractor;
    backend::ScanRecorder recorder(store, extractor, options);

    backend::ScanCallbacks callbacks;
    callbacks.on_progress = [](int processed) {
        std::cout << processed << " files processed." << std::endl;
    };
    callbacks.on_file_error = [](const std::string& file, const std::string& reason) {
        std::cerr << "Error processing " << file << ": " << reason << std::endl;
    };

    auto summary = recorder.start_scan(path, scan_name, callbacks);
    switch (summary.status) {
        case model::ScanStatus::NameConflict:
            std::cout << "Scan name " << scan_name << " already exists." << std::endl;
            return 0;
        case model::ScanStatus::RootMissing:
            std::cerr << "Scan path " << path << " is not a directory." << std::endl;
            return 1;
        case model::ScanStatus::Completed:
            break;
    }

    std::cout << std::format("Scan complete ({} files, {} taggable, {} errors) for directory: {}",
                             summary.processed, summary.taggable, summary.errors, path)
              << std::endl;
    return 0;
}

int cmd_scans(backend::CatalogStore& store, const backend::Config&, const Args&) {
    auto sessions = store.list_scans();
    if (sessions.empty()) {
        std::cout << "No scans recorded." << std::endl;
        return 0;
    }
    for (const auto& s : sessions) {
        std::string end = s.end_time ? util::format_local_time(*s.end_time) : "incomplete";
        std::cout << std::format("\t{}\t{}\t{}\tfiles={}\ttaggable={}\terrors={}",
                                 s.scan_name, util::format_local_time(s.start_time), end,
                                 or_dash(s.num_files), or_dash(s.num_taggable), or_dash(s.num_errors))
                  << "\n";
    }
    return 0;
}

int cmd_exts(backend::CatalogStore& store, const backend::Config&, const Args& args) {
    auto scan_name = optional_arg(args, "scan-name");
    if (scan_name && store.count_files(scan_name) == 0) {
        std::cout << "No records found for scan_name: " << *scan_name << std::endl;
        return 0;
    }
    for (const auto& ec : store.extension_counts(scan_name)) {
        std::cout << "\t" << ec.extension << "\t\t" << ec.count << "\n";
    }
    return 0;
}

int cmd_list_files(backend::CatalogStore& store, const backend::Config&, const Args& args) {
    const std::string& ext = require(args, "ext");
    int limit = int_arg(args, "limit", 25);
    int offset = int_arg(args, "offset", 0);

    for (const auto& r : store.files_by_extension(ext, limit, offset)) {
        std::cout << std::format("{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}",
                                 r.file_name, r.full_path, r.extension,
                                 or_dash(r.song_title), or_dash(r.album_name), or_dash(r.album_artist),
                                 or_dash(r.genre), or_dash(r.year), or_dash(r.duration),
                                 r.taggable ? "true" : "false", r.scan_name, or_dash(r.content_digest))
                  << "\n\n";
    }
    return 0;
}

int cmd_diff_count(backend::CatalogStore& store, const backend::Config&, const Args& args) {
    const std::string& origin = require(args, "origin-scan");
    const std::string& dest = require(args, "dest-scan");
    warn_unknown_scan(store, origin);
    warn_unknown_scan(store, dest);

    backend::Reconciler reconciler(store);
    std::cout << "Different files count between " << origin << " and " << dest << ": "
              << reconciler.count_diff(origin, dest) << std::endl;
    return 0;
}

int cmd_diff_list(backend::CatalogStore& store, const backend::Config&, const Args& args) {
    const std::string& origin = require(args, "origin-scan");
    const std::string& dest = require(args, "dest-scan");
    warn_unknown_scan(store, origin);
    warn_unknown_scan(store, dest);

    backend::Reconciler reconciler(store);
    for (const auto& path : reconciler.compute_diff(origin, dest)) {
        std::cout << path << "\n";
    }
    return 0;
}

int cmd_copy_diff(backend::CatalogStore& store, const backend::Config& config, const Args& args) {
    const std::string& origin = require(args, "origin-scan");
    const std::string& dest = require(args, "dest-scan");
    const std::string& folder = require(args, "folder");
    warn_unknown_scan(store, origin);
    warn_unknown_scan(store, dest);

    backend::Reconciler reconciler(store);
    backend::Materializer materializer(reconciler, config.copy_progress_interval);

    backend::CopyCallbacks callbacks;
    callbacks.on_progress = [](int processed, int total, double percent) {
        std::cout << std::format("{:.2f}%: {} files out of {} copied", percent, processed, total) << std::endl;
    };
    callbacks.on_missing = [](const std::string& source) {
        std::cout << "File " << source << " not found in source directory" << std::endl;
    };

    auto report = materializer.copy_diff(origin, dest, folder, callbacks);
    std::cout << std::format("done: {} files out of {} copied", report.copied, report.total) << std::endl;
    return 0;
}

using Handler = std::function<int(backend::CatalogStore&, const backend::Config&, const Args&)>;

struct Command {
    Handler handler;
    ArgSpec spec;
};

const std::map<std::string, Command>& commands() {
    static const std::map<std::string, Command> table = {
        {"init-store", {cmd_init_store, {}}},
        {"scan", {cmd_scan, {{"path", "scan-name"}, {}, {}}}},
        {"scans", {cmd_scans, {}}},
        {"exts", {cmd_exts, {}}},
        {"list-files", {cmd_list_files, {{"ext"}, {"limit", "offset"}, {}}}},
        {"diff-count", {cmd_diff_count, {{"origin-scan", "dest-scan"}, {}, {}}}},
        {"diff-list", {cmd_diff_list, {{"origin-scan", "dest-scan"}, {}, {}}}},
        {"copy-diff", {cmd_copy_diff, {{"origin-scan", "dest-scan", "folder"}, {}, {{"folder-name", "folder"}}}}},
    };
    return table;
}

}  // namespace

Args parse_args(int argc, char** argv, int first) {
    Args args;
    for (int i = first; i < argc; ++i) {
        std::string key = argv[i];
        if (!key.starts_with("--") || key.size() == 2) {
            throw UsageError("Unexpected argument: " + key);
        }
        if (i + 1 >= argc) {
            throw UsageError("Missing value for " + key);
        }
        args[key.substr(2)] = argv[++i];
    }
    return args;
}

void validate_args(Args& args, const ArgSpec& spec) {
    for (const auto& [alias, canonical] : spec.aliases) {
        auto it = args.find(alias);
        if (it == args.end()) continue;
        if (!args.contains(canonical)) args[canonical] = it->second;
        args.erase(it);
    }
    for (const auto& key : spec.required) {
        auto it = args.find(key);
        if (it == args.end() || it->second.empty()) {
            throw UsageError("Missing required argument --" + key);
        }
    }
    for (const auto& key : spec.numeric) {
        auto it = args.find(key);
        if (it == args.end()) continue;
        const std::string& value = it->second;
        int parsed = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (value.empty() || ec != std::errc() || ptr != value.data() + value.size() || parsed < 0) {
            throw UsageError("--" + key + " expects a non-negative number, got '" + value + "'");
        }
    }
}

int run(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];
    if (command == "help" || command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    auto it = commands().find(command);
    if (it == commands().end()) {
        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        // Argument errors are reported before the config, log or catalog is touched
        Args args = parse_args(argc, argv, 2);
        validate_args(args, it->second.spec);

        auto config = backend::ConfigLoader::load_config();
        util::Logger::init(config.log_file, util::Logger::parse_level(config.log_level));
        util::Logger::info("musician " + command + " starting, catalog " + config.database.string());

        backend::StoreOptions store_options;
        store_options.busy_timeout_ms = config.busy_timeout_ms;
        store_options.retry_attempts = config.retry_attempts;
        store_options.retry_backoff_ms = config.retry_backoff_ms;

        // Released on every exit path, including a fatal error mid-command
        backend::CatalogStore store(config.database, store_options);

        if (command != "init-store" && !store.is_initialized()) {
            std::cerr << "Catalog at " << config.database.string()
                      << " is not initialized. Run '" << argv[0] << " init-store' first." << std::endl;
            return 1;
        }

        int rc = it->second.handler(store, config, args);
        util::Logger::info("musician " + command + " finished with status " + std::to_string(rc));
        return rc;
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n\n";
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        util::Logger::error(std::string("Fatal: ") + e.what());
        std::cerr << "Fatal: " << e.what() << "\n";
        return 2;
    }
}

}  // namespace musician::cli
