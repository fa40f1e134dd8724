#include "backend/Materializer.hpp"
#include "util/Logger.hpp"

namespace musician::backend {

namespace fs = std::filesystem;

Materializer::Materializer(const Reconciler& reconciler, int progress_interval)
    : reconciler_(reconciler), progress_interval_(progress_interval) {}

void Materializer::copy_with_metadata(const fs::path& source, const fs::path& dest) {
    std::error_code ec;
    fs::copy_file(source, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw CopyError("Failed to copy " + source.string() + " to " + dest.string() + ": " + ec.message());
    }

    // Carry over modification time and permission bits
    auto mtime = fs::last_write_time(source, ec);
    if (!ec) fs::last_write_time(dest, mtime, ec);
    if (ec) {
        util::Logger::warn("Materializer: Could not preserve mtime on " + dest.string() + ": " + ec.message());
        ec.clear();
    }

    auto perms = fs::status(source, ec).permissions();
    if (!ec) fs::permissions(dest, perms, fs::perm_options::replace, ec);
    if (ec) {
        util::Logger::warn("Materializer: Could not preserve permissions on " + dest.string() + ": " + ec.message());
    }
}

model::CopyReport Materializer::copy_paths(const std::vector<std::string>& sources,
                                           const fs::path& target_folder,
                                           const CopyCallbacks& callbacks) const {
    model::CopyReport report;
    report.target = target_folder;
    report.total = static_cast<int>(sources.size());

    std::error_code ec;
    fs::create_directories(target_folder, ec);
    if (ec || !fs::is_directory(target_folder)) {
        throw CopyError("Cannot create target folder " + target_folder.string() +
                        (ec ? ": " + ec.message() : ""));
    }

    util::Logger::info("Materializer: Copying " + std::to_string(report.total) + " files into " +
                       target_folder.string());

    int processed = 0;
    for (const auto& source_str : sources) {
        fs::path source(source_str);

        if (fs::exists(source, ec)) {
            copy_with_metadata(source, target_folder / source.filename());
            report.copied++;
        } else {
            report.missing++;
            util::Logger::warn("Materializer: File " + source_str + " not found in source directory");
            if (callbacks.on_missing) callbacks.on_missing(source_str);
        }
        ec.clear();

        processed++;
        if (callbacks.on_progress && progress_interval_ > 0 && processed % progress_interval_ == 0) {
            double percent = 100.0 * processed / report.total;
            callbacks.on_progress(processed, report.total, percent);
        }
    }

    util::Logger::info("Materializer: done: " + std::to_string(report.copied) + " files out of " +
                       std::to_string(report.total) + " copied (" + std::to_string(report.missing) +
                       " missing)");
    return report;
}

model::CopyReport Materializer::copy_diff(const std::string& origin_scan,
                                          const std::string& dest_scan,
                                          const fs::path& target_folder,
                                          const CopyCallbacks& callbacks) const {
    // Target first, so an empty diff still leaves the folder in place
    std::error_code ec;
    fs::create_directories(target_folder, ec);
    if (ec) {
        throw CopyError("Cannot create target folder " + target_folder.string() + ": " + ec.message());
    }

    auto sources = reconciler_.compute_diff(origin_scan, dest_scan);
    return copy_paths(sources, target_folder, callbacks);
}

}  // namespace musician::backend
