#include "backend/ScanRecorder.hpp"
#include "util/ContentHasher.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <ctime>

namespace musician::backend {

ScanRecorder::ScanRecorder(CatalogStore& store, const MetadataExtractor& extractor, ScanOptions options)
    : store_(store), extractor_(extractor), options_(std::move(options)) {}

std::optional<int> ScanRecorder::derive_year(const std::optional<std::string>& raw) {
    if (!raw) return std::nullopt;

    std::string year = raw->substr(0, raw->find('-'));
    year.erase(std::remove_if(year.begin(), year.end(),
                              [](unsigned char c) { return std::isspace(c); }),
               year.end());
    if (year.empty()) return std::nullopt;

    int value = 0;
    const char* first = year.data();
    const char* last = year.data() + year.size();
    if (*first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || first == last) return std::nullopt;
    return value;
}

bool ScanRecorder::is_excluded(const std::string& full_path, const std::string& extension) const {
    for (const auto& ext : options_.exclude_extensions) {
        if (extension == ext) return true;
    }
    for (const auto& name : options_.exclude_names) {
        if (full_path.ends_with(name)) return true;
    }
    return false;
}

model::FileOutcome ScanRecorder::process_file(const std::string& full_path,
                                              const std::string& file_name,
                                              const std::string& scan_name) {
    const std::string extension = MetadataExtractor::normalized_extension(file_name);
    if (is_excluded(full_path, extension)) {
        util::Logger::debug("ScanRecorder: Excluded " + full_path);
        return model::FileOutcome::skipped();
    }

    try {
        model::FileRecord record;
        record.file_name = file_name;
        record.full_path = full_path;
        record.extension = extension;
        record.scan_name = scan_name;

        // An unreadable file still gets a record, just without a digest
        record.content_digest = util::ContentHasher::hash_file(full_path, options_.hash_chunk_size);

        record.taggable = extractor_.is_supported(full_path);
        if (record.taggable) {
            tags::TagData tag = extractor_.extract(full_path);
            record.song_title = tag.title;
            record.album_name = tag.album;
            record.album_artist = tag.artist;
            record.genre = tag.genre;
            record.year = derive_year(tag.year);
            record.duration = tag.duration;
        }

        store_.insert_file(record);
        return model::FileOutcome::recorded(record.taggable);
    } catch (const StoreError& e) {
        if (e.is_fatal()) throw;
        return model::FileOutcome::failed(e.what());
    } catch (const std::exception& e) {
        return model::FileOutcome::failed(e.what());
    }
}

model::ScanSummary ScanRecorder::start_scan(const std::filesystem::path& root,
                                            const std::string& scan_name,
                                            const ScanCallbacks& callbacks) {
    model::ScanSummary summary;
    summary.scan_name = scan_name;
    summary.root = root;

    if (store_.scan_exists(scan_name)) {
        util::Logger::warn("ScanRecorder: Scan name '" + scan_name + "' already exists, nothing to do");
        summary.status = model::ScanStatus::NameConflict;
        return summary;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        util::Logger::error("ScanRecorder: Scan root is not a directory: " + root.string());
        summary.status = model::ScanStatus::RootMissing;
        return summary;
    }

    summary.start_time = std::time(nullptr);
    model::ScanSession session;
    session.scan_name = scan_name;
    session.start_time = summary.start_time;
    store_.begin_scan(session);
    util::Logger::info("ScanRecorder: Scanning " + root.string() + " as '" + scan_name + "'");

    util::DirectoryScanner::walk(root, [&](const util::DirectoryScanner::Entry& entry) {
        model::FileOutcome outcome = process_file(entry.full_path, entry.name, scan_name);

        switch (outcome.kind) {
            case model::FileOutcome::Kind::Recorded:
                summary.processed++;
                if (outcome.taggable) summary.taggable++;
                if (callbacks.on_progress && options_.progress_interval > 0 &&
                    summary.processed % options_.progress_interval == 0) {
                    callbacks.on_progress(summary.processed);
                }
                break;
            case model::FileOutcome::Kind::Skipped:
                summary.skipped++;
                break;
            case model::FileOutcome::Kind::Failed:
                summary.errors++;
                util::Logger::error("ScanRecorder: Error processing " + entry.full_path + ": " + outcome.reason);
                if (callbacks.on_file_error) callbacks.on_file_error(entry.full_path, outcome.reason);
                break;
        }
    });

    summary.end_time = std::time(nullptr);
    store_.complete_scan(scan_name, summary.end_time, summary.processed, summary.taggable, summary.errors);

    util::Logger::info("ScanRecorder: Scan complete (" + std::to_string(summary.processed) + " files, " +
                       std::to_string(summary.taggable) + " taggable, " +
                       std::to_string(summary.errors) + " errors, " +
                       std::to_string(summary.skipped) + " excluded) for " + root.string());
    summary.status = model::ScanStatus::Completed;
    return summary;
}

}  // namespace musician::backend
