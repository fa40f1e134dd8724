#pragma once

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>

namespace musician::model {

// One catalogued file within one scan. Immutable once written.
struct FileRecord {
    std::string file_name;
    std::string full_path;
    std::string extension;  // lower-case, no leading dot

    // Present only when the file is taggable and the tag carries a value
    std::optional<std::string> song_title;
    std::optional<std::string> album_name;
    std::optional<std::string> album_artist;
    std::optional<std::string> genre;
    std::optional<int> year;
    std::optional<double> duration;  // seconds

    bool taggable = false;
    std::string scan_name;
    std::optional<std::string> content_digest;  // SHA-256 hex, absent if unreadable

    bool operator==(const FileRecord&) const = default;
};

// One named scan run. end_time and counters stay empty until the run completes;
// a session with no end_time is an interrupted (incomplete) run.
struct ScanSession {
    std::string scan_name;
    std::time_t start_time = 0;
    std::optional<std::time_t> end_time;
    std::optional<int> num_files;
    std::optional<int> num_taggable;
    std::optional<int> num_errors;

    bool is_complete() const { return end_time.has_value(); }
};

enum class ScanStatus {
    Completed,
    NameConflict,
    RootMissing,
};

struct ScanSummary {
    ScanStatus status = ScanStatus::Completed;
    std::string scan_name;
    std::filesystem::path root;
    std::time_t start_time = 0;
    std::time_t end_time = 0;
    int processed = 0;
    int taggable = 0;
    int errors = 0;
    int skipped = 0;  // excluded by rule, never recorded
};

// Result of handling a single walked file
struct FileOutcome {
    enum class Kind {
        Recorded,
        Skipped,
        Failed,
    };

    Kind kind = Kind::Recorded;
    bool taggable = false;
    std::string reason;

    static FileOutcome recorded(bool taggable) { return {Kind::Recorded, taggable, {}}; }
    static FileOutcome skipped() { return {Kind::Skipped, false, {}}; }
    static FileOutcome failed(std::string why) { return {Kind::Failed, false, std::move(why)}; }
};

struct CopyReport {
    int total = 0;
    int copied = 0;
    int missing = 0;
    std::filesystem::path target;
};

struct ExtensionCount {
    std::string extension;
    int count = 0;
};

}  // namespace musician::model
