#pragma once

#include "backend/CatalogStore.hpp"
#include "backend/MetadataExtractor.hpp"
#include "model/Catalog.hpp"
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace musician::backend {

struct ScanOptions {
    int progress_interval = 500;  // 0 disables progress callbacks
    size_t hash_chunk_size = 4096;
    std::vector<std::string> exclude_extensions = {"plist", "jpg"};  // lower-case, no dot
    std::vector<std::string> exclude_names = {".DS_Store"};           // matched as a path suffix
};

struct ScanCallbacks {
    std::function<void(int processed)> on_progress;
    std::function<void(const std::string& path, const std::string& reason)> on_file_error;
};

/**
 * ScanRecorder: catalogues every file under a root into one named scan session.
 *
 * Files are handled one at a time and each record is committed before the next
 * file is touched, so an interrupted run loses at most the file in flight and
 * leaves its session with no end time. A single file's failure is counted and
 * never aborts the run; only a fatal StoreError does.
 */
class ScanRecorder {
public:
    ScanRecorder(CatalogStore& store, const MetadataExtractor& extractor, ScanOptions options = {});

    // Rejects a scan name already in the store (or a missing root) before any write
    model::ScanSummary start_scan(const std::filesystem::path& root,
                                  const std::string& scan_name,
                                  const ScanCallbacks& callbacks = {});

    // Hash, tag and insert a single walked file
    model::FileOutcome process_file(const std::string& full_path,
                                    const std::string& file_name,
                                    const std::string& scan_name);

    [[nodiscard]] bool is_excluded(const std::string& full_path, const std::string& extension) const;

    // "2015-06-01" -> 2015, " 2015 " -> 2015, "unknown" / "" -> nullopt
    static std::optional<int> derive_year(const std::optional<std::string>& raw);

private:
    CatalogStore& store_;
    const MetadataExtractor& extractor_;
    ScanOptions options_;
};

}  // namespace musician::backend
