#pragma once

#include "backend/Reconciler.hpp"
#include "model/Catalog.hpp"
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace musician::backend {

// Destination write failure (disk full, permissions). Aborts the batch.
class CopyError : public std::runtime_error {
public:
    explicit CopyError(const std::string& msg) : std::runtime_error(msg) {}
};

struct CopyCallbacks {
    std::function<void(int processed, int total, double percent)> on_progress;
    std::function<void(const std::string& source)> on_missing;
};

/**
 * Materializer: copies the diff of two scans into a single flat folder.
 *
 * Sources that no longer exist are reported and skipped. Files with the same
 * name overwrite each other in the target (last write wins).
 */
class Materializer {
public:
    explicit Materializer(const Reconciler& reconciler, int progress_interval = 250);

    model::CopyReport copy_diff(const std::string& origin_scan,
                                const std::string& dest_scan,
                                const std::filesystem::path& target_folder,
                                const CopyCallbacks& callbacks = {}) const;

    // Copies an explicit list of sources; copy_diff feeds it the reconciled paths
    model::CopyReport copy_paths(const std::vector<std::string>& sources,
                                 const std::filesystem::path& target_folder,
                                 const CopyCallbacks& callbacks = {}) const;

private:
    static void copy_with_metadata(const std::filesystem::path& source,
                                   const std::filesystem::path& dest);

    const Reconciler& reconciler_;
    int progress_interval_;
};

}  // namespace musician::backend
