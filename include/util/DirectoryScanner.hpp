#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <cstddef>
#include <cstdint>

namespace musician::util {

/**
 * DirectoryScanner: recursive file enumeration using the getdents64 syscall.
 *
 * Uses 256KB buffers to batch syscalls and the d_type field to avoid stat()
 * on most entries. Files are reported to a visitor as they are found, so a
 * caller can process a tree of any size without holding the full listing.
 *
 * Symlinks are reported as files unless they resolve to a directory;
 * symlinked directories are never followed.
 */
class DirectoryScanner {
public:
    struct Entry {
        const std::string& full_path;  // dir_path + "/" + name
        const char* name;              // file name component
    };

    using Visitor = std::function<void(const Entry& entry)>;

    struct WalkStats {
        size_t files = 0;
        size_t directories = 0;
        size_t unreadable_directories = 0;
    };

    /**
     * Walks root_dir depth-first and calls visit for every file.
     *
     * @param root_dir Root directory (trailing slashes are stripped)
     * @param visit Called once per file; exceptions propagate to the caller
     * @return Counts of what was walked
     */
    static WalkStats walk(const std::filesystem::path& root_dir, const Visitor& visit);

private:
    static constexpr size_t BUFFER_SIZE = 256 * 1024;  // 256KB buffer for getdents64

    static void walk_recursive(const std::string& dir_path, const Visitor& visit, WalkStats& stats);
};

}  // namespace musician::util
