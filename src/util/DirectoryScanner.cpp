#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <cerrno>
#include <cstring>
#include <memory>

namespace musician::util {

// Linux dirent64 structure for getdents64 syscall
struct linux_dirent64 {
    uint64_t d_ino;           // Inode number
    int64_t  d_off;           // Offset to next structure
    uint16_t d_reclen;        // Size of this dirent
    uint8_t  d_type;          // File type
    char     d_name[];        // Filename (null-terminated)
};

namespace {
    // Closes the directory fd on every exit path, including a throwing visitor
    struct FdGuard {
        int fd;
        ~FdGuard() { if (fd >= 0) close(fd); }
    };
}

DirectoryScanner::WalkStats DirectoryScanner::walk(const std::filesystem::path& root_dir, const Visitor& visit) {
    WalkStats stats;

    // Normalize: strip trailing slashes to prevent // in paths
    std::string root_str = root_dir.string();
    while (root_str.length() > 1 && root_str.back() == '/') {
        root_str.pop_back();
    }
    Logger::info("DirectoryScanner: Starting getdents64 walk of " + root_str);

    walk_recursive(root_str, visit, stats);

    Logger::info("DirectoryScanner: Walked " + std::to_string(stats.files) + " files in " +
                 std::to_string(stats.directories) + " directories (" +
                 std::to_string(stats.unreadable_directories) + " unreadable)");
    return stats;
}

void DirectoryScanner::walk_recursive(const std::string& dir_path, const Visitor& visit, WalkStats& stats) {
    FdGuard dir{open(dir_path.c_str(), O_RDONLY | O_DIRECTORY)};
    if (dir.fd < 0) {
        Logger::warn("DirectoryScanner: Failed to open directory: " + dir_path + " (" + std::strerror(errno) + ")");
        stats.unreadable_directories++;
        return;
    }
    stats.directories++;

    // Heap buffer: this function recurses once per directory level
    auto buffer = std::make_unique<char[]>(BUFFER_SIZE);

    while (true) {
        long nread = syscall(SYS_getdents64, dir.fd, buffer.get(), BUFFER_SIZE);

        if (nread == -1) {
            Logger::error("DirectoryScanner: getdents64 failed for " + dir_path);
            break;
        }
        if (nread == 0) {
            // End of directory
            break;
        }

        for (long pos = 0; pos < nread;) {
            auto* d = reinterpret_cast<linux_dirent64*>(buffer.get() + pos);
            pos += d->d_reclen;

            if (strcmp(d->d_name, ".") == 0 || strcmp(d->d_name, "..") == 0) {
                continue;
            }

            std::string full_path = dir_path + "/" + d->d_name;

            uint8_t type = d->d_type;
            if (type == DT_UNKNOWN) {
                // Filesystem doesn't support d_type, fall back to lstat
                struct stat entry_stat;
                if (fstatat(dir.fd, d->d_name, &entry_stat, AT_SYMLINK_NOFOLLOW) == 0) {
                    if (S_ISDIR(entry_stat.st_mode)) type = DT_DIR;
                    else if (S_ISLNK(entry_stat.st_mode)) type = DT_LNK;
                    else if (S_ISREG(entry_stat.st_mode)) type = DT_REG;
                }
            }
            if (type == DT_LNK) {
                // Symlinked directories are not followed; anything else
                // (including a dangling link) is a file name in this directory
                struct stat target_stat;
                if (fstatat(dir.fd, d->d_name, &target_stat, 0) == 0 && S_ISDIR(target_stat.st_mode)) {
                    continue;
                }
                type = DT_REG;
            }

            if (type == DT_DIR) {
                walk_recursive(full_path, visit, stats);
            } else if (type == DT_REG) {
                stats.files++;
                visit(Entry{full_path, d->d_name});
            }
            // Sockets, fifos and devices are not catalogued
        }
    }
}

}  // namespace musician::util
