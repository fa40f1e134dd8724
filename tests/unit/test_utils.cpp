#include "../framework/SimpleTest.hpp"
#include "backend/Config.hpp"
#include "util/ContentHasher.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/TimeFormat.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace musician::util;
using musician::backend::Config;
using musician::backend::ConfigLoader;

namespace fs = std::filesystem;

static fs::path make_temp_dir(const std::string& tag) {
    auto dir = fs::temp_directory_path() / ("musician_utils_" + tag + "_" + std::to_string(getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static void write_file(const fs::path& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary);
    f << content;
}

TEST_CASE(test_hash_bytes_empty) {
    ASSERT_EQ(ContentHasher::hash_bytes(""),
              std::string("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));
}

TEST_CASE(test_hash_bytes_abc) {
    ASSERT_EQ(ContentHasher::hash_bytes("abc"),
              std::string("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
}

TEST_CASE(test_hash_file_matches_hash_bytes) {
    auto dir = make_temp_dir("hash");
    // Larger than one chunk so the streaming path is exercised
    std::string content(10000, 'x');
    content += "tail";
    write_file(dir / "track.mp3", content);

    auto digest = ContentHasher::hash_file(dir / "track.mp3");
    ASSERT_TRUE(digest.has_value());
    ASSERT_EQ(*digest, ContentHasher::hash_bytes(content));

    // Chunk size changes the reads, never the digest
    auto small_chunks = ContentHasher::hash_file(dir / "track.mp3", 7);
    ASSERT_TRUE(small_chunks.has_value());
    ASSERT_EQ(*small_chunks, *digest);

    fs::remove_all(dir);
}

TEST_CASE(test_hash_file_missing) {
    auto digest = ContentHasher::hash_file("/nonexistent/musician/track.flac");
    ASSERT_FALSE(digest.has_value());
}

TEST_CASE(test_directory_scanner_recurses) {
    auto dir = make_temp_dir("walk");
    fs::create_directories(dir / "Artist" / "Album");
    write_file(dir / "top.mp3", "a");
    write_file(dir / "Artist" / "cover.jpg", "b");
    write_file(dir / "Artist" / "Album" / "01.flac", "c");

    std::vector<std::string> names;
    auto stats = DirectoryScanner::walk(dir.string() + "/", [&](const DirectoryScanner::Entry& e) {
        names.push_back(e.name);
        ASSERT_TRUE(e.full_path.find("//") == std::string::npos);
    });
    std::sort(names.begin(), names.end());

    ASSERT_EQ(stats.files, 3u);
    ASSERT_EQ(stats.directories, 3u);
    ASSERT_EQ(names.size(), 3u);
    ASSERT_EQ(names[0], std::string("01.flac"));
    ASSERT_EQ(names[1], std::string("cover.jpg"));
    ASSERT_EQ(names[2], std::string("top.mp3"));

    fs::remove_all(dir);
}

TEST_CASE(test_directory_scanner_symlinks) {
    auto dir = make_temp_dir("links");
    fs::create_directories(dir / "real");
    write_file(dir / "real" / "song.mp3", "a");
    fs::create_directory_symlink(dir / "real", dir / "linked_dir");
    fs::create_symlink(dir / "real" / "song.mp3", dir / "linked_song.mp3");
    fs::create_symlink(dir / "gone.mp3", dir / "dangling.mp3");

    std::vector<std::string> names;
    DirectoryScanner::walk(dir, [&](const DirectoryScanner::Entry& e) { names.push_back(e.name); });
    std::sort(names.begin(), names.end());

    // The linked directory is not descended into, so song.mp3 is seen once
    ASSERT_EQ(names.size(), 3u);
    ASSERT_EQ(names[0], std::string("dangling.mp3"));
    ASSERT_EQ(names[1], std::string("linked_song.mp3"));
    ASSERT_EQ(names[2], std::string("song.mp3"));

    fs::remove_all(dir);
}

TEST_CASE(test_time_format_roundtrip) {
    std::time_t now = std::time(nullptr);
    auto text = format_local_time(now);
    ASSERT_EQ(text.size(), 19u);
    auto parsed = parse_local_time(text);
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(*parsed, now);
    ASSERT_FALSE(parse_local_time("yesterday").has_value());
}

TEST_CASE(test_split_list_extensions) {
    auto items = ConfigLoader::split_list("plist, .JPG ,, m3u ", true);
    ASSERT_EQ(items.size(), 3u);
    ASSERT_EQ(items[0], std::string("plist"));
    ASSERT_EQ(items[1], std::string("jpg"));
    ASSERT_EQ(items[2], std::string("m3u"));
}

TEST_CASE(test_split_list_names_keep_case) {
    auto items = ConfigLoader::split_list(".DS_Store, Thumbs.db", false);
    ASSERT_EQ(items.size(), 2u);
    ASSERT_EQ(items[0], std::string(".DS_Store"));
    ASSERT_EQ(items[1], std::string("Thumbs.db"));
}

TEST_CASE(test_config_load_from_file) {
    auto dir = make_temp_dir("config");
    write_file(dir / "config.toml",
               "# test config\n"
               "[catalog]\n"
               "database = \"/srv/music/catalog.db\"\n"
               "retry_attempts = 7\n"
               "busy_timeout_ms = nonsense\n"
               "\n"
               "[scan]\n"
               "progress_interval = 10\n"
               "exclude_extensions = \"plist, jpg, .CUE\"\n"
               "\n"
               "[copy]\n"
               "progress_interval = 3\n"
               "\n"
               "[log]\n"
               "level = \"debug\"\n");

    Config cfg = ConfigLoader::load_from_file(dir / "config.toml");
    ASSERT_EQ(cfg.database, fs::path("/srv/music/catalog.db"));
    ASSERT_EQ(cfg.retry_attempts, 7);
    ASSERT_EQ(cfg.busy_timeout_ms, 5000);  // malformed value keeps the default
    ASSERT_EQ(cfg.scan_progress_interval, 10);
    ASSERT_EQ(cfg.hash_chunk_size, 4096u);
    ASSERT_EQ(cfg.exclude_extensions.size(), 3u);
    ASSERT_EQ(cfg.exclude_extensions[2], std::string("cue"));
    ASSERT_EQ(cfg.exclude_names.size(), 1u);
    ASSERT_EQ(cfg.copy_progress_interval, 3);
    ASSERT_EQ(cfg.log_level, std::string("debug"));

    fs::remove_all(dir);
}

TEST_CASE(test_config_save_then_load) {
    auto dir = make_temp_dir("config_save");
    Config cfg = ConfigLoader::create_default_config();
    cfg.database = dir / "catalog.db";
    cfg.exclude_names = {".DS_Store", "desktop.ini"};
    cfg.copy_progress_interval = 50;
    ConfigLoader::save_config(cfg, dir / "nested" / "config.toml");

    Config loaded = ConfigLoader::load_from_file(dir / "nested" / "config.toml");
    ASSERT_EQ(loaded.database, cfg.database);
    ASSERT_EQ(loaded.exclude_names.size(), 2u);
    ASSERT_EQ(loaded.exclude_names[1], std::string("desktop.ini"));
    ASSERT_EQ(loaded.copy_progress_interval, 50);

    fs::remove_all(dir);
}

int main(int argc, char** argv) {
    return musician::test::TestRunner::instance().run_all(argc, argv);
}
