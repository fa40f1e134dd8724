#include "../framework/SimpleTest.hpp"
#include "cli/CommandLine.hpp"
#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

using namespace musician::cli;

namespace fs = std::filesystem;

namespace {

// Points every XDG location at a fresh directory so the default catalog and
// log paths land somewhere the test can inspect
fs::path isolated_home(const std::string& tag) {
    auto home = fs::temp_directory_path() / ("musician_cli_" + tag + "_" + std::to_string(getpid()));
    fs::remove_all(home);
    fs::create_directories(home);
    setenv("HOME", home.c_str(), 1);
    setenv("XDG_CONFIG_HOME", (home / "config").c_str(), 1);
    setenv("XDG_CACHE_HOME", (home / "cache").c_str(), 1);
    setenv("XDG_DATA_HOME", (home / "data").c_str(), 1);
    unsetenv("MUSICIAN_DB");
    unsetenv("MUSICIAN_CONFIG");
    return home;
}

int run_with(std::vector<std::string> words) {
    words.insert(words.begin(), "musician");
    std::vector<char*> argv;
    for (auto& w : words) argv.push_back(w.data());
    argv.push_back(nullptr);
    return run(static_cast<int>(words.size()), argv.data());
}

}  // namespace

TEST_CASE(test_missing_argument_touches_nothing) {
    auto home = isolated_home("missing");

    int rc = run_with({"scan", "--path", home.string()});
    ASSERT_EQ(rc, 1);
    ASSERT_FALSE(fs::exists(home / "data" / "musician" / "catalog.db"));
    ASSERT_FALSE(fs::exists(home / "data"));
    ASSERT_FALSE(fs::exists(home / "cache" / "musician" / "musician.log"));

    fs::remove_all(home);
}

TEST_CASE(test_bad_number_touches_nothing) {
    auto home = isolated_home("number");

    ASSERT_EQ(run_with({"list-files", "--ext", "mp3", "--limit", "lots"}), 1);
    ASSERT_EQ(run_with({"list-files", "--ext", "mp3", "--offset", "-3"}), 1);
    ASSERT_FALSE(fs::exists(home / "data"));

    fs::remove_all(home);
}

TEST_CASE(test_missing_argument_after_init_store) {
    auto home = isolated_home("after_init");

    ASSERT_EQ(run_with({"init-store"}), 0);
    ASSERT_TRUE(fs::exists(home / "data" / "musician" / "catalog.db"));

    ASSERT_EQ(run_with({"copy-diff", "--origin-scan", "a", "--dest-scan", "b"}), 1);
    ASSERT_FALSE(fs::exists(home / "out"));

    // --folder-name stands in for --folder
    auto target = home / "out";
    ASSERT_EQ(run_with({"copy-diff", "--origin-scan", "a", "--dest-scan", "b",
                        "--folder-name", target.string()}), 0);
    ASSERT_TRUE(fs::is_directory(target));

    fs::remove_all(home);
}

TEST_CASE(test_uninitialized_catalog_rejected) {
    auto home = isolated_home("uninit");
    ASSERT_EQ(run_with({"diff-count", "--origin-scan", "a", "--dest-scan", "b"}), 1);
    fs::remove_all(home);
}

TEST_CASE(test_usage_exit_codes) {
    ASSERT_EQ(run_with({}), 1);
    ASSERT_EQ(run_with({"help"}), 0);
    ASSERT_EQ(run_with({"--help"}), 0);
    ASSERT_EQ(run_with({"frobnicate"}), 1);
    ASSERT_EQ(run_with({"scan", "stray"}), 1);
    ASSERT_EQ(run_with({"scan", "--path"}), 1);
}

TEST_CASE(test_validate_args_aliases_and_required) {
    ArgSpec spec;
    spec.required = {"origin-scan", "folder"};
    spec.numeric = {"limit"};
    spec.aliases = {{"folder-name", "folder"}};

    Args args = {{"origin-scan", "a"}, {"folder-name", "/tmp/out"}, {"limit", "10"}};
    validate_args(args, spec);
    ASSERT_EQ(args["folder"], std::string("/tmp/out"));
    ASSERT_FALSE(args.contains("folder-name"));

    Args no_origin = {{"folder", "x"}};
    ASSERT_THROWS(validate_args(no_origin, spec), UsageError);

    Args empty_value = {{"origin-scan", ""}, {"folder", "x"}};
    ASSERT_THROWS(validate_args(empty_value, spec), UsageError);

    Args bad_limit = {{"origin-scan", "a"}, {"folder", "x"}, {"limit", "10x"}};
    ASSERT_THROWS(validate_args(bad_limit, spec), UsageError);
}

int main(int argc, char** argv) {
    return musician::test::TestRunner::instance().run_all(argc, argv);
}
