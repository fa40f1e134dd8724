#pragma once

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace musician::cli {

using Args = std::unordered_map<std::string, std::string>;

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

// Argument contract of one subcommand, checked before anything touches disk
struct ArgSpec {
    std::vector<std::string> required;
    std::vector<std::string> numeric;
    std::vector<std::pair<std::string, std::string>> aliases;  // {alias, canonical}
};

// "--key value" pairs from argv[first..]
Args parse_args(int argc, char** argv, int first);

// Folds aliases into their canonical keys, then throws UsageError for a
// missing required key or a non-numeric numeric key
void validate_args(Args& args, const ArgSpec& spec);

// Full command-line entry point; returns the process exit code
int run(int argc, char** argv);

}  // namespace musician::cli
