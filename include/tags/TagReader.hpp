#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace musician::tags {

// Raw tag values as read from the container. Empty strings are reported as absent.
struct TagData {
    std::optional<std::string> title;
    std::optional<std::string> album;
    std::optional<std::string> artist;
    std::optional<std::string> genre;
    std::optional<std::string> year;  // raw, e.g. "2015-06-01"
    std::optional<double> duration;   // seconds
};

// Unreadable or malformed file. Recoverable: the scan counts it and moves on.
class TagError : public std::runtime_error {
public:
    explicit TagError(const std::string& msg) : std::runtime_error(msg) {}
};

class TagReader {
public:
    virtual ~TagReader() = default;

    // Lower-case extension without the dot
    virtual bool handles(std::string_view extension) const = 0;

    // Throws TagError when the file cannot be parsed
    virtual TagData read(const std::string& path) = 0;

    virtual const char* name() const = 0;

protected:
    static std::optional<std::string> non_empty(const std::string& value) {
        auto first = value.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return std::nullopt;
        auto last = value.find_last_not_of(" \t\r\n");
        return value.substr(first, last - first + 1);
    }
};

}  // namespace musician::tags
