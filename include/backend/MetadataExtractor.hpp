#pragma once

#include "tags/TagReader.hpp"
#include <memory>
#include <string>
#include <vector>

namespace musician::backend {

// Picks a tag reader by file extension. Support is decided from the name alone;
// whether the content is actually parseable is only known once extract() runs.
class MetadataExtractor {
public:
    MetadataExtractor();
    explicit MetadataExtractor(std::vector<std::unique_ptr<tags::TagReader>> readers);

    [[nodiscard]] bool is_supported(const std::string& path) const;

    // Throws tags::TagError for unsupported or unparseable files
    tags::TagData extract(const std::string& path) const;

    // Lower-case extension without the leading dot ("" for dotfiles)
    static std::string normalized_extension(const std::string& path);

private:
    tags::TagReader* reader_for(const std::string& path) const;

    std::vector<std::unique_ptr<tags::TagReader>> readers_;
};

}  // namespace musician::backend
