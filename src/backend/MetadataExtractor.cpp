#include "backend/MetadataExtractor.hpp"
#include "tags/Mpg123TagReader.hpp"
#include "tags/SndfileTagReader.hpp"
#include "tags/AvformatTagReader.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace musician::backend {

MetadataExtractor::MetadataExtractor() {
    readers_.push_back(std::make_unique<tags::Mpg123TagReader>());
    readers_.push_back(std::make_unique<tags::SndfileTagReader>());
    readers_.push_back(std::make_unique<tags::AvformatTagReader>());
}

MetadataExtractor::MetadataExtractor(std::vector<std::unique_ptr<tags::TagReader>> readers)
    : readers_(std::move(readers)) {}

std::string MetadataExtractor::normalized_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

tags::TagReader* MetadataExtractor::reader_for(const std::string& path) const {
    const std::string ext = normalized_extension(path);
    if (ext.empty()) return nullptr;
    for (const auto& reader : readers_) {
        if (reader->handles(ext)) return reader.get();
    }
    return nullptr;
}

bool MetadataExtractor::is_supported(const std::string& path) const {
    return reader_for(path) != nullptr;
}

tags::TagData MetadataExtractor::extract(const std::string& path) const {
    auto* reader = reader_for(path);
    if (!reader) {
        throw tags::TagError("No tag reader for " + path);
    }
    util::Logger::debug(std::string("MetadataExtractor: Reading ") + path + " with " + reader->name());
    return reader->read(path);
}

}  // namespace musician::backend
