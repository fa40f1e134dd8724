#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace musician::util {

class ContentHasher {
public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 4096;

    // Streams the file through SHA-256 in chunk_size reads.
    // Returns a 64-char lower-case hex digest, or nullopt if the file
    // cannot be opened or a read fails part-way.
    [[nodiscard]] static std::optional<std::string> hash_file(
        const std::filesystem::path& path,
        size_t chunk_size = DEFAULT_CHUNK_SIZE
    );

    // SHA-256 of an in-memory buffer (hex)
    [[nodiscard]] static std::string hash_bytes(std::string_view data);

private:
    static constexpr size_t SHA256_HASH_SIZE = 32;

    static std::string to_hex(const uint8_t* bytes, size_t len);
};

}  // namespace musician::util
