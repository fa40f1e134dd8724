#include "util/ContentHasher.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>
#include <openssl/evp.h>

namespace musician::util {

namespace {
    struct DigestCtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    using DigestCtx = std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter>;
}

std::string ContentHasher::to_hex(const uint8_t* bytes, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

std::optional<std::string> ContentHasher::hash_file(const std::filesystem::path& path, size_t chunk_size) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        Logger::warn("ContentHasher: Could not hash " + path.string() + ": " + std::strerror(errno));
        return std::nullopt;
    }

    DigestCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        Logger::error("ContentHasher: EVP_DigestInit_ex failed");
        return std::nullopt;
    }

    if (chunk_size == 0) chunk_size = DEFAULT_CHUNK_SIZE;
    std::vector<char> buffer(chunk_size);

    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
            Logger::error("ContentHasher: EVP_DigestUpdate failed for " + path.string());
            return std::nullopt;
        }
    }
    if (in.bad()) {
        // e.g. EISDIR or an I/O error mid-file
        Logger::warn("ContentHasher: Read failed while hashing " + path.string());
        return std::nullopt;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1 || digest_len != SHA256_HASH_SIZE) {
        Logger::error("ContentHasher: EVP_DigestFinal_ex failed for " + path.string());
        return std::nullopt;
    }

    return to_hex(digest, digest_len);
}

std::string ContentHasher::hash_bytes(std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        return "";
    }
    return to_hex(digest, digest_len);
}

}  // namespace musician::util
