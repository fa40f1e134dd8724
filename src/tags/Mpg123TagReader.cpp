#include "tags/Mpg123TagReader.hpp"
#include "util/Logger.hpp"
#include <mpg123.h>
#include <memory>

namespace musician::tags {

// Helper class to ensure mpg123 is initialized
struct Mpg123Initializer {
    Mpg123Initializer() { mpg123_init(); }
    ~Mpg123Initializer() { mpg123_exit(); }
};
static Mpg123Initializer g_mpg123_init;

namespace {
    struct HandleDeleter {
        void operator()(mpg123_handle* mh) const {
            mpg123_close(mh);
            mpg123_delete(mh);
        }
    };

    std::optional<std::string> text_of(const mpg123_string* s) {
        if (!s || !s->p) return std::nullopt;
        return std::string(s->p);
    }

    // ID3v1 fields are fixed width and may not be NUL-terminated
    std::string fixed_field(const char* field, size_t width) {
        size_t len = 0;
        while (len < width && field[len] != '\0') ++len;
        return std::string(field, len);
    }
}

bool Mpg123TagReader::handles(std::string_view extension) const {
    return extension == "mp3" || extension == "mp2" || extension == "mpga";
}

TagData Mpg123TagReader::read(const std::string& path) {
    int err = MPG123_OK;
    std::unique_ptr<mpg123_handle, HandleDeleter> mh(mpg123_new(nullptr, &err));
    if (!mh) {
        throw TagError("mpg123_new failed: " + std::string(mpg123_plain_strerror(err)));
    }

    if (mpg123_open(mh.get(), path.c_str()) != MPG123_OK) {
        throw TagError("mpg123_open failed for " + path + ": " + mpg123_strerror(mh.get()));
    }

    // Scan to get accurate length and parse ID3 tags
    mpg123_scan(mh.get());

    TagData tag;

    long rate = 0;
    int channels = 0, encoding = 0;
    if (mpg123_getformat(mh.get(), &rate, &channels, &encoding) == MPG123_OK && rate > 0) {
        off_t length = mpg123_length(mh.get());
        if (length > 0) {
            tag.duration = static_cast<double>(length) / static_cast<double>(rate);
        }
    }

    mpg123_id3v1* v1 = nullptr;
    mpg123_id3v2* v2 = nullptr;
    if (mpg123_id3(mh.get(), &v1, &v2) == MPG123_OK) {
        if (v2) {
            if (auto s = text_of(v2->title)) tag.title = non_empty(*s);
            if (auto s = text_of(v2->artist)) tag.artist = non_empty(*s);
            if (auto s = text_of(v2->album)) tag.album = non_empty(*s);
            if (auto s = text_of(v2->genre)) tag.genre = non_empty(*s);
            if (auto s = text_of(v2->year)) tag.year = non_empty(*s);
        }
        else if (v1) {
            tag.title = non_empty(fixed_field(v1->title, sizeof(v1->title)));
            tag.artist = non_empty(fixed_field(v1->artist, sizeof(v1->artist)));
            tag.album = non_empty(fixed_field(v1->album, sizeof(v1->album)));
            tag.year = non_empty(fixed_field(v1->year, sizeof(v1->year)));
            if (v1->genre != 255) {
                tag.genre = std::to_string(v1->genre);
            }
        }
    } else {
        util::Logger::debug("Mpg123TagReader: No ID3 data in " + path);
    }

    return tag;
}

}  // namespace musician::tags
