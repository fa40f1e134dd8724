#include "tags/AvformatTagReader.hpp"
#include "util/Logger.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
}

namespace musician::tags {

bool AvformatTagReader::handles(std::string_view extension) const {
    return extension == "m4a" || extension == "m4b" || extension == "m4r" ||
           extension == "m4v" || extension == "mp4" || extension == "aac" ||
           extension == "wma";
}

TagData AvformatTagReader::read(const std::string& path) {
    AVFormatContext* format_ctx = nullptr;
    int ret = avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        char errbuf[256];
        av_strerror(ret, errbuf, sizeof(errbuf));
        throw TagError("avformat_open_input failed for " + path + ": " + errbuf);
    }

    // Duration is only reliable after probing the streams
    if (avformat_find_stream_info(format_ctx, nullptr) < 0) {
        util::Logger::debug("AvformatTagReader: No stream info for " + path);
    }

    auto get_tag = [&](const char* key) -> std::optional<std::string> {
        const AVDictionaryEntry* entry = av_dict_get(format_ctx->metadata, key, nullptr, 0);
        return (entry && entry->value) ? non_empty(entry->value) : std::nullopt;
    };

    TagData tag;
    tag.title = get_tag("title");
    tag.album = get_tag("album");
    tag.artist = get_tag("artist");
    if (!tag.artist) tag.artist = get_tag("album_artist");
    tag.genre = get_tag("genre");
    tag.year = get_tag("date");

    if (format_ctx->duration != AV_NOPTS_VALUE && format_ctx->duration > 0) {
        tag.duration = static_cast<double>(format_ctx->duration) / AV_TIME_BASE;
    }

    avformat_close_input(&format_ctx);
    return tag;
}

}  // namespace musician::tags
