#include "tags/SndfileTagReader.hpp"
#include "util/Logger.hpp"
#include <cstring>
#include <sndfile.h>

namespace musician::tags {

bool SndfileTagReader::handles(std::string_view extension) const {
    return extension == "flac" || extension == "ogg" || extension == "oga" ||
           extension == "opus" || extension == "wav" || extension == "aiff" ||
           extension == "aif" || extension == "aifc";
}

TagData SndfileTagReader::read(const std::string& path) {
    util::Logger::debug("SndfileTagReader: Parsing " + path);

    SF_INFO sfinfo;
    std::memset(&sfinfo, 0, sizeof(sfinfo));

    SNDFILE* sndfile = sf_open(path.c_str(), SFM_READ, &sfinfo);
    if (!sndfile) {
        throw TagError("sf_open failed for " + path + ": " + sf_strerror(nullptr));
    }

    auto get_tag = [&](int tag_id) -> std::optional<std::string> {
        const char* val = sf_get_string(sndfile, tag_id);
        return val ? non_empty(val) : std::nullopt;
    };

    TagData tag;
    tag.title = get_tag(SF_STR_TITLE);
    tag.artist = get_tag(SF_STR_ARTIST);
    tag.album = get_tag(SF_STR_ALBUM);
    tag.genre = get_tag(SF_STR_GENRE);
    tag.year = get_tag(SF_STR_DATE);

    if (sfinfo.samplerate > 0 && sfinfo.frames >= 0) {
        tag.duration = static_cast<double>(sfinfo.frames) / sfinfo.samplerate;
    }

    sf_close(sndfile);
    return tag;
}

}  // namespace musician::tags
