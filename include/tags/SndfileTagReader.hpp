#pragma once

#include "TagReader.hpp"

namespace musician::tags {

// FLAC, Ogg Vorbis/Opus, WAV and AIFF via libsndfile string chunks
class SndfileTagReader : public TagReader {
public:
    bool handles(std::string_view extension) const override;
    TagData read(const std::string& path) override;
    const char* name() const override { return "sndfile"; }
};

}  // namespace musician::tags
