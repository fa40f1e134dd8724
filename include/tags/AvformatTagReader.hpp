#pragma once

#include "TagReader.hpp"

namespace musician::tags {

// MP4-family and ASF containers via FFmpeg libavformat metadata dictionaries
class AvformatTagReader : public TagReader {
public:
    bool handles(std::string_view extension) const override;
    TagData read(const std::string& path) override;
    const char* name() const override { return "avformat"; }
};

}  // namespace musician::tags
