#pragma once

#include "TagReader.hpp"

namespace musician::tags {

// MPEG audio (ID3v2, falling back to ID3v1) via libmpg123
class Mpg123TagReader : public TagReader {
public:
    bool handles(std::string_view extension) const override;
    TagData read(const std::string& path) override;
    const char* name() const override { return "mpg123"; }
};

}  // namespace musician::tags
