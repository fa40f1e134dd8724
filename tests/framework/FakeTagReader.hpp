#pragma once

#include "tags/TagReader.hpp"
#include <fstream>
#include <sstream>
#include <string>

namespace musician::test {

// Treats .mp3 files as "key=value" lines so tests can script tag content
// without real audio. A file whose first line is "corrupt" fails to parse.
class FakeTagReader : public tags::TagReader {
public:
    bool handles(std::string_view extension) const override { return extension == "mp3"; }

    tags::TagData read(const std::string& path) override {
        std::ifstream in(path);
        if (!in) throw tags::TagError("cannot open " + path);

        tags::TagData data;
        std::string line;
        bool first = true;
        while (std::getline(in, line)) {
            if (first && line == "corrupt") throw tags::TagError("corrupt header in " + path);
            first = false;

            auto eq = line.find('=');
            if (eq == std::string::npos) continue;
            std::string key = line.substr(0, eq);
            std::string value = line.substr(eq + 1);

            if (key == "title") data.title = non_empty(value);
            else if (key == "album") data.album = non_empty(value);
            else if (key == "artist") data.artist = non_empty(value);
            else if (key == "genre") data.genre = non_empty(value);
            else if (key == "date") data.year = non_empty(value);
            else if (key == "duration") data.duration = std::stod(value);
        }
        return data;
    }

    const char* name() const override { return "fake"; }
};

}  // namespace musician::test
