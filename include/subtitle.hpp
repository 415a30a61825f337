#pragma once
#include <set>
#include <string>
#include "video.hpp"

struct Subtitle {
    VideoPtr video;
    std::string provider;
    std::string language;
    double confidence = 0.0;
    std::string release;
    std::set<std::string> keywords;

    // Provider specific reference used to fetch the file (id, link, ...).
    std::string link;
    // Local target path, written by Provider::download.
    std::string path;

    std::string describe() const;
};
