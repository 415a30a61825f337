#pragma once
#include <optional>
#include <set>
#include <string>

// Metadata inferred from a release or file name such as
// "Show.Name.S01E02.720p.HDTV.x264-GROUP".
struct Guess {
    enum class Type { Unknown, Movie, Episode };

    Type type = Type::Unknown;
    std::string title;
    std::optional<int> year;
    std::string series;
    std::optional<int> season;
    std::optional<int> episode;

    std::string release_group;
    std::string screen_size;
    std::string video_codec;
    std::string format;
};

Guess guessFileInfo(const std::string& name);

// Lower-cased word tokens of the release group, screen size, video codec and format.
std::set<std::string> guessKeywords(const Guess& guess);
