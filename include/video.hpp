#pragma once
#include <memory>
#include <optional>
#include <set>
#include <string>
#include "guess.hpp"

struct Video {
    enum class Kind { Movie, Episode };

    std::string path;
    Kind kind = Kind::Movie;
    std::string title;
    std::optional<int> year;
    std::string series;
    int season = 0;
    int episode = 0;
    Guess guess;

    // Normalizes `path` to an absolute path and classifies it from its file name.
    // Names that look like neither an episode nor a movie become movies titled by their stem.
    static std::shared_ptr<const Video> fromPath(const std::string& path);

    std::set<std::string> keywords() const;
    bool exists() const;
    std::string basePath() const;
    std::string describe() const;
};

using VideoPtr = std::shared_ptr<const Video>;
