#include "video.hpp"
#include "utils.hpp"
#include <filesystem>

namespace fs = std::filesystem;

std::shared_ptr<const Video> Video::fromPath(const std::string& path) {
    auto video = std::make_shared<Video>();
    video->path = fs::absolute(fs::path(path)).lexically_normal().string();
    video->guess = guessFileInfo(video->path);

    if (video->guess.type == Guess::Type::Episode) {
        video->kind = Kind::Episode;
        video->series = video->guess.series;
        video->season = video->guess.season.value_or(0);
        video->episode = video->guess.episode.value_or(0);
    } else {
        video->kind = Kind::Movie;
        video->title = video->guess.title.empty() ? fs::path(video->path).stem().string() : video->guess.title;
        video->year = video->guess.year;
    }
    return video;
}

std::set<std::string> Video::keywords() const {
    return guessKeywords(guess);
}

bool Video::exists() const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::string Video::basePath() const {
    fs::path p(path);
    return (p.parent_path() / p.stem()).string();
}

std::string Video::describe() const {
    if (kind == Kind::Episode) {
        return series + " S" + utils::padNumber(season, 2) + "E" + utils::padNumber(episode, 2);
    }
    return year ? title + " (" + std::to_string(*year) + ")" : title;
}
