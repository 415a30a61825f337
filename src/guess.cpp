#include "guess.hpp"
#include "media.hpp"
#include "utils.hpp"
#include <filesystem>
#include <regex>
#include <vector>

namespace fs = std::filesystem;

namespace {
    const std::set<std::string> VIDEO_CODECS = {
        "x264", "h264", "x265", "h265", "hevc", "avc", "xvid", "divx"
    };

    const std::set<std::string> FORMATS = {
        "hdtv", "pdtv", "dsr", "tvrip", "dvd", "dvdrip", "bdrip", "brrip", "bluray", "blu-ray",
        "hdrip", "web", "web-dl", "webrip", "vhs"
    };

    const std::regex EPISODE_REGEX(R"(^[sS](\d{1,2})[eE](\d{1,3})$)");
    const std::regex EPISODE_ALT_REGEX(R"(^(\d{1,2})[xX](\d{2,3})$)");
    const std::regex YEAR_REGEX(R"(^(19|20)\d{2}$)");
    const std::regex SCREEN_SIZE_REGEX(R"(^\d{3,4}[pi]$)");

    std::string stripExtension(const std::string& name) {
        fs::path path(name);
        std::string extension = utils::toLower(path.extension().string());
        if (!extension.empty() && (media::isVideoExtension(extension) || media::isSubtitleExtension(extension))) {
            return path.stem().string();
        }
        return path.filename().string();
    }

    bool isKeywordToken(const std::string& lower) {
        return std::regex_match(lower, SCREEN_SIZE_REGEX) || VIDEO_CODECS.count(lower) || FORMATS.count(lower);
    }

    std::string joinTokens(const std::vector<std::string>& tokens, size_t end) {
        std::vector<std::string> head(tokens.begin(), tokens.begin() + end);
        return utils::trim(utils::joinStrings(head, " "));
    }
}

Guess guessFileInfo(const std::string& name) {
    Guess guess;
    std::string base = stripExtension(name);

    size_t dash = base.rfind('-');
    if (dash != std::string::npos && dash > 0 && dash + 1 < base.size()) {
        std::string group = base.substr(dash + 1);
        bool alnum = utils::wordTokens(group).size() == 1 && utils::wordTokens(group)[0] == group;
        if (alnum && utils::toLower(group) != "dl" && utils::toLower(group) != "ray") {
            guess.release_group = group;
            base = base.substr(0, dash);
        }
    }

    for (char& c : base) {
        if (c == '.' || c == '_' || c == '(' || c == ')' || c == '[' || c == ']') {
            c = ' ';
        }
    }

    std::vector<std::string> tokens;
    for (const auto& token : utils::splitString(base, ' ')) {
        if (!utils::wordTokens(token).empty()) {
            tokens.push_back(token);
        }
    }

    for (const auto& token : tokens) {
        std::string lower = utils::toLower(token);
        if (guess.screen_size.empty() && std::regex_match(lower, SCREEN_SIZE_REGEX)) {
            guess.screen_size = lower;
        } else if (guess.video_codec.empty() && VIDEO_CODECS.count(lower)) {
            guess.video_codec = lower;
        } else if (guess.format.empty() && FORMATS.count(lower)) {
            guess.format = lower;
        }
    }

    for (size_t i = 0; i < tokens.size(); ++i) {
        std::smatch match;
        if (std::regex_match(tokens[i], match, EPISODE_REGEX) ||
            std::regex_match(tokens[i], match, EPISODE_ALT_REGEX)) {
            guess.type = Guess::Type::Episode;
            guess.series = joinTokens(tokens, i);
            guess.season = std::stoi(match[1].str());
            guess.episode = std::stoi(match[2].str());
            return guess;
        }
    }

    for (size_t i = 1; i < tokens.size(); ++i) {
        if (std::regex_match(tokens[i], YEAR_REGEX)) {
            guess.type = Guess::Type::Movie;
            guess.title = joinTokens(tokens, i);
            guess.year = std::stoi(tokens[i]);
            return guess;
        }
    }

    size_t end = 0;
    while (end < tokens.size() && !isKeywordToken(utils::toLower(tokens[end]))) {
        ++end;
    }
    guess.title = joinTokens(tokens, end);
    if (!guess.title.empty()) {
        guess.type = Guess::Type::Movie;
    }
    return guess;
}

std::set<std::string> guessKeywords(const Guess& guess) {
    std::set<std::string> keywords;
    for (const std::string* field : {&guess.release_group, &guess.screen_size, &guess.video_codec, &guess.format}) {
        for (const auto& token : utils::wordTokens(utils::toLower(*field))) {
            keywords.insert(token);
        }
    }
    return keywords;
}
