#include "ranking.hpp"
#include "errors.hpp"
#include "guess.hpp"
#include "utils.hpp"
#include <algorithm>
#include <iterator>
#include <numeric>

namespace {
    const int KEYWORD_BITS = 3;

    // Earlier entries score higher; entries missing from the list score 0.
    long inverseIndex(const std::vector<std::string>& preferences, const std::string& value) {
        auto it = std::find(preferences.begin(), preferences.end(), value);
        if (it == preferences.end()) {
            return 0;
        }
        return static_cast<long>(preferences.size() - (it - preferences.begin()));
    }

    long scale(double confidence) {
        return std::clamp(static_cast<long>(confidence * 1000), 0L, 1000L);
    }

    int bitWidth(unsigned long value) {
        int width = 0;
        while (value > 0) {
            ++width;
            value >>= 1;
        }
        return width;
    }
}

namespace ranking {

std::vector<RankCriterion> defaultCriteria() {
    return {RankCriterion::LanguageRank, RankCriterion::ProviderRank, RankCriterion::ProviderConfidence};
}

std::vector<RankCriterion> effectiveCriteria(const std::vector<RankCriterion>& criteria, bool multi) {
    if (!multi) {
        return criteria;
    }
    std::vector<RankCriterion> result = {RankCriterion::LanguageRank};
    for (auto criterion : criteria) {
        if (criterion != RankCriterion::LanguageRank) {
            result.push_back(criterion);
        }
    }
    return result;
}

std::string criterionName(RankCriterion criterion) {
    switch (criterion) {
        case RankCriterion::LanguageRank: return "language";
        case RankCriterion::ProviderRank: return "provider";
        case RankCriterion::ProviderConfidence: return "provider_confidence";
        case RankCriterion::ContentMatchConfidence: return "matching_confidence";
    }
    return "unknown";
}

RankCriterion parseCriterion(const std::string& name) {
    std::string lower = utils::toLower(utils::trim(name));
    if (lower == "language") return RankCriterion::LanguageRank;
    if (lower == "provider") return RankCriterion::ProviderRank;
    if (lower == "provider_confidence") return RankCriterion::ProviderConfidence;
    if (lower == "matching_confidence") return RankCriterion::ContentMatchConfidence;
    throw SubscoutError("Unknown sort criterion: " + name);
}

double matchingConfidence(const Video& video, const Subtitle& subtitle) {
    if (subtitle.release.empty()) {
        return 0.0;
    }

    Guess guess = guessFileInfo(subtitle.release);
    std::set<std::string> video_keywords = video.keywords();
    std::set<std::string> subtitle_keywords = guessKeywords(guess);
    subtitle_keywords.insert(subtitle.keywords.begin(), subtitle.keywords.end());

    std::vector<std::string> shared;
    std::set_intersection(video_keywords.begin(), video_keywords.end(),
                          subtitle_keywords.begin(), subtitle_keywords.end(),
                          std::back_inserter(shared));

    std::vector<bool> flags;
    if (video.kind == Video::Kind::Episode) {
        bool is_episode = guess.type == Guess::Type::Episode;
        flags.push_back(is_episode && utils::toLower(guess.series) == utils::toLower(video.series));
        flags.push_back(is_episode && guess.season && *guess.season == video.season);
        flags.push_back(is_episode && guess.episode && *guess.episode == video.episode);
    } else {
        bool is_movie = guess.type == Guess::Type::Movie;
        flags.push_back(is_movie && utils::toLower(guess.title) == utils::toLower(video.title));
        flags.push_back(is_movie && guess.year && video.year && *guess.year == *video.year);
    }

    // Both patterns share the same layout: one bit per flag, then the keyword count.
    unsigned long cap = video_keywords.size();
    int width = std::max(KEYWORD_BITS, bitWidth(cap));
    unsigned long achieved = 0;
    unsigned long best = 0;
    for (bool flag : flags) {
        achieved = (achieved << 1) | (flag ? 1UL : 0UL);
        best = (best << 1) | 1UL;
    }
    achieved = (achieved << width) | std::min<unsigned long>(shared.size(), cap);
    best = (best << width) | cap;

    return static_cast<double>(achieved) / static_cast<double>(best);
}

}

Ranker::Ranker(std::vector<std::string> languages, std::vector<std::string> providers)
    : languages_(std::move(languages)), providers_(std::move(providers)) {}

std::vector<long> Ranker::sortKey(const Subtitle& subtitle, const Video& video,
                                  const std::vector<RankCriterion>& criteria) const {
    std::vector<long> key;
    for (auto criterion : criteria) {
        switch (criterion) {
            case RankCriterion::LanguageRank:
                key.push_back(inverseIndex(languages_, subtitle.language));
                break;
            case RankCriterion::ProviderRank:
                key.push_back(inverseIndex(providers_, subtitle.provider));
                break;
            case RankCriterion::ProviderConfidence:
                key.push_back(scale(subtitle.confidence));
                break;
            case RankCriterion::ContentMatchConfidence:
                key.push_back(scale(ranking::matchingConfidence(video, subtitle)));
                break;
        }
    }
    return key;
}

std::vector<Subtitle> Ranker::rank(const std::vector<Subtitle>& subtitles, const Video& video,
                                   const std::vector<RankCriterion>& criteria) const {
    std::vector<std::vector<long>> keys;
    keys.reserve(subtitles.size());
    for (const auto& subtitle : subtitles) {
        keys.push_back(sortKey(subtitle, video, criteria));
    }

    std::vector<size_t> order(subtitles.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&keys](size_t a, size_t b) { return keys[a] > keys[b]; });

    std::vector<Subtitle> ranked;
    ranked.reserve(subtitles.size());
    for (size_t index : order) {
        ranked.push_back(subtitles[index]);
    }
    return ranked;
}
