#pragma once
#include <string>
#include <vector>
#include "subtitle.hpp"
#include "video.hpp"

enum class RankCriterion {
    LanguageRank,
    ProviderRank,
    ProviderConfidence,
    ContentMatchConfidence
};

namespace ranking {
    std::vector<RankCriterion> defaultCriteria();

    // In multi mode LanguageRank becomes the most significant criterion.
    std::vector<RankCriterion> effectiveCriteria(const std::vector<RankCriterion>& criteria, bool multi);

    std::string criterionName(RankCriterion criterion);

    // Accepts "language", "provider", "provider_confidence" and "matching_confidence".
    // Throws SubscoutError on anything else.
    RankCriterion parseCriterion(const std::string& name);

    // Plausibility that `subtitle` belongs to `video`, in [0, 1], inferred from the
    // subtitle release name. 0 when the subtitle carries no release name.
    double matchingConfidence(const Video& video, const Subtitle& subtitle);
}

// Orders candidate subtitles best first against the preferred languages and providers.
class Ranker {
public:
    Ranker(std::vector<std::string> languages, std::vector<std::string> providers);

    // One non-negative component per criterion, higher is better. Keys compare
    // lexicographically, so each criterion breaks ties of the previous ones.
    std::vector<long> sortKey(const Subtitle& subtitle, const Video& video,
                              const std::vector<RankCriterion>& criteria) const;

    // Stable: candidates with equal keys keep their input order.
    std::vector<Subtitle> rank(const std::vector<Subtitle>& subtitles, const Video& video,
                               const std::vector<RankCriterion>& criteria) const;

private:
    std::vector<std::string> languages_;
    std::vector<std::string> providers_;
};
