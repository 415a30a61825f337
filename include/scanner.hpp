#pragma once
#include <set>
#include <string>
#include <vector>

// A video found on disk along with the subtitles already next to it.
struct ScanEntry {
    std::string path;
    // Languages of <base>.<language>.<ext> subtitles.
    std::set<std::string> languages;
    // A <base>.<ext> subtitle without a language tag exists.
    bool has_single = false;
};

namespace scanner {
    // Scans a file or directory. The entry itself is trusted at depth 0; deeper
    // files need a video extension. Directories are walked while depth <= max_depth,
    // a max_depth of 0 walks without limit.
    std::vector<ScanEntry> scan(const std::string& entry, int max_depth = 3);

    // The subset of `wanted` still worth searching for.
    std::set<std::string> needsSearch(const std::set<std::string>& existing,
                                      bool has_unlabeled,
                                      const std::set<std::string>& wanted,
                                      bool multi,
                                      bool force);
}
