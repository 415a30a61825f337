#include "scanner.hpp"
#include "languages.hpp"
#include "logging.hpp"
#include "media.hpp"
#include <algorithm>
#include <filesystem>
#include <iterator>

namespace fs = std::filesystem;

namespace {
    ScanEntry inspectVideo(const fs::path& video) {
        ScanEntry entry;
        entry.path = video.string();

        std::string stem = video.stem().string();
        std::error_code ec;
        for (const auto& sibling : fs::directory_iterator(video.parent_path(), ec)) {
            std::string name = sibling.path().filename().string();
            std::string extension = sibling.path().extension().string();
            if (!media::isSubtitleExtension(extension) || name.size() < stem.size() + extension.size() ||
                name.compare(0, stem.size(), stem) != 0) {
                continue;
            }
            std::string middle = name.substr(stem.size(), name.size() - stem.size() - extension.size());
            if (middle.empty()) {
                entry.has_single = true;
            } else if (middle[0] == '.' && languages::isValid(middle.substr(1))) {
                entry.languages.insert(middle.substr(1));
            }
        }
        if (ec) {
            logging::warning("subscout", "Could not list " + video.parent_path().string() + ": " + ec.message());
        }
        return entry;
    }

    void scanPath(const fs::path& path, int depth, int max_depth, std::vector<ScanEntry>& result) {
        if (depth > max_depth && max_depth != 0) {
            return;
        }

        std::error_code ec;
        if (fs::is_regular_file(path, ec)) {
            if (depth != 0 && !media::isVideoExtension(path.extension().string())) {
                return;
            }
            result.push_back(inspectVideo(path));
            return;
        }

        if (fs::is_directory(path, ec)) {
            std::vector<fs::path> children;
            for (const auto& child : fs::directory_iterator(path, ec)) {
                children.push_back(child.path());
            }
            if (ec) {
                logging::warning("subscout", "Could not list " + path.string() + ": " + ec.message());
            }
            std::sort(children.begin(), children.end());
            for (const auto& child : children) {
                scanPath(child, depth + 1, max_depth, result);
            }
        }
    }
}

namespace scanner {

std::vector<ScanEntry> scan(const std::string& entry, int max_depth) {
    std::vector<ScanEntry> result;
    scanPath(fs::absolute(fs::path(entry)).lexically_normal(), 0, max_depth, result);
    return result;
}

std::set<std::string> needsSearch(const std::set<std::string>& existing,
                                  bool has_unlabeled,
                                  const std::set<std::string>& wanted,
                                  bool multi,
                                  bool force) {
    if (force) {
        return wanted;
    }
    if (multi) {
        std::set<std::string> missing;
        std::set_difference(wanted.begin(), wanted.end(), existing.begin(), existing.end(),
                            std::inserter(missing, missing.end()));
        return missing;
    }
    if (has_unlabeled) {
        return {};
    }
    return wanted;
}

}
