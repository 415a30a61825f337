#include "media.hpp"
#include "utils.hpp"
#include <algorithm>

namespace media {

const std::vector<std::string>& videoExtensions() {
    static const std::vector<std::string> extensions = {
        ".3g2", ".3gp", ".3gp2", ".asf", ".avi", ".divx", ".flv", ".m4v", ".mk2", ".mka", ".mkv",
        ".mov", ".mp4", ".mp4a", ".mpeg", ".mpg", ".ogg", ".ogm", ".ogv", ".qt", ".ra", ".ram",
        ".rm", ".ts", ".wav", ".webm", ".wma", ".wmv"
    };
    return extensions;
}

const std::vector<std::string>& subtitleExtensions() {
    static const std::vector<std::string> extensions = {".srt", ".sub", ".txt", ".ass", ".ssa", ".smi"};
    return extensions;
}

bool isVideoExtension(const std::string& extension) {
    const auto& extensions = videoExtensions();
    return std::find(extensions.begin(), extensions.end(), utils::toLower(extension)) != extensions.end();
}

bool isSubtitleExtension(const std::string& extension) {
    const auto& extensions = subtitleExtensions();
    return std::find(extensions.begin(), extensions.end(), utils::toLower(extension)) != extensions.end();
}

}
