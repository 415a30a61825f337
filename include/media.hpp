#pragma once
#include <string>
#include <vector>

namespace media {
    // Extensions include the leading dot and are lower case.
    const std::vector<std::string>& videoExtensions();
    const std::vector<std::string>& subtitleExtensions();

    bool isVideoExtension(const std::string& extension);
    bool isSubtitleExtension(const std::string& extension);
}
