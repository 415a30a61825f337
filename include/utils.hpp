#pragma once
#include <string>
#include <vector>

namespace utils {
    std::vector<std::string> splitString(const std::string& str, char delim);
    std::string joinStrings(const std::vector<std::string>& parts, const std::string& separator);
    std::string toLower(const std::string& str);
    std::string trim(const std::string& str);
    std::vector<std::string> wordTokens(const std::string& str);
    std::string padNumber(int num, int width);
    bool createDirectoryIfNotExists(const std::string& path);
}
