#include "utils.hpp"
#include "logging.hpp"
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace utils {

std::vector<std::string> splitString(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string joinStrings(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& str) {
    const char* whitespace = " \t\n\r";
    size_t first = str.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

// Alphanumeric runs, i.e. what a \w+ regex would yield without the underscore.
std::vector<std::string> wordTokens(const std::string& str) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : str) {
        if (std::isalnum(c)) {
            current += static_cast<char>(c);
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

std::string padNumber(int num, int width) {
    std::ostringstream ss;
    ss << std::setw(width) << std::setfill('0') << num;
    return ss.str();
}

bool createDirectoryIfNotExists(const std::string& path) {
    try {
        fs::create_directories(path);
        return fs::is_directory(path);
    } catch (const fs::filesystem_error& e) {
        logging::error("subscout", std::string("Error creating directory: ") + e.what());
        return false;
    }
}

}
