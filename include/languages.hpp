#pragma once
#include <string>
#include <vector>

namespace languages {
    // ISO 639-1 codes, in alphabetical order.
    const std::vector<std::string>& all();

    bool isValid(const std::string& code);

    // Deduplicates `codes` keeping the first occurrence of each.
    // Throws InvalidLanguageError on the first unknown code.
    std::vector<std::string> validate(const std::vector<std::string>& codes);
}
