#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace cadence {
namespace utils {

inline std::string toLower(const std::string& str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

inline std::string trim(const std::string& str) {
    const auto first = std::find_if_not(str.begin(), str.end(),
                                        [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(str.rbegin(), str.rend(),
                                       [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

// Splits on any run of whitespace, dropping empty tokens
inline std::vector<std::string> splitWhitespace(const std::string& str) {
    std::vector<std::string> tokens;
    std::istringstream in(str);
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

inline bool isDigits(const std::string& str) {
    return !str.empty() &&
           std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace utils
} // namespace cadence
