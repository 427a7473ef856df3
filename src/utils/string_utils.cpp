/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * Splitting follows single-character delimiters with no regex involvement so
 * that tokenization of large synthetic corpora stays cheap.
 *
 * @date 2025
 */

#include "attributor/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>

namespace attributor {
namespace utils {

// ============================================================================
// MANIPULATION
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::RemoveChar(const std::string& str, char ch) {
    std::string result;
    result.reserve(str.size());
    std::copy_if(str.begin(), str.end(), std::back_inserter(result),
                 [ch](char c) { return c != ch; });
    return result;
}

// Split string by delimiter
std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter,
                                            bool keep_empty) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (keep_empty || !token.empty()) {
            tokens.push_back(token);
        }
    }

    // getline drops the empty field after a trailing delimiter
    if (keep_empty && !str.empty() && str.back() == delimiter) {
        tokens.emplace_back();
    }

    return tokens;
}

std::string StringUtils::FirstSegment(const std::string& str, char delimiter) {
    auto pos = str.find(delimiter);
    return pos == std::string::npos ? str : str.substr(0, pos);
}

// Join strings
std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::IsBlank(const std::string& str) {
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

} // namespace utils
} // namespace attributor
