/**
 * @file TextMatch.hpp
 * @brief Case-insensitive comparison helpers used by filtering and sorting.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace fleetkeeper::domain {

inline std::string ToLowerAscii(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

/** @brief True if needle occurs in haystack ignoring ASCII case. Empty needle matches. */
inline bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return ToLowerAscii(haystack).find(ToLowerAscii(needle)) != std::string::npos;
}

/** @brief Strict-weak "less" ignoring ASCII case. */
inline bool LessIgnoreCase(const std::string& a, const std::string& b) {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

} // namespace fleetkeeper::domain
