/*
 * Copyright 2025 csrfguard Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// String Utilities - ASCII case folding and fuzzy matching

#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace csrfguard::core {

[[nodiscard]] constexpr char to_lower_ascii(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

[[nodiscard]] constexpr char to_upper_ascii(char c) noexcept {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

[[nodiscard]] constexpr bool is_space_ascii(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

/// ASCII case-insensitive equality
[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(),
                      [](char ca, char cb) { return to_lower_ascii(ca) == to_lower_ascii(cb); });
}

/// ASCII case-insensitive prefix test
[[nodiscard]] inline bool istarts_with(std::string_view s, std::string_view prefix) noexcept {
    return s.size() >= prefix.size() && iequals(s.substr(0, prefix.size()), prefix);
}

/// ASCII case-insensitive substring test
[[nodiscard]] inline bool icontains(std::string_view haystack, std::string_view needle) noexcept {
    if (needle.empty()) {
        return true;
    }
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) { return to_lower_ascii(a) == to_lower_ascii(b); });
    return it != haystack.end();
}

[[nodiscard]] inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), to_lower_ascii);
    return out;
}

/// Normalize a header name to its CGI form: "X-CSRF-Token" -> "X_CSRF_TOKEN"
[[nodiscard]] inline std::string normalize_header_key(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        out += (c == '-') ? '_' : to_upper_ascii(c);
    }
    return out;
}

/// Trim ASCII whitespace from both ends
[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && is_space_ascii(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space_ascii(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

/// Calculate Levenshtein distance between two strings
/// Returns the minimum number of single-character edits (insertions, deletions, substitutions)
/// required to change one string into the other
[[nodiscard]] inline size_t levenshtein_distance(std::string_view s1, std::string_view s2) {
    const size_t len1 = s1.length();
    const size_t len2 = s2.length();

    if (len1 == 0)
        return len2;
    if (len2 == 0)
        return len1;

    // Two rows instead of the full matrix
    std::vector<size_t> prev_row(len2 + 1);
    std::vector<size_t> curr_row(len2 + 1);

    for (size_t j = 0; j <= len2; ++j) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= len1; ++i) {
        curr_row[0] = i;

        for (size_t j = 1; j <= len2; ++j) {
            if (s1[i - 1] == s2[j - 1]) {
                curr_row[j] = prev_row[j - 1];
            } else {
                curr_row[j] = 1 + std::min({
                                      prev_row[j],      // delete
                                      curr_row[j - 1],  // insert
                                      prev_row[j - 1]   // substitute
                                  });
            }
        }

        std::swap(prev_row, curr_row);
    }

    return prev_row[len2];
}

/// Find similar strings from a list based on Levenshtein distance
/// Returns strings with edit distance <= max_distance, sorted by distance
[[nodiscard]] inline std::vector<std::string> find_similar_strings(
    std::string_view target, const std::vector<std::string>& candidates, size_t max_distance = 3) {
    std::vector<std::pair<std::string, size_t>> matches;

    for (const auto& candidate : candidates) {
        size_t distance = levenshtein_distance(target, candidate);
        if (distance <= max_distance && distance > 0) {  // distance > 0 excludes exact matches
            matches.emplace_back(candidate, distance);
        }
    }

    std::sort(matches.begin(), matches.end(),
              [](const auto& a, const auto& b) { return a.second < b.second; });

    std::vector<std::string> result;
    result.reserve(matches.size());
    for (const auto& [str, _] : matches) {
        result.push_back(str);
    }

    return result;
}

}  // namespace csrfguard::core
