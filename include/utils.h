#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <vector>

namespace voxlink {

/**
 * @brief String utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

/**
 * @brief Trim whitespace from both ends of a string (returns copy)
 */
inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief ASCII lowercase copy; bytes of multi-byte UTF-8 sequences are left as is
 */
inline std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/**
 * @brief Check if string is empty or contains only whitespace
 */
inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Collapse runs of whitespace into single spaces and trim
 */
inline std::string collapse_whitespace(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    bool last_was_space = false;
    for (char c : str) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!last_was_space) {
                result += ' ';
                last_was_space = true;
            }
        } else {
            result += c;
            last_was_space = false;
        }
    }
    return trim(result);
}

/**
 * @brief Count letters/digits in UTF-8 text.
 *
 * Every non-ASCII code point counts as a letter (Cyrillic, CJK, ...);
 * ASCII counts only when alphanumeric. Emoji therefore count too, which is
 * acceptable for deciding whether text is worth speaking.
 */
inline size_t count_word_chars(const std::string& str) {
    size_t count = 0;
    for (unsigned char c : str) {
        if (c < 0x80) {
            if (std::isalnum(c)) count++;
        } else if ((c & 0xC0) != 0x80) {
            count++;  // lead byte of a multi-byte code point
        }
    }
    return count;
}

/**
 * @brief True if text contains anything a synthesizer could pronounce
 */
inline bool has_speakable_content(const std::string& str) {
    return count_word_chars(str) > 0;
}

/**
 * @brief Check if transcript text is blank (empty/whitespace or equals blank sentinel)
 * @param text Raw transcript text
 * @param blank_sentinel String to treat as blank (e.g. "[BLANK_AUDIO]"); compared after trim
 */
inline bool is_blank_transcript(const std::string& text, const std::string& blank_sentinel = "[BLANK_AUDIO]") {
    std::string t = trim_copy(text);
    if (t.empty()) return true;
    if (!blank_sentinel.empty() && t == blank_sentinel) return true;
    return !has_speakable_content(t);
}

/**
 * @brief Shorten text for log lines
 */
inline std::string preview(const std::string& str, size_t max_len = 80) {
    if (str.size() <= max_len) return str;
    // Do not cut inside a UTF-8 sequence
    size_t cut = max_len;
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        cut--;
    }
    return str.substr(0, cut) + "...";
}

} // namespace utils

} // namespace voxlink
