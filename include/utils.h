#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace turnkeeper {

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

inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Normalize string to lowercase (modified in place)
 */
inline std::string& normalize(std::string& str) {
    std::transform(str.begin(), str.end(), str.begin(),
                  [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    normalize(result);
    return result;
}

/**
 * @brief Lowercase and trim; the form every phrase matcher works on
 */
inline std::string clean_copy(const std::string& str) {
    return normalize_copy(trim_copy(str));
}

inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Split on runs of whitespace
 */
inline std::vector<std::string> split_words(const std::string& str) {
    std::vector<std::string> words;
    std::istringstream iss(str);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

inline size_t count_words(const std::string& str) {
    return split_words(str).size();
}

/**
 * @brief Strip leading/trailing punctuation so "Yeah." matches "yeah"
 */
inline std::string strip_punctuation(const std::string& str) {
    size_t begin = 0;
    size_t end = str.size();
    while (begin < end && std::ispunct(static_cast<unsigned char>(str[begin]))) ++begin;
    while (end > begin && std::ispunct(static_cast<unsigned char>(str[end - 1]))) --end;
    return str.substr(begin, end - begin);
}

} // namespace utils

} // namespace turnkeeper
