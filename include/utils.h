#pragma once

#include "common.h"
#include <string>
#include <algorithm>
#include <cctype>
#include <vector>

namespace rtvoice {

/**
 * @brief String and encoding utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r\f\v"));
    str.erase(str.find_last_not_of(" \t\n\r\f\v") + 1);
    return str;
}

inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Lowercase copy of a string (ASCII)
 */
inline std::string to_lower_copy(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Check if string is empty or contains only whitespace
 */
inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r\f\v") == std::string::npos;
}

/**
 * @brief Lowercase and strip every non-alphanumeric character
 *
 * "Recipient_Email" -> "recipientemail", "send-to" -> "sendto". Used to match
 * tool names and argument keys that differ only in case or punctuation.
 */
inline std::string normalize_identifier(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (unsigned char c : str) {
        if (std::isalnum(c)) {
            result.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return result;
}

inline bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * @brief Join strings with a separator
 */
inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

/**
 * @brief Encode PCM16 samples (little-endian) as base64
 */
std::string base64_encode_pcm16(const AudioFrame& samples);

/**
 * @brief Decode base64 little-endian PCM16; stops at the first non-alphabet character
 *
 * A trailing odd byte is dropped.
 */
AudioBuffer base64_decode_pcm16(const std::string& encoded);

/**
 * @brief Random identifier (hex), used for client session tokens
 */
std::string random_id(size_t bytes = 16);

/**
 * @brief Current wall-clock time as ISO-8601 UTC with milliseconds
 */
std::string iso_timestamp_now();

} // namespace utils

} // namespace rtvoice
