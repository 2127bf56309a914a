/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * ASCII-only helpers shared by the blocklist pipeline and its I/O edges.
 *
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace guardrails {
namespace utils {

/**
 * @brief Convert string to lowercase
 *
 * Only ASCII letters are mapped; other bytes are copied unchanged.
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Check if string starts with prefix
 *
 * @param str Input string
 * @param prefix Prefix to check
 * @return true if str starts with prefix
 */
bool startsWith(const std::string& str, const std::string& prefix);

/**
 * @brief Split text into lines
 *
 * "\n", "\r\n" and "\r" all terminate a line. A terminator at the very end
 * of the text does not produce an extra empty line, so "a\nb\n" yields
 * ["a", "b"] and "" yields [].
 *
 * @param text Input text
 * @return Lines without their terminators
 */
std::vector<std::string> splitLines(const std::string& text);

/**
 * @brief Join strings with delimiter
 *
 * @param parts Vector of strings
 * @param delimiter Delimiter string
 * @return Joined string
 */
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

/**
 * @brief Convert binary data to lowercase hex string
 *
 * @param data Pointer to binary data (may be null when len is 0)
 * @param len Number of bytes
 * @return Hex string (2 chars per byte)
 */
std::string bytesToHex(const uint8_t* data, size_t len);

} // namespace utils
} // namespace guardrails
