/**
 * @file hash_utils.h
 * @brief Content digest helpers (OpenSSL EVP)
 */

#pragma once

#include <string>

namespace guardrails {
namespace utils {

/**
 * @brief Compute SHA-256 of content
 *
 * @param content Bytes to hash
 * @return Lowercase hex digest (64 chars)
 * @throws std::runtime_error if the digest context cannot be created
 */
std::string sha256Hex(const std::string& content);

} // namespace utils
} // namespace guardrails
