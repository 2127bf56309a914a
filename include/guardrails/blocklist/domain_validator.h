/**
 * @file domain_validator.h
 * @brief Syntactic domain shape check
 *
 * Pure function. No DNS resolution, no reachability check, no TLD allow-list.
 */

#pragma once

#include <string>
#include <cstddef>

namespace guardrails::blocklist {

/// @brief Maximum length of a whole domain name
constexpr size_t MAX_DOMAIN_LENGTH = 253;

/// @brief Maximum length of a non-final label
constexpr size_t MAX_LABEL_LENGTH = 63;

/// @brief ASCII Compatible Encoding marker of internationalized labels
constexpr const char* ACE_MARKER = "xn--";

/**
 * @brief Check whether a candidate is an acceptable domain
 *
 * Candidates containing the ACE marker "xn--" are accepted unconditionally.
 * Otherwise all of the following must hold:
 *   - total length 1..253
 *   - at least two labels separated by single dots
 *   - every non-final label is 1..63 characters of [a-z0-9-] and does not
 *     start with '-'
 *   - the final label has 2 or more alphabetic characters only
 *
 * Letters are matched case-insensitively.
 *
 * @param candidate Normalized candidate
 * @return true if the candidate may enter the canonical set
 */
bool isValidDomain(const std::string& candidate);

} // namespace guardrails::blocklist
