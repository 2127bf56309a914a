/**
 * @file line_normalizer.h
 * @brief Raw input line -> candidate domain
 *
 * Pure functions, no I/O. Accepted line shapes:
 *   example.com
 *   Example.COM.            (case and root-zone dot are dropped)
 *   *.example.com           (leading wildcard removed once)
 *   https://example.com/x   (scheme and path removed)
 *   example.com  # note     (inline comment removed)
 *   ||example.com^$dnstype=AAAA   (filter rule, domain extracted)
 * Blank lines and "#" comment lines produce no candidate.
 */

#pragma once

#include <optional>
#include <string>

namespace guardrails::blocklist {

/**
 * @brief Normalize one raw input line
 *
 * Trims, drops comments, extracts the domain of a "||domain^[$options]"
 * rule line, then applies normalizeCandidate(). Never fails: every input
 * maps to either a candidate or std::nullopt.
 *
 * @param line Raw line without its terminator
 * @return Candidate domain (not yet validated), or std::nullopt to skip the line
 */
std::optional<std::string> normalizeLine(const std::string& line);

/**
 * @brief Canonicalize a domain-ish string
 *
 * In order: trim, lowercase, strip one "https://" or "http://" prefix,
 * strip one leading "*.", truncate at the first '/' and re-trim, strip one
 * trailing '.'.
 *
 * @param value Comment-free text
 * @return Candidate, or std::nullopt if nothing is left
 */
std::optional<std::string> normalizeCandidate(const std::string& value);

/**
 * @brief Extract the domain from a "||domain^" filter rule
 *
 * Matches "||<domain>^" optionally followed by "$<options>", with surrounding
 * whitespace allowed. The domain is everything up to the first '^' and must
 * be non-empty with no whitespace, '|' or '$'; its shape is left to
 * isValidDomain(). Single linear scan, safe for lines of any length.
 *
 * @param line Comment-free line
 * @return Domain exactly as written inside the delimiters, or std::nullopt
 *         if the line is not a filter rule
 */
std::optional<std::string> extractRuleDomain(const std::string& line);

} // namespace guardrails::blocklist
