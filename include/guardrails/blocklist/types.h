/**
 * @file types.h
 * @brief Common types for the blocklist pipeline
 *
 * Shared records exchanged between the normalizer, validator, aggregator,
 * rule compiler and canonical writer.
 */

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace guardrails::blocklist {

/// @brief Reason attached to a rejected input line
enum class WarningReason {
    INVALID_DOMAIN_SHAPE   ///< Normalized candidate failed the domain grammar
};

/// @brief One input source: identifier plus its full text
struct SourceText {
    std::string id;     ///< Source identifier (e.g., "source/ads.txt")
    std::string text;   ///< Raw content, newline separated
};

/// @brief Rejected input line, reported but never fatal
struct Warning {
    std::string source;     ///< Source identifier
    size_t line = 0;        ///< 1-based line number within the source
    std::string text;       ///< Post-normalization candidate
    WarningReason reason = WarningReason::INVALID_DOMAIN_SHAPE;

    bool operator==(const Warning& that) const {
        return source == that.source && line == that.line &&
               text == that.text && reason == that.reason;
    }
};

/// @brief Output of one aggregation run
struct BuildResult {
    std::vector<std::string> domains;   ///< Canonical domains, byte-order sorted, unique
    std::vector<Warning> warnings;      ///< Encounter order (source, then line)
    std::vector<std::string> sources;   ///< Source identifiers in processing order
    size_t linesSeen = 0;               ///< Total input lines across all sources
};

/// @brief Convert WarningReason to its stable reason code
inline std::string warningReasonToString(WarningReason r) {
    switch (r) {
        case WarningReason::INVALID_DOMAIN_SHAPE: return "invalid-domain-shape";
    }
    return "unknown";
}

/// @brief Render a warning as "<source>:<line>: skipped invalid domain: '<text>'"
inline std::string warningToString(const Warning& w) {
    return w.source + ":" + std::to_string(w.line) +
           ": skipped invalid domain: '" + w.text + "' (" +
           warningReasonToString(w.reason) + ")";
}

} // namespace guardrails::blocklist
