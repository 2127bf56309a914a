/**
 * @file aggregator.h
 * @brief Collects unique valid domains from many sources
 *
 * Runs every line through normalizeLine() and isValidDomain(), keeps the
 * unique survivors and records a Warning for each rejected candidate.
 * One Aggregator instance per run; no shared state between runs.
 */

#pragma once

#include <set>
#include <string>
#include <vector>
#include "types.h"

namespace guardrails::blocklist {

/**
 * @brief Domain aggregator
 *
 * Usage:
 * @code
 *   Aggregator aggregator;
 *   for (const auto& source : provider.loadSources()) {
 *       aggregator.addSource(source);
 *   }
 *   BuildResult result = aggregator.finish();
 * @endcode
 */
class Aggregator {
public:
    /**
     * @brief Process every line of one source
     *
     * Blank and comment lines are skipped silently. Duplicates are inserted
     * once without a warning.
     *
     * @param source Source identifier and text
     */
    void addSource(const SourceText& source);

    /**
     * @brief Produce the result and reset the aggregator
     * @return Sorted unique domains, warnings in encounter order, line count
     */
    BuildResult finish();

    /// @brief Number of unique domains collected so far
    size_t domainCount() const { return domains_.size(); }

    /// @brief Number of warnings collected so far
    size_t warningCount() const { return warnings_.size(); }

private:
    std::set<std::string> domains_;
    std::vector<Warning> warnings_;
    std::vector<std::string> sources_;
    size_t linesSeen_ = 0;
};

/**
 * @brief Aggregate an ordered list of sources in one call
 *
 * @param sources Sources in processing order
 * @return BuildResult identical to feeding each source to an Aggregator
 */
BuildResult aggregate(const std::vector<SourceText>& sources);

} // namespace guardrails::blocklist
