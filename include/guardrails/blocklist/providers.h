/**
 * @file providers.h
 * @brief Provider interface for input discovery
 *
 * Decouples the pipeline from where domain lists come from. The build tool
 * uses source::FilesystemSourceProvider; tests supply in-memory sources.
 */

#pragma once

#include <vector>
#include "types.h"

namespace guardrails::blocklist {

/**
 * @brief Ordered input source lookup interface
 *
 * Implementations must return sources in a stable order (e.g., sorted by
 * identifier) so that warning order does not depend on discovery order.
 */
class ISourceProvider {
public:
    virtual ~ISourceProvider() = default;

    /**
     * @brief Discover and read every input source
     * @return Sources in processing order (never empty)
     * @throws common::SourceException if no source can be found or a
     *         required source is missing or unreadable
     */
    virtual std::vector<SourceText> loadSources() = 0;
};

} // namespace guardrails::blocklist
