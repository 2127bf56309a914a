/**
 * @file build_report.h
 * @brief Machine-readable summary of one build (jsoncpp)
 *
 * Shape:
 * @code
 * {
 *   "generatedAt": "2026-01-01T00:00:00Z",
 *   "sources": ["source/a.txt"],
 *   "linesSeen": 10,
 *   "uniqueDomains": 7,
 *   "warningCount": 1,
 *   "warnings": [{"source": "source/a.txt", "line": 4, "text": "bad_",
 *                 "reason": "invalid-domain-shape"}],
 *   "artifacts": {
 *     "masterList": {"path": "...", "sha256": "...", "bytes": 123},
 *     "filterList": {"path": "...", "sha256": "...", "bytes": 456}
 *   }
 * }
 * @endcode
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <json/json.h>
#include "guardrails/blocklist/canonical_writer.h"
#include "guardrails/blocklist/types.h"

namespace guardrails::report {

/**
 * @brief Build the report document
 *
 * @param result Aggregation result
 * @param artifacts Rendered artifact contents (hashed as-is)
 * @param targets Artifact paths recorded in the report
 * @param generatedAt Same generation time as the filter list header
 * @return JSON document
 */
Json::Value buildReport(const blocklist::BuildResult& result,
                        const blocklist::RenderedArtifacts& artifacts,
                        const blocklist::ArtifactTargets& targets,
                        const std::chrono::system_clock::time_point& generatedAt);

/**
 * @brief Serialize a report (two-space indentation, trailing newline)
 */
std::string toJsonString(const Json::Value& report);

/**
 * @brief Write the report, replacing an existing file
 * @throws common::OutputException on filesystem failure
 */
void writeReport(const std::filesystem::path& path, const Json::Value& report);

} // namespace guardrails::report
