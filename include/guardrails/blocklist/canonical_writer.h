/**
 * @file canonical_writer.h
 * @brief Renders the master domain list and the filter list
 *
 * Rendering is pure and deterministic: identical BuildResults produce
 * byte-identical artifacts, except for the generation timestamp embedded in
 * the filter list header, which is passed in by the caller.
 *
 * Writing replaces whole files. Both artifacts are staged as temporary files
 * before either target is replaced. The two final renames are the only
 * non-atomic step: if the second one fails, the master list is already new.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "types.h"

namespace guardrails::blocklist {

/// @brief Header text of the filter list
struct WriterOptions {
    std::string title = "Domain Guardrails - IPv6 (AAAA) Suppression List";
    std::string description = "Generated from ./source/*.txt (combined, deduped, sorted)";
};

/// @brief Fully rendered artifact contents
struct RenderedArtifacts {
    std::string masterList;
    std::string filterList;
};

/// @brief Output locations of one run
struct ArtifactTargets {
    std::filesystem::path masterList;
    std::filesystem::path filterList;
};

/**
 * @brief Canonical artifact writer
 *
 * Usage:
 * @code
 *   CanonicalWriter writer;
 *   auto artifacts = writer.render(result, utils::now());
 *   CanonicalWriter::write(artifacts, {"generated/domains.txt",
 *                                      "generated/adguard-ipv6-blocklist.txt"});
 * @endcode
 */
class CanonicalWriter {
public:
    CanonicalWriter() = default;
    explicit CanonicalWriter(WriterOptions options);

    /**
     * @brief Render the master domain list
     *
     * "#" comment header followed by one canonical domain per line,
     * terminated by a newline.
     */
    std::string renderMasterList(const BuildResult& result) const;

    /**
     * @brief Render the filter list
     *
     * "!" comment header (title, description, generation time, provenance,
     * format documentation) followed by one rule per domain, terminated by
     * a newline.
     *
     * @param result Aggregation result (domains and source identifiers)
     * @param generatedAt Generation time, printed as UTC ISO 8601 seconds
     */
    std::string renderFilterList(const BuildResult& result,
                                 const std::chrono::system_clock::time_point& generatedAt) const;

    /**
     * @brief Render both artifacts
     */
    RenderedArtifacts render(const BuildResult& result,
                             const std::chrono::system_clock::time_point& generatedAt) const;

    /**
     * @brief Write both artifacts, replacing existing files
     *
     * Creates parent directories, stages each artifact next to its target
     * and renames both into place once both are staged.
     *
     * @throws common::OutputException if both targets name the same file, or
     *         on any filesystem failure
     */
    static void write(const RenderedArtifacts& artifacts, const ArtifactTargets& targets);

    const WriterOptions& options() const { return options_; }

private:
    WriterOptions options_;
};

/**
 * @brief Write one file atomically (stage + rename)
 *
 * @throws common::OutputException on any filesystem failure
 */
void writeFileReplacing(const std::filesystem::path& target, const std::string& content);

} // namespace guardrails::blocklist
