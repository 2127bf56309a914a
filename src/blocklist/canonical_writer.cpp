/**
 * @file canonical_writer.cpp
 * @brief Artifact rendering and writing
 */

#include "guardrails/blocklist/canonical_writer.h"
#include "guardrails/blocklist/rule_compiler.h"
#include "guardrails/common/exceptions.h"
#include "guardrails/utils/time_utils.h"

#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace guardrails::blocklist {

namespace {

const char* const MASTER_HEADER[] = {
    "# Domain Guardrails - Master Domain List",
    "# This file is generated automatically. Do not edit it by hand.",
    "# One domain per line (lowercase, deduplicated, sorted).",
    "#",
};

std::string renderLines(const std::vector<std::string>& header,
                        const std::vector<std::string>& body) {
    std::string out;
    for (const auto& line : header) {
        out += line;
        out += '\n';
    }
    for (const auto& line : body) {
        out += line;
        out += '\n';
    }
    return out;
}

fs::path stagingPath(const fs::path& target) {
    fs::path staged = target;
    staged += ".tmp";
    return staged;
}

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::debug("Could not remove staged file {}: {}", path.string(), ec.message());
    }
}

fs::path stage(const fs::path& target, const std::string& content) {
    if (target.empty()) {
        throw common::OutputException("empty output path");
    }

    std::error_code ec;
    fs::path parent = target.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw common::OutputException("cannot create directory '" + parent.string() +
                                          "': " + ec.message());
        }
    }

    fs::path staged = stagingPath(target);
    std::ofstream out(staged, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw common::OutputException("cannot open '" + staged.string() + "' for writing");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        removeQuietly(staged);
        throw common::OutputException("failed to write '" + staged.string() + "'");
    }
    return staged;
}

void commit(const fs::path& staged, const fs::path& target) {
    std::error_code ec;
    fs::rename(staged, target, ec);
    if (ec) {
        removeQuietly(staged);
        throw common::OutputException("cannot replace '" + target.string() + "': " + ec.message());
    }
}

} // namespace

CanonicalWriter::CanonicalWriter(WriterOptions options)
    : options_(std::move(options))
{
}

std::string CanonicalWriter::renderMasterList(const BuildResult& result) const {
    std::vector<std::string> header(std::begin(MASTER_HEADER), std::end(MASTER_HEADER));
    return renderLines(header, result.domains);
}

std::string CanonicalWriter::renderFilterList(
    const BuildResult& result,
    const std::chrono::system_clock::time_point& generatedAt) const
{
    std::vector<std::string> header;
    header.push_back("! Title: " + options_.title);
    header.push_back("! Description: " + options_.description);
    header.push_back("! Generated: " + utils::formatIso8601(generatedAt));
    header.push_back("!");
    header.push_back("! Inputs:");
    for (const auto& source : result.sources) {
        header.push_back("!   - " + source);
    }
    header.push_back("!");
    header.push_back(std::string("! Format: ") + RULE_PREFIX + "domain" + RULE_SUFFIX);

    return renderLines(header, compileRules(result.domains));
}

RenderedArtifacts CanonicalWriter::render(
    const BuildResult& result,
    const std::chrono::system_clock::time_point& generatedAt) const
{
    RenderedArtifacts artifacts;
    artifacts.masterList = renderMasterList(result);
    artifacts.filterList = renderFilterList(result, generatedAt);
    return artifacts;
}

void CanonicalWriter::write(const RenderedArtifacts& artifacts, const ArtifactTargets& targets) {
    if (!targets.masterList.empty() &&
        fs::absolute(targets.masterList).lexically_normal() ==
            fs::absolute(targets.filterList).lexically_normal()) {
        throw common::OutputException("master list and filter list share the path '" +
                                      targets.masterList.string() + "'");
    }

    fs::path stagedMaster = stage(targets.masterList, artifacts.masterList);

    fs::path stagedFilter;
    try {
        stagedFilter = stage(targets.filterList, artifacts.filterList);
    } catch (const common::OutputException&) {
        removeQuietly(stagedMaster);
        throw;
    }

    try {
        commit(stagedMaster, targets.masterList);
    } catch (const common::OutputException&) {
        removeQuietly(stagedFilter);
        throw;
    }
    try {
        commit(stagedFilter, targets.filterList);
    } catch (const common::OutputException& e) {
        spdlog::error("Master list {} was replaced but the filter list was not: {}",
                      targets.masterList.string(), e.what());
        throw;
    }

    spdlog::info("Wrote master list: {} ({} bytes)",
                 targets.masterList.string(), artifacts.masterList.size());
    spdlog::info("Wrote filter list: {} ({} bytes)",
                 targets.filterList.string(), artifacts.filterList.size());
}

void writeFileReplacing(const fs::path& target, const std::string& content) {
    commit(stage(target, content), target);
}

} // namespace guardrails::blocklist
