/**
 * @file build_report.cpp
 * @brief Build report implementation
 */

#include "guardrails/report/build_report.h"
#include "guardrails/utils/hash_utils.h"
#include "guardrails/utils/time_utils.h"

#include <spdlog/spdlog.h>

namespace guardrails::report {

namespace {

Json::Value artifactEntry(const std::filesystem::path& path, const std::string& content) {
    Json::Value entry;
    entry["path"] = path.generic_string();
    entry["sha256"] = utils::sha256Hex(content);
    entry["bytes"] = static_cast<Json::UInt64>(content.size());
    return entry;
}

} // namespace

Json::Value buildReport(const blocklist::BuildResult& result,
                        const blocklist::RenderedArtifacts& artifacts,
                        const blocklist::ArtifactTargets& targets,
                        const std::chrono::system_clock::time_point& generatedAt) {
    Json::Value report;
    report["generatedAt"] = utils::formatIso8601(generatedAt);

    Json::Value sources(Json::arrayValue);
    for (const auto& source : result.sources) {
        sources.append(source);
    }
    report["sources"] = sources;

    report["linesSeen"] = static_cast<Json::UInt64>(result.linesSeen);
    report["uniqueDomains"] = static_cast<Json::UInt64>(result.domains.size());
    report["warningCount"] = static_cast<Json::UInt64>(result.warnings.size());

    Json::Value warnings(Json::arrayValue);
    for (const auto& w : result.warnings) {
        Json::Value item;
        item["source"] = w.source;
        item["line"] = static_cast<Json::UInt64>(w.line);
        item["text"] = w.text;
        item["reason"] = blocklist::warningReasonToString(w.reason);
        warnings.append(item);
    }
    report["warnings"] = warnings;

    Json::Value files;
    files["masterList"] = artifactEntry(targets.masterList, artifacts.masterList);
    files["filterList"] = artifactEntry(targets.filterList, artifacts.filterList);
    report["artifacts"] = files;

    return report;
}

std::string toJsonString(const Json::Value& report) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, report) + "\n";
}

void writeReport(const std::filesystem::path& path, const Json::Value& report) {
    std::string content = toJsonString(report);
    blocklist::writeFileReplacing(path, content);
    spdlog::info("Wrote build report: {} ({} bytes)", path.string(), content.size());
}

} // namespace guardrails::report
