/**
 * @file build_blocklist.cpp
 * @brief Build the master domain list and the AdGuard IPv6 (AAAA) suppression list
 *
 * Reads every *.txt file under the source directories, normalizes,
 * validates, deduplicates and sorts the domains, then writes:
 *   - the master domain list (one domain per line)
 *   - the filter list (||domain^$dnstype=AAAA,dnsrewrite=NOERROR)
 *   - optionally a JSON build report
 *
 * Usage:
 *   ./build_blocklist [--source DIR]... [--output FILE] [--master FILE] [--report FILE]
 *
 * Exit status: 0 on success (invalid lines are warnings), 1 on any fatal error.
 */

#include <iostream>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

#include "guardrails/blocklist/aggregator.h"
#include "guardrails/blocklist/canonical_writer.h"
#include "guardrails/common/config_manager.h"
#include "guardrails/common/exceptions.h"
#include "guardrails/common/logger.h"
#include "guardrails/report/build_report.h"
#include "guardrails/source/filesystem_source_provider.h"
#include "guardrails/utils/string_utils.h"
#include "guardrails/utils/time_utils.h"

using namespace guardrails;
using common::ConfigManager;

namespace {

void printSummary(const ConfigManager& config,
                  const blocklist::BuildResult& result,
                  const blocklist::ArtifactTargets& targets) {
    std::cout << "Source paths      : " << utils::join(config.getSources(), ", ") << "\n";
    std::cout << "Source files      : " << result.sources.size() << "\n";
    std::cout << "Lines read        : " << result.linesSeen << "\n";
    std::cout << "Unique domains    : " << result.domains.size() << "\n";
    std::cout << "Master list       : " << targets.masterList.string() << "\n";
    std::cout << "Output            : " << targets.filterList.string() << "\n";

    std::string report = config.getString(ConfigManager::REPORT_OUTPUT);
    if (!report.empty()) {
        std::cout << "Report            : " << report << "\n";
    }

    if (!result.warnings.empty()) {
        std::cout << "\nWarnings:\n";
        for (const auto& w : result.warnings) {
            std::cout << " - " << blocklist::warningToString(w) << "\n";
        }
    }
    std::cout.flush();
}

int run(const ConfigManager& config) {
    // Discover and read sources (fatal before anything is written)
    source::FilesystemSourceOptions sourceOptions;
    for (const auto& path : config.getSources()) {
        sourceOptions.paths.emplace_back(path);
    }
    sourceOptions.fallbackFile = config.getString(ConfigManager::FALLBACK_SOURCE);
    sourceOptions.baseDir = config.getString(ConfigManager::BASE_DIR);

    source::FilesystemSourceProvider provider(sourceOptions);

    blocklist::Aggregator aggregator;
    for (const auto& input : provider.loadSources()) {
        aggregator.addSource(input);
    }
    blocklist::BuildResult result = aggregator.finish();
    spdlog::info("Aggregated {} unique domain(s) from {} line(s), {} warning(s)",
                 result.domains.size(), result.linesSeen, result.warnings.size());

    // Render both artifacts in memory, then replace the files
    blocklist::WriterOptions writerOptions;
    writerOptions.title = config.getString(ConfigManager::TITLE, writerOptions.title);
    writerOptions.description = config.getString(ConfigManager::DESCRIPTION, writerOptions.description);

    blocklist::ArtifactTargets targets;
    targets.masterList = config.getString(ConfigManager::MASTER_OUTPUT,
                                          ConfigManager::DEFAULT_MASTER_OUTPUT);
    targets.filterList = config.getString(ConfigManager::FILTER_OUTPUT,
                                          ConfigManager::DEFAULT_FILTER_OUTPUT);

    auto generatedAt = utils::now();
    blocklist::CanonicalWriter writer(writerOptions);
    blocklist::RenderedArtifacts artifacts = writer.render(result, generatedAt);
    blocklist::CanonicalWriter::write(artifacts, targets);

    std::string reportPath = config.getString(ConfigManager::REPORT_OUTPUT);
    if (!reportPath.empty()) {
        report::writeReport(reportPath, report::buildReport(result, artifacts, targets, generatedAt));
    }

    if (!result.warnings.empty()) {
        spdlog::warn("Skipped {} invalid line(s)", result.warnings.size());
    }

    if (config.getBool(ConfigManager::QUIET, false)) {
        for (const auto& w : result.warnings) {
            spdlog::warn("{}", blocklist::warningToString(w));
        }
    } else {
        printSummary(config, result, targets);
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    ConfigManager config;
    config.loadFromEnvironment();

    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        if (!config.applyArguments(args)) {
            std::cout << ConfigManager::usage(argv[0]);
            return 0;
        }

        std::string level = config.getString(ConfigManager::LOG_LEVEL, "info");
        if (!common::Logger::isKnownLevel(level)) {
            throw common::ConfigException("unknown log level '" + level + "'");
        }
    } catch (const common::ConfigException& e) {
        std::cerr << "ERROR: " << e.what() << "\n\n" << ConfigManager::usage(argv[0]);
        return 1;
    }

    std::string logFile = config.getString(ConfigManager::LOG_FILE);
    common::Logger::initialize("build-blocklist",
                               config.getString(ConfigManager::LOG_LEVEL, "info"),
                               !logFile.empty(), logFile);

    int status = 1;
    try {
        status = run(config);
    } catch (const common::GuardrailsException& e) {
        spdlog::debug("Build failed: {}", e.what());
        std::cerr << "ERROR: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        spdlog::debug("Build failed with unexpected error: {}", e.what());
        std::cerr << "ERROR: " << e.what() << std::endl;
    }

    common::Logger::flush();
    return status;
}
