/**
 * @file aggregator.cpp
 * @brief Domain aggregation implementation
 */

#include "guardrails/blocklist/aggregator.h"
#include "guardrails/blocklist/domain_validator.h"
#include "guardrails/blocklist/line_normalizer.h"
#include "guardrails/utils/string_utils.h"

namespace guardrails::blocklist {

void Aggregator::addSource(const SourceText& source) {
    sources_.push_back(source.id);

    std::vector<std::string> lines = utils::splitLines(source.text);
    linesSeen_ += lines.size();

    for (size_t i = 0; i < lines.size(); i++) {
        std::optional<std::string> candidate = normalizeLine(lines[i]);
        if (!candidate) {
            continue;
        }

        if (!isValidDomain(*candidate)) {
            Warning warning;
            warning.source = source.id;
            warning.line = i + 1;
            warning.text = *candidate;
            warning.reason = WarningReason::INVALID_DOMAIN_SHAPE;
            warnings_.push_back(std::move(warning));
            continue;
        }

        domains_.insert(std::move(*candidate));
    }
}

BuildResult Aggregator::finish() {
    BuildResult result;
    // std::set iterates in byte order
    result.domains.assign(domains_.begin(), domains_.end());
    result.warnings = std::move(warnings_);
    result.sources = std::move(sources_);
    result.linesSeen = linesSeen_;

    domains_.clear();
    warnings_.clear();
    sources_.clear();
    linesSeen_ = 0;

    return result;
}

BuildResult aggregate(const std::vector<SourceText>& sources) {
    Aggregator aggregator;
    for (const auto& source : sources) {
        aggregator.addSource(source);
    }
    return aggregator.finish();
}

} // namespace guardrails::blocklist
