/**
 * @file line_normalizer.cpp
 * @brief Line normalization implementation
 */

#include "guardrails/blocklist/line_normalizer.h"
#include "guardrails/utils/string_utils.h"
#include <cctype>

namespace guardrails::blocklist {

namespace {

const char* const HTTPS_PREFIX = "https://";
const char* const HTTP_PREFIX = "http://";
const char* const WILDCARD_PREFIX = "*.";

const char* const RULE_OPEN = "||";
const char RULE_CLOSE = '^';
const char RULE_OPTIONS = '$';

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isRuleDomainChar(char c) {
    return !isSpace(c) && c != '|' && c != RULE_CLOSE && c != RULE_OPTIONS;
}

} // namespace

std::optional<std::string> normalizeLine(const std::string& line) {
    std::string stripped = utils::trim(line);
    if (stripped.empty() || stripped[0] == '#') {
        return std::nullopt;
    }

    // Inline comment
    size_t hash = stripped.find('#');
    if (hash != std::string::npos) {
        stripped = utils::trim(stripped.substr(0, hash));
        if (stripped.empty()) {
            return std::nullopt;
        }
    }

    if (auto ruleDomain = extractRuleDomain(stripped)) {
        return normalizeCandidate(*ruleDomain);
    }

    // Anything else is a plain domain candidate; the validator decides
    return normalizeCandidate(stripped);
}

std::optional<std::string> normalizeCandidate(const std::string& value) {
    std::string d = utils::toLower(utils::trim(value));

    if (utils::startsWith(d, HTTPS_PREFIX)) {
        d.erase(0, std::char_traits<char>::length(HTTPS_PREFIX));
    } else if (utils::startsWith(d, HTTP_PREFIX)) {
        d.erase(0, std::char_traits<char>::length(HTTP_PREFIX));
    }

    // One wildcard label only: "*.*.a.com" keeps its second marker
    if (utils::startsWith(d, WILDCARD_PREFIX)) {
        d.erase(0, 2);
    }

    size_t slash = d.find('/');
    if (slash != std::string::npos) {
        d = utils::trim(d.substr(0, slash));
    }

    if (!d.empty() && d.back() == '.') {
        d.pop_back();
    }

    if (d.empty()) {
        return std::nullopt;
    }
    return d;
}

std::optional<std::string> extractRuleDomain(const std::string& line) {
    size_t pos = 0;
    while (pos < line.size() && isSpace(line[pos])) {
        pos++;
    }
    if (line.compare(pos, 2, RULE_OPEN) != 0) {
        return std::nullopt;
    }
    pos += 2;

    size_t begin = pos;
    while (pos < line.size() && isRuleDomainChar(line[pos])) {
        pos++;
    }
    if (pos == begin || pos >= line.size() || line[pos] != RULE_CLOSE) {
        return std::nullopt;
    }
    size_t end = pos++;

    // Tail: whitespace, then nothing or "$<options>"
    while (pos < line.size() && isSpace(line[pos])) {
        pos++;
    }
    if (pos < line.size() && line[pos] != RULE_OPTIONS) {
        return std::nullopt;
    }

    return line.substr(begin, end - begin);
}

} // namespace guardrails::blocklist
