/**
 * @file domain_validator.cpp
 * @brief Domain shape check implementation
 */

#include "guardrails/blocklist/domain_validator.h"
#include "guardrails/utils/string_utils.h"

namespace guardrails::blocklist {

namespace {

bool isAsciiAlpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isValidInnerLabel(const std::string& domain, size_t begin, size_t end) {
    size_t length = end - begin;
    if (length == 0 || length > MAX_LABEL_LENGTH) return false;
    if (domain[begin] == '-') return false;

    for (size_t i = begin; i < end; ++i) {
        char c = domain[i];
        if (!isAsciiAlpha(c) && !isAsciiDigit(c) && c != '-') return false;
    }
    return true;
}

bool isValidTopLevelLabel(const std::string& domain, size_t begin, size_t end) {
    if (end - begin < 2) return false;

    for (size_t i = begin; i < end; ++i) {
        if (!isAsciiAlpha(domain[i])) return false;
    }
    return true;
}

} // namespace

bool isValidDomain(const std::string& candidate) {
    // Punycode labels are not checked further
    if (utils::toLower(candidate).find(ACE_MARKER) != std::string::npos) {
        return true;
    }

    if (candidate.empty() || candidate.size() > MAX_DOMAIN_LENGTH) {
        return false;
    }

    size_t lastDot = candidate.rfind('.');
    if (lastDot == std::string::npos) {
        return false;
    }

    size_t begin = 0;
    while (begin <= lastDot) {
        size_t dot = candidate.find('.', begin);
        if (!isValidInnerLabel(candidate, begin, dot)) {
            return false;
        }
        begin = dot + 1;
    }

    return isValidTopLevelLabel(candidate, lastDot + 1, candidate.size());
}

} // namespace guardrails::blocklist
