/**
 * @file rule_compiler.cpp
 * @brief Filter rule generation
 */

#include "guardrails/blocklist/rule_compiler.h"

namespace guardrails::blocklist {

std::string compileRule(const std::string& domain) {
    return std::string(RULE_PREFIX) + domain + RULE_SUFFIX;
}

std::vector<std::string> compileRules(const std::vector<std::string>& domains) {
    std::vector<std::string> rules;
    rules.reserve(domains.size());
    for (const auto& domain : domains) {
        rules.push_back(compileRule(domain));
    }
    return rules;
}

} // namespace guardrails::blocklist
