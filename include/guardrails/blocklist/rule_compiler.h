/**
 * @file rule_compiler.h
 * @brief Canonical domain -> AdGuard DNS filter rule
 *
 * Rule format (one per domain):
 *   ||example.com^$dnstype=AAAA,dnsrewrite=NOERROR
 * "||domain^" also matches every subdomain, so wildcard inputs collapse onto
 * their parent domain. The AAAA query type is answered with an empty
 * NOERROR response, suppressing IPv6 for the domain.
 */

#pragma once

#include <string>
#include <vector>

namespace guardrails::blocklist {

/// @brief Rule prefix preceding the domain
constexpr const char* RULE_PREFIX = "||";

/// @brief Rule suffix following the domain
constexpr const char* RULE_SUFFIX = "^$dnstype=AAAA,dnsrewrite=NOERROR";

/**
 * @brief Build the filter rule for one canonical domain
 *
 * No escaping: canonical domains only contain validated characters.
 */
std::string compileRule(const std::string& domain);

/**
 * @brief Build filter rules for a list of canonical domains
 *
 * @param domains Canonical domains (order is preserved)
 * @return One rule per domain, same order
 */
std::vector<std::string> compileRules(const std::vector<std::string>& domains);

} // namespace guardrails::blocklist
