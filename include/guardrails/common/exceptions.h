/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Fatal conditions only. Malformed input lines are never thrown; they are
 * collected as blocklist::Warning records.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace guardrails {
namespace common {

/**
 * @brief Base exception for all Domain Guardrails exceptions
 */
class GuardrailsException : public std::runtime_error {
public:
    explicit GuardrailsException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Input source missing, unreadable or not discoverable
 */
class SourceException : public GuardrailsException {
public:
    explicit SourceException(const std::string& message)
        : GuardrailsException(message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public GuardrailsException {
public:
    explicit ConfigException(const std::string& message)
        : GuardrailsException("Configuration error: " + message) {}
};

/**
 * @brief Artifact or report could not be written
 */
class OutputException : public GuardrailsException {
public:
    explicit OutputException(const std::string& message)
        : GuardrailsException("Output error: " + message) {}
};

} // namespace common
} // namespace guardrails
