/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Key/value configuration for the build tool. Values are seeded from
 * environment variables and then overridden by command-line options.
 * The blocklist core never reads this object; the tool translates it into
 * explicit parameters.
 */

#pragma once

#include <string>
#include <vector>
#include <map>

namespace guardrails {
namespace common {

/**
 * @brief Configuration Manager
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    std::vector<std::string> sources_;

public:
    ConfigManager() = default;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found or empty
     * @return Configuration value
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get boolean configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found or unparseable
     * @return Configuration value
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Set configuration value
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Declared source paths, in declaration order
     *
     * Command-line --source options replace the environment list as a whole.
     * Falls back to DEFAULT_SOURCE when nothing was declared.
     */
    std::vector<std::string> getSources() const;

    /**
     * @brief Load configuration from environment
     */
    void loadFromEnvironment();

    /**
     * @brief Apply command-line arguments (without argv[0])
     *
     * @return false if --help was requested, true otherwise
     * @throws ConfigException on unknown option or missing option value
     */
    bool applyArguments(const std::vector<std::string>& args);

    /**
     * @brief Usage text for --help and configuration errors
     */
    static std::string usage(const std::string& program);

    /// @name Predefined Configuration Keys

    // Inputs
    static constexpr const char* SOURCE = "GUARDRAILS_SOURCE";
    static constexpr const char* FALLBACK_SOURCE = "GUARDRAILS_FALLBACK_SOURCE";
    static constexpr const char* BASE_DIR = "GUARDRAILS_BASE_DIR";

    // Outputs
    static constexpr const char* FILTER_OUTPUT = "GUARDRAILS_FILTER_OUTPUT";
    static constexpr const char* MASTER_OUTPUT = "GUARDRAILS_MASTER_OUTPUT";
    static constexpr const char* REPORT_OUTPUT = "GUARDRAILS_REPORT_OUTPUT";
    static constexpr const char* TITLE = "GUARDRAILS_TITLE";
    static constexpr const char* DESCRIPTION = "GUARDRAILS_DESCRIPTION";

    // Tool
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "GUARDRAILS_LOG_FILE";
    static constexpr const char* QUIET = "GUARDRAILS_QUIET";

    /// @name Defaults
    static constexpr const char* DEFAULT_SOURCE = "source";
    static constexpr const char* DEFAULT_FILTER_OUTPUT = "generated/adguard-ipv6-blocklist.txt";
    static constexpr const char* DEFAULT_MASTER_OUTPUT = "generated/domains.txt";
};

} // namespace common
} // namespace guardrails
