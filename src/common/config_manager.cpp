/**
 * @file config_manager.cpp
 * @brief Implementation of Configuration Manager
 */

#include "guardrails/common/config_manager.h"
#include "guardrails/common/exceptions.h"
#include "guardrails/utils/string_utils.h"
#include <cstdlib>
#include <sstream>
#include <spdlog/spdlog.h>

namespace guardrails {
namespace common {

namespace {

// Command-line option -> configuration key
const std::map<std::string, const char*>& valueOptions() {
    static const std::map<std::string, const char*> options = {
        {"--fallback", ConfigManager::FALLBACK_SOURCE},
        {"--base-dir", ConfigManager::BASE_DIR},
        {"--output", ConfigManager::FILTER_OUTPUT},
        {"--master", ConfigManager::MASTER_OUTPUT},
        {"--report", ConfigManager::REPORT_OUTPUT},
        {"--title", ConfigManager::TITLE},
        {"--description", ConfigManager::DESCRIPTION},
        {"--log-level", ConfigManager::LOG_LEVEL},
        {"--log-file", ConfigManager::LOG_FILE},
    };
    return options;
}

std::vector<std::string> splitPathList(const std::string& value) {
    std::vector<std::string> paths;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ':')) {
        item = utils::trim(item);
        if (!item.empty()) {
            paths.push_back(item);
        }
    }
    return paths;
}

} // namespace

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    auto it = config_.find(key);
    if (it != config_.end() && !it->second.empty()) {
        return it->second;
    }
    return defaultValue;
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    std::string lowerValue = utils::toLower(value);

    if (lowerValue == "true" || lowerValue == "1" || lowerValue == "yes" || lowerValue == "on") {
        return true;
    } else if (lowerValue == "false" || lowerValue == "0" || lowerValue == "no" || lowerValue == "off") {
        return false;
    }

    spdlog::warn("Invalid boolean config '{}': {} (using default: {})",
                 key, value, defaultValue);
    return defaultValue;
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    config_[key] = value;
    if (key == SOURCE) {
        sources_ = splitPathList(value);
    }
}

std::vector<std::string> ConfigManager::getSources() const {
    if (sources_.empty()) {
        return {DEFAULT_SOURCE};
    }
    return sources_;
}

void ConfigManager::loadFromEnvironment() {
    static const char* keys[] = {
        SOURCE, FALLBACK_SOURCE, BASE_DIR,
        FILTER_OUTPUT, MASTER_OUTPUT, REPORT_OUTPUT, TITLE, DESCRIPTION,
        LOG_LEVEL, LOG_FILE, QUIET,
    };

    for (const char* key : keys) {
        if (const char* env = std::getenv(key)) {
            set(key, env);
        }
    }
}

bool ConfigManager::applyArguments(const std::vector<std::string>& args) {
    std::vector<std::string> cliSources;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (arg == "--quiet" || arg == "-q") {
            set(QUIET, "true");
            continue;
        }

        bool isSource = arg == "--source" || arg == "-s";
        auto option = valueOptions().find(arg);
        if (!isSource && option == valueOptions().end()) {
            throw ConfigException("unknown option '" + arg + "'");
        }
        if (i + 1 >= args.size()) {
            throw ConfigException("option '" + arg + "' requires a value");
        }

        const std::string& value = args[++i];
        if (isSource) {
            cliSources.push_back(value);
        } else {
            set(option->second, value);
        }
    }

    if (!cliSources.empty()) {
        config_[SOURCE] = utils::join(cliSources, ":");
        sources_ = cliSources;
    }
    return true;
}

std::string ConfigManager::usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  -s, --source PATH       Source directory (*.txt, recursive) or file; repeatable\n"
        << "                          (default: " << DEFAULT_SOURCE << ")\n"
        << "      --fallback PATH     Single file used when no source directory exists\n"
        << "      --base-dir PATH     Directory source identifiers are relative to (default: .)\n"
        << "      --output PATH       Filter list output (default: " << DEFAULT_FILTER_OUTPUT << ")\n"
        << "      --master PATH       Master domain list output (default: " << DEFAULT_MASTER_OUTPUT << ")\n"
        << "      --report PATH       Write a JSON build report\n"
        << "      --title TEXT        Filter list title\n"
        << "      --description TEXT  Filter list description\n"
        << "      --log-level LEVEL   trace, debug, info, warn, error, critical, off (default: info)\n"
        << "      --log-file PATH     Also log to a rotating file\n"
        << "  -q, --quiet             Do not print the summary\n"
        << "  -h, --help              Show this help\n";
    return out.str();
}

} // namespace common
} // namespace guardrails
