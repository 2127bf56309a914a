/**
 * @file filesystem_source_provider.cpp
 * @brief Filesystem source discovery implementation
 */

#include "guardrails/source/filesystem_source_provider.h"
#include "guardrails/common/exceptions.h"
#include "guardrails/utils/string_utils.h"

#include <fstream>
#include <map>
#include <sstream>
#include <system_error>
#include <utility>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace guardrails::source {

namespace {

std::string describePaths(const std::vector<fs::path>& paths) {
    std::vector<std::string> names;
    for (const auto& p : paths) {
        names.push_back(p.string());
    }
    return utils::join(names, ", ");
}

} // namespace

FilesystemSourceProvider::FilesystemSourceProvider(FilesystemSourceOptions options)
    : options_(std::move(options))
{
    if (options_.baseDir.empty()) {
        options_.baseDir = fs::current_path();
    }
}

std::string FilesystemSourceProvider::identify(const fs::path& path) const {
    fs::path absolute = fs::absolute(path).lexically_normal();
    fs::path base = fs::absolute(options_.baseDir).lexically_normal();

    fs::path relative = absolute.lexically_relative(base);
    if (relative.empty() || *relative.begin() == "..") {
        return absolute.generic_string();
    }
    return relative.generic_string();
}

void FilesystemSourceProvider::collectDirectory(const fs::path& dir,
                                                std::vector<fs::path>& files) const {
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, ec);
    if (ec) {
        throw common::SourceException("Cannot read source directory: " + dir.string() +
                                      " (" + ec.message() + ")");
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            throw common::SourceException("Cannot read source directory: " + dir.string() +
                                          " (" + ec.message() + ")");
        }
        const fs::directory_entry& entry = *it;
        if (entry.is_regular_file() && entry.path().extension() == options_.extension) {
            files.push_back(entry.path());
        }
    }
}

std::vector<DiscoveredSource> FilesystemSourceProvider::discover() const {
    std::vector<fs::path> files;
    std::vector<fs::path> missing;

    for (const auto& path : options_.paths) {
        std::error_code ec;
        fs::file_status status = fs::status(path, ec);

        if (!fs::exists(status)) {
            missing.push_back(path);
        } else if (fs::is_directory(status)) {
            collectDirectory(path, files);
        } else if (fs::is_regular_file(status)) {
            files.push_back(path);
        } else {
            throw common::SourceException("Source path is not a directory or file: " + path.string());
        }
    }

    if (!missing.empty()) {
        bool nothingDeclaredExists = missing.size() == options_.paths.size();
        if (nothingDeclaredExists && !options_.fallbackFile.empty() &&
            fs::is_regular_file(options_.fallbackFile)) {
            spdlog::info("Source not found ({}), using fallback file {}",
                         describePaths(missing), options_.fallbackFile.string());
            files.push_back(options_.fallbackFile);
        } else {
            throw common::SourceException("Source not found: " + describePaths(missing));
        }
    }

    // Deduplicate and order by identifier
    std::map<std::string, fs::path> byId;
    for (const auto& file : files) {
        byId.emplace(identify(file), file);
    }

    if (byId.empty()) {
        throw common::SourceException("No " + options_.extension + " files found under: " +
                                      describePaths(options_.paths));
    }

    std::vector<DiscoveredSource> discovered;
    discovered.reserve(byId.size());
    for (auto& entry : byId) {
        spdlog::debug("Discovered source: {}", entry.first);
        discovered.push_back({entry.first, entry.second});
    }
    return discovered;
}

std::vector<blocklist::SourceText> FilesystemSourceProvider::loadSources() {
    std::vector<blocklist::SourceText> sources;
    for (const auto& file : discover()) {
        blocklist::SourceText source;
        source.id = file.id;
        source.text = readFile(file.path);
        spdlog::debug("Read source {} ({} bytes)", source.id, source.text.size());
        sources.push_back(std::move(source));
    }
    spdlog::info("Loaded {} source file(s)", sources.size());
    return sources;
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw common::SourceException("Cannot read source: " + path.string());
    }

    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        throw common::SourceException("Failed to read source: " + path.string());
    }
    return content.str();
}

} // namespace guardrails::source
