/**
 * @file filesystem_source_provider.h
 * @brief Discovers domain list files on disk
 *
 * Declared paths may be directories (walked recursively for "*.txt") or
 * individual files (required). Discovered files are deduplicated and sorted
 * by identifier so processing order never depends on directory iteration
 * order.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "guardrails/blocklist/providers.h"

namespace guardrails::source {

/// @brief Discovery settings
struct FilesystemSourceOptions {
    std::vector<std::filesystem::path> paths;   ///< Declared directories or files
    std::filesystem::path fallbackFile;         ///< Used only when no declared path exists
    std::filesystem::path baseDir;              ///< Identifiers are relative to this (default: cwd)
    std::string extension = ".txt";             ///< File extension collected from directories
};

/// @brief A discovered file and its identifier
struct DiscoveredSource {
    std::string id;
    std::filesystem::path path;
};

/**
 * @brief Filesystem-backed ISourceProvider
 */
class FilesystemSourceProvider : public blocklist::ISourceProvider {
public:
    explicit FilesystemSourceProvider(FilesystemSourceOptions options);

    /**
     * @brief Find every input file without reading it
     *
     * @return Files sorted by identifier (never empty)
     * @throws common::SourceException if a declared path is missing or of
     *         the wrong type, or if no file is found
     */
    std::vector<DiscoveredSource> discover() const;

    /**
     * @brief Discover and read every input file
     * @throws common::SourceException as discover(), or if a file cannot be read
     */
    std::vector<blocklist::SourceText> loadSources() override;

    /**
     * @brief Identifier of a path: relative to the base directory with '/'
     *        separators, or the absolute path when outside the base directory
     */
    std::string identify(const std::filesystem::path& path) const;

private:
    FilesystemSourceOptions options_;

    void collectDirectory(const std::filesystem::path& dir,
                          std::vector<std::filesystem::path>& files) const;
};

/**
 * @brief Read a whole file as bytes
 * @throws common::SourceException if the file cannot be opened or read
 */
std::string readFile(const std::filesystem::path& path);

} // namespace guardrails::source
