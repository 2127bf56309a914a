/**
 * @file test_filesystem_source_provider.cpp
 * @brief Unit tests for FilesystemSourceProvider
 */

#include <gtest/gtest.h>
#include <guardrails/common/exceptions.h>
#include <guardrails/source/filesystem_source_provider.h>
#include "test_helpers.h"

using namespace guardrails::source;
using guardrails::common::SourceException;
using test_helpers::TempDir;
using test_helpers::writeTextFile;

namespace fs = std::filesystem;

class FilesystemSourceProviderTest : public ::testing::Test {
protected:
    FilesystemSourceOptions optionsFor(std::vector<fs::path> paths) const {
        FilesystemSourceOptions options;
        options.paths = std::move(paths);
        options.baseDir = dir_.path();
        return options;
    }

    static std::vector<std::string> ids(const std::vector<DiscoveredSource>& found) {
        std::vector<std::string> out;
        for (const auto& f : found) {
            out.push_back(f.id);
        }
        return out;
    }

    TempDir dir_;
};

// ============================================================================
// Directory discovery
// ============================================================================

TEST_F(FilesystemSourceProviderTest, Directory_RecursiveTxtOnly) {
    writeTextFile(dir_ / "source/b.txt", "b.com\n");
    writeTextFile(dir_ / "source/a.txt", "a.com\n");
    writeTextFile(dir_ / "source/nested/c.txt", "c.com\n");
    writeTextFile(dir_ / "source/README.md", "docs\n");
    writeTextFile(dir_ / "source/list.txt.bak", "old\n");

    FilesystemSourceProvider provider(optionsFor({dir_ / "source"}));
    std::vector<std::string> expected = {"source/a.txt", "source/b.txt", "source/nested/c.txt"};
    EXPECT_EQ(ids(provider.discover()), expected);
}

TEST_F(FilesystemSourceProviderTest, Directory_WithoutTxtFilesThrows) {
    writeTextFile(dir_ / "source/notes.md", "x\n");
    FilesystemSourceProvider provider(optionsFor({dir_ / "source"}));
    EXPECT_THROW(provider.discover(), SourceException);
}

TEST_F(FilesystemSourceProviderTest, MixedPaths_DeduplicatedAndSorted) {
    writeTextFile(dir_ / "source/a.txt", "a.com\n");
    writeTextFile(dir_ / "extra.txt", "e.com\n");

    FilesystemSourceProvider provider(optionsFor({
        dir_ / "source", dir_ / "extra.txt", dir_ / "source/a.txt"}));
    std::vector<std::string> expected = {"extra.txt", "source/a.txt"};
    EXPECT_EQ(ids(provider.discover()), expected);
}

// ============================================================================
// Declared files
// ============================================================================

TEST_F(FilesystemSourceProviderTest, File_AnyExtensionAccepted) {
    writeTextFile(dir_ / "domains.list", "a.com\n");
    FilesystemSourceProvider provider(optionsFor({dir_ / "domains.list"}));
    std::vector<std::string> expected = {"domains.list"};
    EXPECT_EQ(ids(provider.discover()), expected);
}

TEST_F(FilesystemSourceProviderTest, Missing_Throws) {
    writeTextFile(dir_ / "present.txt", "a.com\n");
    FilesystemSourceProvider provider(optionsFor({dir_ / "present.txt", dir_ / "absent.txt"}));
    EXPECT_THROW(provider.discover(), SourceException);
}

// ============================================================================
// Fallback
// ============================================================================

TEST_F(FilesystemSourceProviderTest, Fallback_UsedWhenNothingDeclaredExists) {
    writeTextFile(dir_ / "domains.txt", "a.com\n");
    auto options = optionsFor({dir_ / "source"});
    options.fallbackFile = dir_ / "domains.txt";

    FilesystemSourceProvider provider(options);
    std::vector<std::string> expected = {"domains.txt"};
    EXPECT_EQ(ids(provider.discover()), expected);
}

TEST_F(FilesystemSourceProviderTest, Fallback_IgnoredWhenSourceExists) {
    writeTextFile(dir_ / "source/a.txt", "a.com\n");
    writeTextFile(dir_ / "domains.txt", "b.com\n");
    auto options = optionsFor({dir_ / "source"});
    options.fallbackFile = dir_ / "domains.txt";

    FilesystemSourceProvider provider(options);
    std::vector<std::string> expected = {"source/a.txt"};
    EXPECT_EQ(ids(provider.discover()), expected);
}

TEST_F(FilesystemSourceProviderTest, Fallback_MissingToo_Throws) {
    auto options = optionsFor({dir_ / "source"});
    options.fallbackFile = dir_ / "domains.txt";
    FilesystemSourceProvider provider(options);
    EXPECT_THROW(provider.discover(), SourceException);
}

// ============================================================================
// Identifiers and reading
// ============================================================================

TEST_F(FilesystemSourceProviderTest, Identify_OutsideBaseIsAbsolute) {
    TempDir other;
    FilesystemSourceProvider provider(optionsFor({}));
    fs::path outside = other / "x.txt";
    EXPECT_EQ(provider.identify(outside), fs::absolute(outside).lexically_normal().generic_string());
    EXPECT_EQ(provider.identify(dir_ / "a/./b.txt"), "a/b.txt");
}

TEST_F(FilesystemSourceProviderTest, LoadSources_ReadsContentInIdOrder) {
    writeTextFile(dir_ / "source/b.txt", "b.com\r\n");
    writeTextFile(dir_ / "source/a.txt", "a.com\n# c\n");

    FilesystemSourceProvider provider(optionsFor({dir_ / "source"}));
    auto sources = provider.loadSources();

    ASSERT_EQ(sources.size(), 2u);
    EXPECT_EQ(sources[0].id, "source/a.txt");
    EXPECT_EQ(sources[0].text, "a.com\n# c\n");
    EXPECT_EQ(sources[1].id, "source/b.txt");
    EXPECT_EQ(sources[1].text, "b.com\r\n");
}

TEST_F(FilesystemSourceProviderTest, ReadFile_MissingThrows) {
    EXPECT_THROW(readFile(dir_ / "nope.txt"), SourceException);
}
