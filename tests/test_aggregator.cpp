/**
 * @file test_aggregator.cpp
 * @brief Unit tests for Aggregator
 */

#include <gtest/gtest.h>
#include <guardrails/blocklist/aggregator.h>
#include <algorithm>
#include <vector>

using namespace guardrails::blocklist;

class AggregatorTest : public ::testing::Test {
protected:
    static SourceText source(const std::string& id, const std::string& text) {
        SourceText s;
        s.id = id;
        s.text = text;
        return s;
    }
};

// ============================================================================
// End-to-end
// ============================================================================

TEST_F(AggregatorTest, SingleSource_DomainsAndWarnings) {
    auto result = aggregate({source("s1.txt",
        "# header\n"
        "Foo.com\n"
        "\n"
        "bad_\n"
        "||bar.com^$dnstype=AAAA\n")});

    ASSERT_EQ(result.domains.size(), 2u);
    EXPECT_EQ(result.domains[0], "bar.com");
    EXPECT_EQ(result.domains[1], "foo.com");

    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].source, "s1.txt");
    EXPECT_EQ(result.warnings[0].line, 4u);
    EXPECT_EQ(result.warnings[0].text, "bad_");
    EXPECT_EQ(result.warnings[0].reason, WarningReason::INVALID_DOMAIN_SHAPE);

    EXPECT_EQ(result.linesSeen, 5u);
    ASSERT_EQ(result.sources.size(), 1u);
    EXPECT_EQ(result.sources[0], "s1.txt");
}

TEST_F(AggregatorTest, SingleSource_WildcardAndPathGarbage) {
    auto result = aggregate({source("s1.txt", "foo.com\n*.bar.com\n# note\nBAD_/slash.com\n")});

    std::vector<std::string> expected = {"bar.com", "foo.com"};
    EXPECT_EQ(result.domains, expected);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].text, "bad_");
    EXPECT_EQ(result.warnings[0].line, 4u);
}

TEST_F(AggregatorTest, Duplicates_CollapseWithoutWarning) {
    auto result = aggregate({
        source("a.txt", "a.com\nA.com\na.com.\n"),
        source("b.txt", "*.a.com\nhttps://a.com/x\n||a.com^\n"),
    });

    ASSERT_EQ(result.domains.size(), 1u);
    EXPECT_EQ(result.domains[0], "a.com");
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(result.linesSeen, 6u);
}

TEST_F(AggregatorTest, Empty_NoSources) {
    auto result = aggregate({});
    EXPECT_TRUE(result.domains.empty());
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_TRUE(result.sources.empty());
    EXPECT_EQ(result.linesSeen, 0u);
}

TEST_F(AggregatorTest, Empty_OnlyCommentsAndBlanks) {
    auto result = aggregate({source("c.txt", "# one\n\n   \n# two\n")});
    EXPECT_TRUE(result.domains.empty());
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(result.linesSeen, 4u);
}

// ============================================================================
// Ordering
// ============================================================================

TEST_F(AggregatorTest, Domains_ByteOrderSorted) {
    auto result = aggregate({source("s.txt", "b.com\na-b.com\na.com\n0.com\nab.com\n")});
    std::vector<std::string> expected = {"0.com", "a-b.com", "a.com", "ab.com", "b.com"};
    EXPECT_EQ(result.domains, expected);
}

TEST_F(AggregatorTest, Domains_IndependentOfSourceOrder) {
    std::vector<SourceText> sources = {
        source("a.txt", "zeta.com\nalpha.com\n"),
        source("b.txt", "mid.com\nalpha.com\n"),
        source("c.txt", "xn--80ak6aa92e.com\nbeta.org\n"),
    };

    auto expected = aggregate(sources).domains;

    std::sort(sources.begin(), sources.end(),
              [](const SourceText& x, const SourceText& y) { return x.id < y.id; });
    do {
        EXPECT_EQ(aggregate(sources).domains, expected);
    } while (std::next_permutation(sources.begin(), sources.end(),
             [](const SourceText& x, const SourceText& y) { return x.id < y.id; }));
}

TEST_F(AggregatorTest, Domains_IndependentOfLineOrder) {
    std::vector<std::string> lines = {
        "beta.org", "Alpha.com", "*.alpha.com", "bad_", "||zeta.net^$dnstype=AAAA",
        "https://mid.io/x", "# comment", "xn--e1afmkfd.xn--p1ai",
    };

    auto render = [](const std::vector<std::string>& ordered) {
        std::string text;
        for (const auto& line : ordered) {
            text += line + "\n";
        }
        return text;
    };

    auto expected = aggregate({source("s.txt", render(lines))}).domains;
    ASSERT_EQ(expected.size(), 5u);

    std::sort(lines.begin(), lines.end());
    size_t permutations = 0;
    do {
        EXPECT_EQ(aggregate({source("s.txt", render(lines))}).domains, expected);
    } while (std::next_permutation(lines.begin(), lines.end()) && ++permutations < 5000);
}

TEST_F(AggregatorTest, FilterListInput_PunycodeTldRoundTrips) {
    auto result = aggregate({source("filter.txt",
        "! Title: previous run\n"
        "||xn--e1afmkfd.xn--p1ai^$dnstype=AAAA,dnsrewrite=NOERROR\n"
        "||example.com^$dnstype=AAAA,dnsrewrite=NOERROR\n")});

    // '!' header lines fail validation and only produce warnings
    std::vector<std::string> expected = {"example.com", "xn--e1afmkfd.xn--p1ai"};
    EXPECT_EQ(result.domains, expected);
}

TEST_F(AggregatorTest, VeryLongLine_IsWarningNotFatal) {
    std::string longLine = "||" + std::string(100000, 'a') + ".com^";
    auto result = aggregate({source("big.txt", "ok.com\n" + longLine + "\n")});

    ASSERT_EQ(result.domains.size(), 1u);
    EXPECT_EQ(result.domains[0], "ok.com");
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].line, 2u);
}

TEST_F(AggregatorTest, Warnings_EncounterOrder) {
    auto result = aggregate({
        source("a.txt", "bad_one\nok.com\nbad_two\n"),
        source("b.txt", "bad_three\n"),
    });

    ASSERT_EQ(result.warnings.size(), 3u);
    EXPECT_EQ(result.warnings[0].text, "bad_one");
    EXPECT_EQ(result.warnings[0].line, 1u);
    EXPECT_EQ(result.warnings[1].text, "bad_two");
    EXPECT_EQ(result.warnings[1].line, 3u);
    EXPECT_EQ(result.warnings[2].source, "b.txt");
    EXPECT_EQ(result.warnings[2].line, 1u);
}

TEST_F(AggregatorTest, Warnings_DuplicatesNotCollapsed) {
    auto result = aggregate({source("a.txt", "bad_\nbad_\n")});
    EXPECT_EQ(result.warnings.size(), 2u);
}

TEST_F(AggregatorTest, Sources_ProcessingOrderKept) {
    auto result = aggregate({source("z.txt", ""), source("a.txt", "")});
    ASSERT_EQ(result.sources.size(), 2u);
    EXPECT_EQ(result.sources[0], "z.txt");
    EXPECT_EQ(result.sources[1], "a.txt");
}

TEST_F(AggregatorTest, LineNumbers_CrlfInput) {
    auto result = aggregate({source("w.txt", "ok.com\r\n\r\nbad_\r\n")});
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].line, 3u);
    EXPECT_EQ(result.linesSeen, 3u);
}

// ============================================================================
// Incremental use
// ============================================================================

TEST_F(AggregatorTest, Incremental_MatchesAggregate) {
    std::vector<SourceText> sources = {
        source("a.txt", "one.com\nbad_\n"),
        source("b.txt", "two.com\none.com\n"),
    };

    Aggregator aggregator;
    for (const auto& s : sources) {
        aggregator.addSource(s);
    }
    EXPECT_EQ(aggregator.domainCount(), 2u);
    EXPECT_EQ(aggregator.warningCount(), 1u);

    auto incremental = aggregator.finish();
    auto oneShot = aggregate(sources);

    EXPECT_EQ(incremental.domains, oneShot.domains);
    EXPECT_EQ(incremental.warnings, oneShot.warnings);
    EXPECT_EQ(incremental.sources, oneShot.sources);
    EXPECT_EQ(incremental.linesSeen, oneShot.linesSeen);
}

TEST_F(AggregatorTest, Finish_ResetsState) {
    Aggregator aggregator;
    aggregator.addSource(source("a.txt", "one.com\nbad_\n"));
    aggregator.finish();

    EXPECT_EQ(aggregator.domainCount(), 0u);
    EXPECT_EQ(aggregator.warningCount(), 0u);

    aggregator.addSource(source("b.txt", "two.com\n"));
    auto second = aggregator.finish();
    ASSERT_EQ(second.domains.size(), 1u);
    EXPECT_EQ(second.domains[0], "two.com");
    ASSERT_EQ(second.sources.size(), 1u);
    EXPECT_EQ(second.sources[0], "b.txt");
    EXPECT_EQ(second.linesSeen, 1u);
}

// ============================================================================
// Warning formatting
// ============================================================================

TEST_F(AggregatorTest, WarningToString_Format) {
    Warning w;
    w.source = "source/a.txt";
    w.line = 4;
    w.text = "bad_";
    EXPECT_EQ(warningToString(w),
              "source/a.txt:4: skipped invalid domain: 'bad_' (invalid-domain-shape)");
}
