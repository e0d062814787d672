/**
 * DevJournal - Query Engine Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include "core/QueryEngine.hpp"

#include <stdexcept>

using namespace devjournal;

class QueryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        QDateTime when(QDate(2024, 5, 1), QTime(12, 0));
        entries = {
            JournalEntry::create("1", "Setup Env", "Installed tools", when, {"setup", "Tools"}),
            JournalEntry::create("2", "Wrote Tests", "Covered edge cases", when, {"testing"}),
            JournalEntry::create("3", "Release prep", "Tagged the build", when, {"tools", "release"}),
            JournalEntry::create("4", "Untagged thoughts", "Nothing to see", when, {}),
        };
    }

    static QStringList ids(const std::vector<JournalEntry>& found) {
        QStringList result;
        for (const auto& entry : found) {
            result.append(entry.id);
        }
        return result;
    }

    std::vector<JournalEntry> entries;
};

TEST_F(QueryEngineTest, FilterWithoutTagsReturnsInputUnchanged) {
    EXPECT_EQ(QueryEngine::filterByTags(entries, {}), entries);
    EXPECT_EQ(QueryEngine::filterByTags(entries, {"  "}, TagMatch::All), entries);
}

TEST_F(QueryEngineTest, FilterMatchesTagsIgnoringCase) {
    EXPECT_EQ(ids(QueryEngine::filterByTags(entries, {"TOOLS"})), QStringList({"1", "3"}));
    EXPECT_EQ(ids(QueryEngine::filterByTags(entries, {" setup "})), QStringList({"1"}));
    EXPECT_TRUE(QueryEngine::filterByTags(entries, {"missing"}).empty());
}

TEST_F(QueryEngineTest, FilterAnyKeepsEntriesWithOneRequestedTag) {
    auto found = QueryEngine::filterByTags(entries, {"testing", "release"}, TagMatch::Any);

    EXPECT_EQ(ids(found), QStringList({"2", "3"}));
}

TEST_F(QueryEngineTest, FilterAllRequiresEveryRequestedTag) {
    EXPECT_EQ(ids(QueryEngine::filterByTags(entries, {"tools", "setup"}, TagMatch::All)),
              QStringList({"1"}));
    EXPECT_TRUE(QueryEngine::filterByTags(entries, {"testing", "release"}, TagMatch::All).empty());
}

TEST_F(QueryEngineTest, SearchByTitleIsCaseInsensitiveSubstring) {
    EXPECT_EQ(ids(QueryEngine::searchByTitle(entries, "env")), QStringList({"1"}));
    EXPECT_EQ(ids(QueryEngine::searchByTitle(entries, "T")), QStringList({"1", "2", "4"}));
    EXPECT_TRUE(QueryEngine::searchByTitle(entries, "deploy").empty());
}

TEST_F(QueryEngineTest, SearchByTagNeedsWholeTag) {
    EXPECT_EQ(ids(QueryEngine::searchByTag(entries, "SETUP")), QStringList({"1"}));
    EXPECT_EQ(ids(QueryEngine::searchByTag(entries, "tools")), QStringList({"1", "3"}));
    EXPECT_TRUE(QueryEngine::searchByTag(entries, "test").empty());
}

TEST_F(QueryEngineTest, SimilarityFollowsMatchingBlocks) {
    EXPECT_DOUBLE_EQ(QueryEngine::similarity("abc", "abc"), 1.0);
    EXPECT_DOUBLE_EQ(QueryEngine::similarity("ABC", "abc"), 1.0);
    EXPECT_DOUBLE_EQ(QueryEngine::similarity("abc", "xyz"), 0.0);
    EXPECT_DOUBLE_EQ(QueryEngine::similarity("abcd", "bcde"), 0.75);
    EXPECT_DOUBLE_EQ(QueryEngine::similarity("appel", "apple"), 0.8);
    EXPECT_DOUBLE_EQ(QueryEngine::similarity("", ""), 1.0);
    EXPECT_DOUBLE_EQ(QueryEngine::similarity("abc", ""), 0.0);
}

TEST_F(QueryEngineTest, FuzzySearchRanksAboveCutoff) {
    QStringList titles = {"ape", "apple", "peach", "puppy"};

    EXPECT_EQ(QueryEngine::fuzzySearchTitles(titles, "appel", 3, 0.6),
              QStringList({"apple", "ape"}));
    EXPECT_EQ(QueryEngine::fuzzySearchTitles(titles, "appel", 1, 0.6),
              QStringList({"apple"}));
    EXPECT_EQ(QueryEngine::fuzzySearchTitles(titles, "appel", 10, 0.0).size(), 4);
    EXPECT_TRUE(QueryEngine::fuzzySearchTitles(titles, "zzzzz").isEmpty());
}

TEST_F(QueryEngineTest, FuzzySearchKeepsInputOrderOnEqualScores) {
    QStringList titles = {"aby", "abx"};

    EXPECT_EQ(QueryEngine::fuzzySearchTitles(titles, "abz"), QStringList({"aby", "abx"}));
}

TEST_F(QueryEngineTest, FuzzySearchRejectsInvalidArguments) {
    QStringList titles = {"a"};

    EXPECT_THROW(QueryEngine::fuzzySearchTitles(titles, "a", 0, 0.5), std::invalid_argument);
    EXPECT_THROW(QueryEngine::fuzzySearchTitles(titles, "a", 1, -0.1), std::invalid_argument);
    EXPECT_THROW(QueryEngine::fuzzySearchTitles(titles, "a", 1, 1.5), std::invalid_argument);
}

TEST_F(QueryEngineTest, FuzzySearchEntriesMapsTitlesBack) {
    auto found = QueryEngine::fuzzySearchEntries(entries, "setup envs");

    ASSERT_FALSE(found.empty());
    EXPECT_EQ(found.front().id, "1");
}

TEST_F(QueryEngineTest, WordCountSplitsOnAnyWhitespace) {
    EXPECT_EQ(QueryEngine::wordCount("  multiple   spaces\tand\nnewlines "), 4);
    EXPECT_EQ(QueryEngine::wordCount(""), 0);
    EXPECT_EQ(QueryEngine::wordCount("   "), 0);
}

TEST_F(QueryEngineTest, StatsAggregatesWordsAndTags) {
    QDateTime when = QDateTime::currentDateTime();
    std::vector<JournalEntry> sample = {
        JournalEntry::create("1", "one", "a b c", when, {"x", "y"}),
        JournalEntry::create("2", "two", "d e", when, {"y", "X"}),
    };

    JournalStats stats = QueryEngine::stats(sample);

    EXPECT_EQ(stats.count, 2);
    EXPECT_EQ(stats.totalWords, 5);
    ASSERT_TRUE(stats.avgWordsPerEntry.has_value());
    EXPECT_DOUBLE_EQ(*stats.avgWordsPerEntry, 2.5);
    EXPECT_EQ(stats.distinctTagCount, 3);
    ASSERT_TRUE(stats.mostCommonTag.has_value());
    EXPECT_EQ(*stats.mostCommonTag, "y");
}

TEST_F(QueryEngineTest, StatsOnEmptyCollectionLeavesAverageUnset) {
    JournalStats stats = QueryEngine::stats({});

    EXPECT_EQ(stats.count, 0);
    EXPECT_EQ(stats.totalWords, 0);
    EXPECT_EQ(stats.distinctTagCount, 0);
    EXPECT_FALSE(stats.avgWordsPerEntry.has_value());
    EXPECT_FALSE(stats.mostCommonTag.has_value());
}
