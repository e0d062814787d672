/**
 * DevJournal - Query Engine
 *
 * Read-only filtering, search and statistics over a loaded journal.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "JournalEntry.hpp"

#include <optional>
#include <vector>

#include <QString>
#include <QStringList>

namespace devjournal {

constexpr double kDefaultFuzzyCutoff = 0.5;
constexpr int kDefaultFuzzyMaxResults = 10;

/**
 * How requested tags combine in filterByTags()
 */
enum class TagMatch {
    Any,   // Entry has at least one of the requested tags
    All    // Entry has every requested tag
};

/**
 * Aggregate figures for a collection
 */
struct JournalStats {
    int count = 0;
    int distinctTagCount = 0;
    std::optional<QString> mostCommonTag;    // Unset when no entry is tagged
    int totalWords = 0;
    std::optional<double> avgWordsPerEntry;  // Unset when count == 0
};

/**
 * Stateless queries; never modifies the entries it is given
 */
class QueryEngine {
public:
    /**
     * Entries carrying the requested tags, compared case-insensitively
     *
     * An empty request returns the input unchanged.
     */
    static std::vector<JournalEntry> filterByTags(const std::vector<JournalEntry>& entries,
                                                  const QStringList& tags,
                                                  TagMatch mode = TagMatch::Any);

    /**
     * Entries whose title contains the query, ignoring case
     */
    static std::vector<JournalEntry> searchByTitle(const std::vector<JournalEntry>& entries,
                                                   const QString& query);

    /**
     * Entries with a tag equal to the query, ignoring case
     */
    static std::vector<JournalEntry> searchByTag(const std::vector<JournalEntry>& entries,
                                                 const QString& query);

    /**
     * Titles close to the query, best match first
     *
     * Keeps titles whose similarity() to the query is at least cutoff,
     * then returns the maxResults best. Equal scores keep input order.
     *
     * @throws std::invalid_argument if maxResults <= 0 or cutoff is outside [0, 1]
     */
    static QStringList fuzzySearchTitles(const QStringList& titles,
                                         const QString& query,
                                         int maxResults = kDefaultFuzzyMaxResults,
                                         double cutoff = kDefaultFuzzyCutoff);

    /**
     * Fuzzy title search returning the matching entries in rank order
     */
    static std::vector<JournalEntry> fuzzySearchEntries(const std::vector<JournalEntry>& entries,
                                                        const QString& query,
                                                        int maxResults = kDefaultFuzzyMaxResults,
                                                        double cutoff = kDefaultFuzzyCutoff);

    /**
     * Ratcliff/Obershelp ratio 2*M/T in [0, 1], case-insensitive
     */
    static double similarity(const QString& a, const QString& b);

    /**
     * Number of whitespace-separated words
     */
    static int wordCount(const QString& text);

    static JournalStats stats(const std::vector<JournalEntry>& entries);
};

} // namespace devjournal
