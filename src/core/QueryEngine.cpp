/**
 * DevJournal - Query Engine Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "QueryEngine.hpp"
#include "EntryStore.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <QSet>

namespace devjournal {

namespace {

struct Match {
    int a = 0;
    int b = 0;
    int size = 0;
};

/**
 * Longest common block of a[alo, ahi) and b[blo, bhi)
 *
 * Among equally long blocks the one starting earliest in a, then in b,
 * is returned.
 */
Match longestMatch(const QList<uint>& a, int alo, int ahi,
                   const QList<uint>& b, int blo, int bhi) {
    Match best{alo, blo, 0};
    std::vector<int> previous(static_cast<size_t>(bhi - blo + 1), 0);
    std::vector<int> current(previous.size(), 0);

    for (int i = alo; i < ahi; ++i) {
        for (int j = blo; j < bhi; ++j) {
            const size_t col = static_cast<size_t>(j - blo + 1);
            if (a[i] == b[j]) {
                current[col] = previous[col - 1] + 1;
                if (current[col] > best.size) {
                    best.size = current[col];
                    best.a = i - best.size + 1;
                    best.b = j - best.size + 1;
                }
            } else {
                current[col] = 0;
            }
        }
        std::swap(previous, current);
    }
    return best;
}

/**
 * Total size of the Ratcliff/Obershelp matching blocks
 */
int matchingCharacters(const QList<uint>& a, const QList<uint>& b) {
    int total = 0;
    std::vector<std::pair<std::pair<int, int>, std::pair<int, int>>> pending;
    pending.push_back({{0, static_cast<int>(a.size())}, {0, static_cast<int>(b.size())}});

    while (!pending.empty()) {
        auto [aRange, bRange] = pending.back();
        pending.pop_back();

        Match m = longestMatch(a, aRange.first, aRange.second, b, bRange.first, bRange.second);
        if (m.size == 0) {
            continue;
        }
        total += m.size;
        if (aRange.first < m.a && bRange.first < m.b) {
            pending.push_back({{aRange.first, m.a}, {bRange.first, m.b}});
        }
        if (m.a + m.size < aRange.second && m.b + m.size < bRange.second) {
            pending.push_back({{m.a + m.size, aRange.second}, {m.b + m.size, bRange.second}});
        }
    }
    return total;
}

QStringList normalizeRequestedTags(const QStringList& tags) {
    QStringList result;
    for (const auto& tag : tags) {
        QString trimmed = tag.trimmed();
        if (!trimmed.isEmpty()) {
            result.append(trimmed);
        }
    }
    return result;
}

} // anonymous namespace

std::vector<JournalEntry> QueryEngine::filterByTags(const std::vector<JournalEntry>& entries,
                                                    const QStringList& tags,
                                                    TagMatch mode) {
    const QStringList requested = normalizeRequestedTags(tags);
    if (requested.isEmpty()) {
        return entries;
    }

    std::vector<JournalEntry> filtered;
    for (const auto& entry : entries) {
        auto hasTag = [&entry](const QString& tag) {
            return entry.tags.contains(tag, Qt::CaseInsensitive);
        };

        const bool keep = mode == TagMatch::All
            ? std::all_of(requested.begin(), requested.end(), hasTag)
            : std::any_of(requested.begin(), requested.end(), hasTag);
        if (keep) {
            filtered.push_back(entry);
        }
    }
    return filtered;
}

std::vector<JournalEntry> QueryEngine::searchByTitle(const std::vector<JournalEntry>& entries,
                                                     const QString& query) {
    std::vector<JournalEntry> found;
    std::copy_if(entries.begin(), entries.end(), std::back_inserter(found),
        [&query](const JournalEntry& entry) {
            return entry.title.contains(query, Qt::CaseInsensitive);
        });
    return found;
}

std::vector<JournalEntry> QueryEngine::searchByTag(const std::vector<JournalEntry>& entries,
                                                   const QString& query) {
    std::vector<JournalEntry> found;
    std::copy_if(entries.begin(), entries.end(), std::back_inserter(found),
        [&query](const JournalEntry& entry) {
            return entry.tags.contains(query, Qt::CaseInsensitive);
        });
    return found;
}

double QueryEngine::similarity(const QString& a, const QString& b) {
    const QList<uint> left = a.toCaseFolded().toUcs4();
    const QList<uint> right = b.toCaseFolded().toUcs4();

    const auto length = left.size() + right.size();
    if (length == 0) {
        return 1.0;
    }
    return 2.0 * matchingCharacters(left, right) / static_cast<double>(length);
}

QStringList QueryEngine::fuzzySearchTitles(const QStringList& titles,
                                           const QString& query,
                                           int maxResults,
                                           double cutoff) {
    if (maxResults <= 0) {
        throw std::invalid_argument("maxResults must be > 0");
    }
    if (cutoff < 0.0 || cutoff > 1.0) {
        throw std::invalid_argument("cutoff must be in [0.0, 1.0]");
    }

    std::vector<std::pair<double, int>> scored;
    for (int i = 0; i < titles.size(); ++i) {
        const double score = similarity(query, titles[i]);
        if (score >= cutoff) {
            scored.emplace_back(score, i);
        }
    }

    std::stable_sort(scored.begin(), scored.end(),
        [](const auto& lhs, const auto& rhs) { return lhs.first > rhs.first; });

    QStringList result;
    for (const auto& [score, index] : scored) {
        if (result.size() >= maxResults) {
            break;
        }
        result.append(titles[index]);
    }
    return result;
}

std::vector<JournalEntry> QueryEngine::fuzzySearchEntries(const std::vector<JournalEntry>& entries,
                                                          const QString& query,
                                                          int maxResults,
                                                          double cutoff) {
    QStringList titles;
    for (const auto& entry : entries) {
        titles.append(entry.title);
    }

    // Titles are not unique, so match ranked titles back to unused entries
    std::vector<bool> used(entries.size(), false);
    std::vector<JournalEntry> found;
    for (const auto& title : fuzzySearchTitles(titles, query, maxResults, cutoff)) {
        for (size_t i = 0; i < entries.size(); ++i) {
            if (!used[i] && entries[i].title == title) {
                used[i] = true;
                found.push_back(entries[i]);
                break;
            }
        }
    }
    return found;
}

int QueryEngine::wordCount(const QString& text) {
    return static_cast<int>(text.simplified().split(QLatin1Char(' '), Qt::SkipEmptyParts).size());
}

JournalStats QueryEngine::stats(const std::vector<JournalEntry>& entries) {
    JournalStats result;
    result.count = static_cast<int>(entries.size());

    QSet<QString> distinctTags;
    for (const auto& entry : entries) {
        for (const auto& tag : entry.tags) {
            distinctTags.insert(tag);
        }
        result.totalWords += wordCount(entry.content);
    }

    result.distinctTagCount = static_cast<int>(distinctTags.size());
    result.mostCommonTag = EntryStore::mostCommonTag(entries);
    if (result.count > 0) {
        result.avgWordsPerEntry = static_cast<double>(result.totalWords) / result.count;
    }
    return result;
}

} // namespace devjournal
