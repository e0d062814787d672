/**
 * DevJournal - Journal Entry
 *
 * Data model for a single dated note.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace devjournal {

constexpr int kMaxTitleLength = 50;
constexpr int kMaxContentLength = 200;

/**
 * A single journal entry with title, content, date and tags
 *
 * Entries are immutable once created. The length limits are checked
 * by create() only; there is no update path.
 */
struct JournalEntry {
    QString id;           // Unique ID (UUID)
    QString title;        // Entry title, at most kMaxTitleLength characters
    QString content;      // Entry content, at most kMaxContentLength characters
    QString date;         // ISO-8601 creation timestamp
    QStringList tags;     // Trimmed, non-empty labels

    /**
     * Build a validated entry
     *
     * Tags are trimmed and blank tags are dropped.
     *
     * @throws ValidationError if title or content exceeds its limit
     */
    static JournalEntry create(const QString& id,
                               const QString& title,
                               const QString& content,
                               const QDateTime& createdAt,
                               const QStringList& tags = {});

    /**
     * Check the title and content limits
     *
     * @throws ValidationError on the first violated limit
     */
    static void validate(const QString& title, const QString& content);

    /**
     * Trim every tag and drop the ones left empty
     */
    static QStringList normalizeTags(const QStringList& tags);

    /**
     * Number of Unicode code points in a string
     */
    static int characterCount(const QString& text);

    /**
     * Format a timestamp the way it is stored in the date field
     */
    static QString formatDate(const QDateTime& dateTime);

    /**
     * Serialize to JSON
     */
    QJsonObject toJson() const;

    /**
     * Deserialize from JSON
     *
     * @throws MalformedStoreError if a field has the wrong type or the id is missing
     * @throws ValidationError if title or content exceeds its limit
     */
    static JournalEntry fromJson(const QJsonObject& obj);

    bool operator==(const JournalEntry& other) const {
        return id == other.id && title == other.title && content == other.content
            && date == other.date && tags == other.tags;
    }
    bool operator!=(const JournalEntry& other) const { return !(*this == other); }
};

} // namespace devjournal
