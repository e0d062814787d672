/**
 * DevJournal - Entry Store
 *
 * Durable persistence of the journal collection in a single JSON file.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "JournalEntry.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <QDateTime>
#include <QString>
#include <QStringList>

namespace devjournal {

/**
 * Outcome of reading the backing file
 */
enum class LoadStatus {
    Ok,            // File parsed, entries valid
    Missing,       // File does not exist yet
    Empty,         // File has no content
    Malformed,     // Not a JSON array of well-formed entry objects
    InvalidEntry   // A stored entry violates a length limit
};

const char* toString(LoadStatus status);

/**
 * Entries read from disk together with how the read went
 *
 * Anything but Ok carries no entries. The caller picks the policy:
 * treat the collection as empty, or escalate with orThrow().
 */
struct LoadResult {
    LoadStatus status = LoadStatus::Ok;
    std::vector<JournalEntry> entries;
    std::string error;

    bool ok() const { return status == LoadStatus::Ok; }

    /**
     * Entries, or the matching exception for Malformed and InvalidEntry
     */
    const std::vector<JournalEntry>& orThrow() const;
};

/**
 * Fields supplied by the caller for a new entry
 */
struct EntryDraft {
    QString title;
    QString content;
    QStringList tags;
};

/**
 * Store tuning and injection points
 */
struct StoreOptions {
    int lockTimeoutMs = 5000;

    // Defaults to QUuid::createUuid() without braces
    std::function<QString()> idGenerator;

    // Defaults to QDateTime::currentDateTime()
    std::function<QDateTime()> clock;
};

/**
 * Owns the journal file and provides the CRUD primitives
 *
 * Every operation reloads the whole file; nothing is cached between
 * calls. Writes replace the file atomically and mutations hold a
 * lock file so concurrent processes cannot drop each other's changes.
 */
class EntryStore {
public:
    explicit EntryStore(std::filesystem::path path, StoreOptions options = {});

    const std::filesystem::path& path() const { return m_path; }

    /**
     * Read and parse the backing file
     *
     * Missing, empty and unparseable files produce an empty result with
     * the corresponding status; they never throw.
     *
     * @throws StoreIoError if the file exists but cannot be opened
     */
    LoadResult load() const;

    /**
     * Load, degrading Missing/Empty/Malformed to an empty collection
     *
     * @throws ValidationError if a stored entry violates a length limit
     */
    std::vector<JournalEntry> entries() const;

    /**
     * Replace the file with the given entries, in order
     *
     * @throws StoreIoError if the file cannot be written or replaced
     */
    void save(const std::vector<JournalEntry>& entries) const;

    /**
     * Create an entry with a fresh unique id and the current time
     *
     * Nothing is written when validation fails.
     *
     * @throws ValidationError, StoreIoError, StoreLockedError
     */
    JournalEntry add(const QString& title, const QString& content,
                     const QStringList& tags = {});

    /**
     * Create several entries under one lock and one write
     *
     * All drafts are validated first; if any fails nothing is written.
     *
     * @return The created entries, in draft order
     * @throws ValidationError, StoreIoError, StoreLockedError
     */
    std::vector<JournalEntry> addAll(const std::vector<EntryDraft>& drafts);

    /**
     * Delete the entry with the given id
     *
     * @throws NotFoundError if no entry has this id
     */
    void remove(const QString& id);

    /**
     * Tag with the most occurrences; the earliest seen wins a tie
     *
     * @return std::nullopt when no entry carries a tag
     */
    static std::optional<QString> mostCommonTag(const std::vector<JournalEntry>& entries);

private:
    std::vector<JournalEntry> loadForUpdate() const;
    void backupCorruptFile() const;
    QString generateUniqueId(const std::vector<JournalEntry>& entries) const;
    QString lockPath() const;

    std::filesystem::path m_path;
    StoreOptions m_options;
};

} // namespace devjournal
