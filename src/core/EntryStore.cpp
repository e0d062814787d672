/**
 * DevJournal - Entry Store Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "EntryStore.hpp"
#include "JournalErrors.hpp"

#include <algorithm>
#include <unordered_set>

#include <QFile>
#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLockFile>
#include <QSaveFile>
#include <QUuid>

#include <spdlog/spdlog.h>

namespace devjournal {

namespace {

QString toQString(const std::filesystem::path& path) {
    return QString::fromStdString(path.string());
}

LoadResult failedLoad(LoadStatus status, std::string error) {
    LoadResult result;
    result.status = status;
    result.error = std::move(error);
    return result;
}

} // anonymous namespace

const char* toString(LoadStatus status) {
    switch (status) {
        case LoadStatus::Ok: return "ok";
        case LoadStatus::Missing: return "missing";
        case LoadStatus::Empty: return "empty";
        case LoadStatus::Malformed: return "malformed";
        case LoadStatus::InvalidEntry: return "invalid entry";
    }
    return "unknown";
}

const std::vector<JournalEntry>& LoadResult::orThrow() const {
    if (status == LoadStatus::Malformed) {
        throw MalformedStoreError(error);
    }
    if (status == LoadStatus::InvalidEntry) {
        throw ValidationError(error);
    }
    return entries;
}

EntryStore::EntryStore(std::filesystem::path path, StoreOptions options)
    : m_path(std::move(path))
    , m_options(std::move(options)) {
    if (!m_options.idGenerator) {
        m_options.idGenerator = [] {
            return QUuid::createUuid().toString(QUuid::WithoutBraces);
        };
    }
    if (!m_options.clock) {
        m_options.clock = [] { return QDateTime::currentDateTime(); };
    }
}

LoadResult EntryStore::load() const {
    QFile file(toQString(m_path));

    if (!file.exists()) {
        spdlog::debug("No journal file found at: {}", m_path.string());
        return failedLoad(LoadStatus::Missing, {});
    }

    if (!file.open(QIODevice::ReadOnly)) {
        throw StoreIoError("Failed to open journal file " + m_path.string() + ": "
                           + file.errorString().toStdString());
    }

    const QByteArray data = file.readAll();
    file.close();

    if (data.trimmed().isEmpty()) {
        spdlog::debug("Journal file is empty: {}", m_path.string());
        return failedLoad(LoadStatus::Empty, {});
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        spdlog::warn("Journal file {} is not valid JSON: {}",
                     m_path.string(), parseError.errorString().toStdString());
        return failedLoad(LoadStatus::Malformed, parseError.errorString().toStdString());
    }
    if (!doc.isArray()) {
        spdlog::warn("Invalid journal file format: {}", m_path.string());
        return failedLoad(LoadStatus::Malformed, "Journal file is not a JSON array");
    }

    LoadResult result;
    std::unordered_set<std::string> seenIds;
    const QJsonArray array = doc.array();
    for (const auto& value : array) {
        if (!value.isObject()) {
            return failedLoad(LoadStatus::Malformed, "Journal record is not an object");
        }

        try {
            JournalEntry entry = JournalEntry::fromJson(value.toObject());
            if (!seenIds.insert(entry.id.toStdString()).second) {
                return failedLoad(LoadStatus::Malformed,
                                  "Duplicate entry id: " + entry.id.toStdString());
            }
            result.entries.push_back(std::move(entry));
        } catch (const MalformedStoreError& e) {
            spdlog::warn("Malformed journal record in {}: {}", m_path.string(), e.what());
            return failedLoad(LoadStatus::Malformed, e.what());
        } catch (const ValidationError& e) {
            spdlog::warn("Invalid journal record in {}: {}", m_path.string(), e.what());
            return failedLoad(LoadStatus::InvalidEntry, e.what());
        }
    }

    spdlog::debug("Loaded {} journal entries", result.entries.size());
    return result;
}

std::vector<JournalEntry> EntryStore::entries() const {
    LoadResult result = load();
    if (result.status == LoadStatus::InvalidEntry) {
        throw ValidationError(result.error);
    }
    if (result.status != LoadStatus::Ok) {
        spdlog::debug("Journal {} is {}; no entries", m_path.string(), toString(result.status));
    }
    if (result.status == LoadStatus::Malformed) {
        spdlog::warn("Treating unreadable journal {} as empty", m_path.string());
    }
    return std::move(result.entries);
}

void EntryStore::save(const std::vector<JournalEntry>& entries) const {
    QJsonArray array;
    for (const auto& entry : entries) {
        array.append(entry.toJson());
    }
    const QByteArray payload = QJsonDocument(array).toJson(QJsonDocument::Indented);

    // Ensure directory exists
    if (m_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(m_path.parent_path(), ec);
        if (ec) {
            throw StoreIoError("Failed to create directory " + m_path.parent_path().string()
                               + ": " + ec.message());
        }
    }

    QSaveFile file(toQString(m_path));
    if (!file.open(QIODevice::WriteOnly)) {
        throw StoreIoError("Failed to open journal file for writing " + m_path.string()
                           + ": " + file.errorString().toStdString());
    }
    if (file.write(payload) != payload.size()) {
        file.cancelWriting();
        throw StoreIoError("Failed to write journal file " + m_path.string() + ": "
                           + file.errorString().toStdString());
    }
    if (!file.commit()) {
        throw StoreIoError("Failed to replace journal file " + m_path.string() + ": "
                           + file.errorString().toStdString());
    }

    spdlog::debug("Saved {} journal entries", entries.size());
}

JournalEntry EntryStore::add(const QString& title, const QString& content,
                             const QStringList& tags) {
    return addAll({EntryDraft{title, content, tags}}).front();
}

std::vector<JournalEntry> EntryStore::addAll(const std::vector<EntryDraft>& drafts) {
    // Reject before touching the lock or the file
    for (const auto& draft : drafts) {
        JournalEntry::validate(draft.title, draft.content);
    }

    QLockFile lock(lockPath());
    if (!lock.tryLock(m_options.lockTimeoutMs)) {
        throw StoreLockedError("Journal is locked by another process: " + m_path.string());
    }

    std::vector<JournalEntry> entries = loadForUpdate();
    std::vector<JournalEntry> created;
    created.reserve(drafts.size());
    for (const auto& draft : drafts) {
        JournalEntry entry = JournalEntry::create(
            generateUniqueId(entries), draft.title, draft.content, m_options.clock(), draft.tags);
        entries.push_back(entry);
        created.push_back(std::move(entry));
    }
    save(entries);

    for (const auto& entry : created) {
        spdlog::info("Created journal entry: {}", entry.title.toStdString());
    }
    return created;
}

void EntryStore::remove(const QString& id) {
    QLockFile lock(lockPath());
    if (!lock.tryLock(m_options.lockTimeoutMs)) {
        throw StoreLockedError("Journal is locked by another process: " + m_path.string());
    }

    std::vector<JournalEntry> entries = loadForUpdate();
    auto it = std::find_if(entries.begin(), entries.end(),
        [&id](const JournalEntry& entry) { return entry.id == id; });
    if (it == entries.end()) {
        throw NotFoundError("Entry with ID '" + id.toStdString() + "' not found.");
    }

    const QString title = it->title;
    entries.erase(it);
    save(entries);

    spdlog::info("Deleted journal entry: {}", title.toStdString());
}

std::optional<QString> EntryStore::mostCommonTag(const std::vector<JournalEntry>& entries) {
    QHash<QString, int> counts;
    QStringList order;
    for (const auto& entry : entries) {
        for (const auto& tag : entry.tags) {
            auto it = counts.find(tag);
            if (it == counts.end()) {
                counts.insert(tag, 1);
                order.append(tag);
            } else {
                ++it.value();
            }
        }
    }

    if (order.isEmpty()) {
        return std::nullopt;
    }

    QString best = order.first();
    int bestCount = counts.value(best);
    for (const auto& tag : order) {
        const int count = counts.value(tag);
        if (count > bestCount) {
            best = tag;
            bestCount = count;
        }
    }
    return best;
}

std::vector<JournalEntry> EntryStore::loadForUpdate() const {
    LoadResult result = load();
    switch (result.status) {
        case LoadStatus::Ok:
        case LoadStatus::Missing:
        case LoadStatus::Empty:
            break;
        case LoadStatus::Malformed:
            backupCorruptFile();
            break;
        case LoadStatus::InvalidEntry:
            throw ValidationError(result.error);
    }
    return std::move(result.entries);
}

void EntryStore::backupCorruptFile() const {
    const QString source = toQString(m_path);
    const QString backup = source + ".corrupt";

    QFile::remove(backup);
    if (!QFile::copy(source, backup)) {
        throw StoreIoError("Refusing to overwrite unreadable journal " + m_path.string()
                           + ": backup to " + backup.toStdString() + " failed");
    }
    spdlog::warn("Unreadable journal copied to {}; starting from an empty collection",
                 backup.toStdString());
}

QString EntryStore::generateUniqueId(const std::vector<JournalEntry>& entries) const {
    QString id = m_options.idGenerator();
    auto taken = [&entries](const QString& candidate) {
        return std::any_of(entries.begin(), entries.end(),
            [&candidate](const JournalEntry& entry) { return entry.id == candidate; });
    };
    while (id.isEmpty() || taken(id)) {
        spdlog::debug("Generated id {} already in use, retrying", id.toStdString());
        id = m_options.idGenerator();
    }
    return id;
}

QString EntryStore::lockPath() const {
    if (m_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(m_path.parent_path(), ec);
        if (ec) {
            throw StoreIoError("Failed to create directory " + m_path.parent_path().string()
                               + ": " + ec.message());
        }
    }
    return toQString(m_path) + ".lock";
}

} // namespace devjournal
