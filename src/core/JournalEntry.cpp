/**
 * DevJournal - Journal Entry Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "JournalEntry.hpp"
#include "JournalErrors.hpp"

#include <QJsonArray>
#include <QJsonValue>

namespace devjournal {

namespace {

QString requireString(const QJsonObject& obj, const char* key) {
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isUndefined()) {
        return {};
    }
    if (!value.isString()) {
        throw MalformedStoreError(std::string("Field '") + key + "' is not a string");
    }
    return value.toString();
}

} // anonymous namespace

int JournalEntry::characterCount(const QString& text) {
    return static_cast<int>(text.toUcs4().size());
}

void JournalEntry::validate(const QString& title, const QString& content) {
    if (characterCount(title) > kMaxTitleLength) {
        throw ValidationError("Title cannot exceed " + std::to_string(kMaxTitleLength)
                              + " characters.");
    }
    if (characterCount(content) > kMaxContentLength) {
        throw ValidationError("Content cannot exceed " + std::to_string(kMaxContentLength)
                              + " characters.");
    }
}

QStringList JournalEntry::normalizeTags(const QStringList& tags) {
    QStringList result;
    for (const auto& tag : tags) {
        QString trimmed = tag.trimmed();
        if (!trimmed.isEmpty()) {
            result.append(trimmed);
        }
    }
    return result;
}

QString JournalEntry::formatDate(const QDateTime& dateTime) {
    return dateTime.toString(Qt::ISODateWithMs);
}

JournalEntry JournalEntry::create(const QString& id,
                                  const QString& title,
                                  const QString& content,
                                  const QDateTime& createdAt,
                                  const QStringList& tags) {
    validate(title, content);

    JournalEntry entry;
    entry.id = id;
    entry.title = title;
    entry.content = content;
    entry.date = formatDate(createdAt);
    entry.tags = normalizeTags(tags);
    return entry;
}

QJsonObject JournalEntry::toJson() const {
    QJsonObject obj;
    obj["id"] = id;
    obj["title"] = title;
    obj["content"] = content;
    obj["date"] = date;
    obj["tags"] = QJsonArray::fromStringList(tags);
    return obj;
}

JournalEntry JournalEntry::fromJson(const QJsonObject& obj) {
    JournalEntry entry;
    entry.id = requireString(obj, "id");
    if (entry.id.isEmpty()) {
        throw MalformedStoreError("Entry has no id");
    }
    entry.title = requireString(obj, "title");
    entry.content = requireString(obj, "content");
    entry.date = requireString(obj, "date");

    const QJsonValue tagsValue = obj.value(QLatin1String("tags"));
    if (!tagsValue.isUndefined() && !tagsValue.isNull()) {
        if (!tagsValue.isArray()) {
            throw MalformedStoreError("Field 'tags' is not an array");
        }
        for (const auto& tag : tagsValue.toArray()) {
            if (!tag.isString()) {
                throw MalformedStoreError("Tag is not a string");
            }
            entry.tags.append(tag.toString());
        }
    }

    validate(entry.title, entry.content);
    return entry;
}

} // namespace devjournal
