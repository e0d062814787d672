/**
 * DevJournal - Journal Errors
 *
 * Exception types raised by the entry store and the command layer.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <stdexcept>
#include <string>

namespace devjournal {

/**
 * Base class for all journal failures
 */
class JournalError : public std::runtime_error {
public:
    explicit JournalError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Title or content exceeds its length limit
 */
class ValidationError : public JournalError {
public:
    explicit ValidationError(const std::string& message)
        : JournalError(message) {}
};

/**
 * No entry with the requested id exists
 */
class NotFoundError : public JournalError {
public:
    explicit NotFoundError(const std::string& message)
        : JournalError(message) {}
};

/**
 * Backing file could not be parsed as a journal
 */
class MalformedStoreError : public JournalError {
public:
    explicit MalformedStoreError(const std::string& message)
        : JournalError(message) {}
};

/**
 * Backing file could not be read, written or replaced
 */
class StoreIoError : public JournalError {
public:
    explicit StoreIoError(const std::string& message)
        : JournalError(message) {}
};

/**
 * Another process holds the store lock
 */
class StoreLockedError : public StoreIoError {
public:
    explicit StoreLockedError(const std::string& message)
        : StoreIoError(message) {}
};

} // namespace devjournal
