/**
 * DevJournal - Command Line Interface
 *
 * Sub-command dispatch and text rendering on top of the entry store.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "core/EntryStore.hpp"
#include "core/config/ConfigManager.hpp"

#include <ostream>
#include <string>
#include <vector>

#include <QString>
#include <QStringList>

namespace devjournal {

/**
 * Process exit status for each failure kind
 */
enum ExitCode {
    ExitSuccess = 0,
    ExitUsage = 1,
    ExitValidation = 2,
    ExitNotFound = 3,
    ExitStorage = 4
};

/**
 * Runs one sub-command against an injected store
 *
 * Commands: add, list, search, stats, delete, populate.
 */
class JournalCli {
public:
    JournalCli(EntryStore& store, const ProgramConfig& config,
               std::ostream& out, std::ostream& err);

    /**
     * Run a sub-command
     *
     * @param arguments Command name followed by its arguments
     * @return Process exit code
     */
    int run(const QStringList& arguments);

    /**
     * Usage text listing the sub-commands
     */
    static std::string usage();

    /**
     * Multi-line rendering of a single entry
     */
    static std::string summary(const JournalEntry& entry);

private:
    int runAdd(const QStringList& arguments);
    int runList(const QStringList& arguments);
    int runSearch(const QStringList& arguments);
    int runStats(const QStringList& arguments);
    int runDelete(const QStringList& arguments);
    int runPopulate(const QStringList& arguments);

    std::vector<JournalEntry> loadEntries();
    void printEntries(const std::vector<JournalEntry>& entries);

    EntryStore& m_store;
    ProgramConfig m_config;
    std::ostream& m_out;
    std::ostream& m_err;
};

} // namespace devjournal
