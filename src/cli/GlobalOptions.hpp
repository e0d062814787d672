/**
 * DevJournal - Global Options
 *
 * Options that apply before the sub-command name.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <QStringList>

namespace devjournal {

struct GlobalOptions {
    bool helpRequested = false;
    bool versionRequested = false;
    bool verbose = false;
    std::optional<std::filesystem::path> configDirectory;
    std::optional<std::filesystem::path> journalFile;

    // Sub-command name and its arguments, untouched
    QStringList command;
};

/**
 * Parse the full command line, program name first
 *
 * Parsing stops at the first positional argument; everything from there
 * on is left in GlobalOptions::command for the sub-command.
 *
 * @param error Receives the parser message on failure
 * @return std::nullopt on an unknown option or a missing option value
 */
std::optional<GlobalOptions> parseGlobalOptions(const QStringList& arguments, std::string& error);

} // namespace devjournal
