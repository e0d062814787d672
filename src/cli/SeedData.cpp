/**
 * DevJournal - Seed Data Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "SeedData.hpp"

namespace devjournal {

const std::vector<EntryDraft>& seedEntries() {
    static const std::vector<EntryDraft> entries = {
        {
            "SETUP EDITOR ENVIRONMENT",
            "Installed clang-format and clangd. Format on save is enabled.",
            {"setup", "tools"}
        },
        {
            "EXPLORED QT CORE",
            "Read up on QSaveFile and QLockFile for safe file writes.",
            {"qt", "backend"}
        },
        {
            "WROTE FIRST GTESTS",
            "Covered edge cases with fixtures and temporary directories.",
            {"testing", "gtest"}
        },
        {
            "SWITCHED TO NINJA",
            "Replaced make with ninja for local builds. Much faster rebuilds!",
            {"build", "tools"}
        },
        {
            "GIT ALIASES SETUP",
            "Added aliases like gst, gco, gcm to boost workflow.",
            {"git", "productivity"}
        },
    };
    return entries;
}

} // namespace devjournal
