/**
 * DevJournal - Platform Abstraction
 *
 * Per-user configuration and data directories.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>

namespace devjournal {

/**
 * Platform abstraction layer
 */
class Platform {
public:
    /**
     * Get the configuration directory path
     *
     * Linux:   ~/.config/devjournal/
     * Windows: %APPDATA%\devjournal\
     */
    static std::filesystem::path getConfigPath();

    /**
     * Get the data directory path (journal file)
     *
     * Linux:   ~/.local/share/devjournal/
     * Windows: %LOCALAPPDATA%\devjournal\
     */
    static std::filesystem::path getDataPath();
};

} // namespace devjournal
