/**
 * DevJournal - Configuration Manager
 *
 * Loads and saves the program configuration file.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string>

namespace devjournal {

/**
 * Program-wide settings
 */
struct ProgramConfig {
    std::filesystem::path journalFile;     // Empty means <data dir>/journal.json
    std::string logVerbosity = "warning";  // debug, info, warning, error
    double fuzzyCutoff = 0.5;
    int fuzzyMaxResults = 10;
    int lockTimeoutMs = 5000;
};

/**
 * Owner of config.json in the configuration directory
 *
 * Constructed once at startup and handed to whoever needs settings.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // Lifecycle
    bool initialize(const std::filesystem::path& configDirectory);

    // State queries
    bool isFirstRun() const { return m_isFirstRun; }

    const ProgramConfig& programConfig() const { return m_programConfig; }
    void setProgramConfig(const ProgramConfig& config);

    /**
     * Backing store path, falling back to the platform data directory
     */
    std::filesystem::path journalFile() const;

    /**
     * Override the backing store path for this run only
     */
    void overrideJournalFile(const std::filesystem::path& path) { m_journalOverride = path; }

    // Serialization
    static ProgramConfig fromJson(const std::string& json);
    static std::string toJson(const ProgramConfig& config);

private:
    bool loadProgramConfig();
    bool saveProgramConfig();

    std::filesystem::path m_configDirectory;
    std::filesystem::path m_journalOverride;
    bool m_isFirstRun = true;

    ProgramConfig m_programConfig;
};

} // namespace devjournal
