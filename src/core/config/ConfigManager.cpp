/**
 * DevJournal - Configuration Manager Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ConfigManager.hpp"
#include "core/platform/Platform.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace devjournal {

namespace {
    constexpr const char* PROGRAM_CONFIG_FILE = "config.json";
    constexpr const char* JOURNAL_FILE = "journal.json";

    // Integer setting within [minimum, INT_MAX]
    std::optional<int> boundedInt(const nlohmann::json& j, const char* key, std::int64_t minimum) {
        const std::int64_t value = j[key].get<std::int64_t>();
        if (value < minimum || value > std::numeric_limits<int>::max()) {
            spdlog::warn("Ignoring {} {} outside [{}, {}]",
                         key, value, minimum, std::numeric_limits<int>::max());
            return std::nullopt;
        }
        return static_cast<int>(value);
    }
}

bool ConfigManager::initialize(const std::filesystem::path& configDirectory) {
    m_configDirectory = configDirectory;

    // Create directories if they don't exist
    try {
        std::filesystem::create_directories(m_configDirectory);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create config directory: {}", e.what());
        return false;
    }

    // Check if this is first run
    m_isFirstRun = !std::filesystem::exists(m_configDirectory / PROGRAM_CONFIG_FILE);

    if (m_isFirstRun) {
        if (!saveProgramConfig()) {
            spdlog::warn("Failed to write default config");
        }
    } else if (!loadProgramConfig()) {
        spdlog::warn("Failed to load program config, using defaults");
    }

    spdlog::debug("ConfigManager initialized at: {}", m_configDirectory.string());
    return true;
}

void ConfigManager::setProgramConfig(const ProgramConfig& config) {
    m_programConfig = config;
    saveProgramConfig();
}

std::filesystem::path ConfigManager::journalFile() const {
    if (!m_journalOverride.empty()) {
        return m_journalOverride;
    }
    if (!m_programConfig.journalFile.empty()) {
        return m_programConfig.journalFile;
    }
    return Platform::getDataPath() / JOURNAL_FILE;
}

ProgramConfig ConfigManager::fromJson(const std::string& json) {
    ProgramConfig config;
    auto j = nlohmann::json::parse(json);

    if (j.contains("journalFile")) {
        config.journalFile = j["journalFile"].get<std::string>();
    }
    if (j.contains("logVerbosity")) {
        config.logVerbosity = j["logVerbosity"].get<std::string>();
    }
    if (j.contains("fuzzyCutoff")) {
        double cutoff = j["fuzzyCutoff"].get<double>();
        if (cutoff >= 0.0 && cutoff <= 1.0) {
            config.fuzzyCutoff = cutoff;
        } else {
            spdlog::warn("Ignoring fuzzyCutoff {} outside [0, 1]", cutoff);
        }
    }
    if (j.contains("fuzzyMaxResults")) {
        if (auto maxResults = boundedInt(j, "fuzzyMaxResults", 1)) {
            config.fuzzyMaxResults = *maxResults;
        }
    }
    if (j.contains("lockTimeoutMs")) {
        if (auto timeout = boundedInt(j, "lockTimeoutMs", 0)) {
            config.lockTimeoutMs = *timeout;
        }
    }

    return config;
}

std::string ConfigManager::toJson(const ProgramConfig& config) {
    nlohmann::json j;
    j["journalFile"] = config.journalFile.string();
    j["logVerbosity"] = config.logVerbosity;
    j["fuzzyCutoff"] = config.fuzzyCutoff;
    j["fuzzyMaxResults"] = config.fuzzyMaxResults;
    j["lockTimeoutMs"] = config.lockTimeoutMs;
    return j.dump(2);
}

bool ConfigManager::loadProgramConfig() {
    auto configPath = m_configDirectory / PROGRAM_CONFIG_FILE;

    try {
        std::ifstream file(configPath);
        if (!file.is_open()) {
            return false;
        }

        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
        m_programConfig = fromJson(content);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load program config: {}", e.what());
        m_programConfig = ProgramConfig{};
        return false;
    }
}

bool ConfigManager::saveProgramConfig() {
    auto configPath = m_configDirectory / PROGRAM_CONFIG_FILE;

    try {
        std::ofstream file(configPath);
        if (!file.is_open()) {
            spdlog::error("Failed to open {} for writing", configPath.string());
            return false;
        }
        file << toJson(m_programConfig);
        return static_cast<bool>(file);
    } catch (const std::exception& e) {
        spdlog::error("Failed to save program config: {}", e.what());
        return false;
    }
}

} // namespace devjournal
