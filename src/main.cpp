/**
 * DevJournal - Personal developer journal for the command line
 *
 * Copyright (C) 2024
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <QCoreApplication>
#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "cli/GlobalOptions.hpp"
#include "cli/JournalCli.hpp"
#include "core/EntryStore.hpp"
#include "core/config/ConfigManager.hpp"
#include "core/platform/Platform.hpp"

namespace {

spdlog::level::level_enum levelFromName(const std::string& name) {
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "error") return spdlog::level::err;
    return spdlog::level::warn;
}

void setupLogging(const std::filesystem::path& configPath) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    auto logPath = configPath / "logs" / "devjournal.log";
    try {
        // Ensure log directory exists
        std::filesystem::create_directories(logPath.parent_path());
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), 1024 * 1024 * 5, 3);
        file_sink->set_level(spdlog::level::debug);
        sinks.push_back(file_sink);
    } catch (const std::exception& e) {
        std::cerr << "Warning: file logging disabled: " << e.what() << "\n";
    }

    auto logger = std::make_shared<spdlog::logger>("devjournal", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);

    spdlog::set_default_logger(logger);
    spdlog::debug("DevJournal starting up...");
}

void setConsoleLevel(spdlog::level::level_enum level) {
    auto& sinks = spdlog::default_logger()->sinks();
    if (!sinks.empty()) {
        sinks.front()->set_level(level);
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("devjournal");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("devjournal");

    // Parse global options; everything from the command name on is left
    // for the command itself
    std::string parseError;
    const auto options = devjournal::parseGlobalOptions(app.arguments(), parseError);
    if (!options) {
        std::cerr << "Error: " << parseError << "\n\n" << devjournal::JournalCli::usage();
        return devjournal::ExitUsage;
    }
    if (options->helpRequested) {
        std::cout << devjournal::JournalCli::usage();
        return devjournal::ExitSuccess;
    }
    if (options->versionRequested) {
        std::cout << "devjournal " << app.applicationVersion().toStdString() << "\n";
        return devjournal::ExitSuccess;
    }

    // Initialize configuration
    const std::filesystem::path configPath =
        options->configDirectory.value_or(devjournal::Platform::getConfigPath());

    setupLogging(configPath);

    devjournal::ConfigManager configManager;
    if (!configManager.initialize(configPath)) {
        spdlog::error("Failed to initialize configuration");
        return devjournal::ExitStorage;
    }

    const auto& config = configManager.programConfig();
    setConsoleLevel(options->verbose
        ? spdlog::level::debug
        : levelFromName(config.logVerbosity));

    if (options->journalFile) {
        configManager.overrideJournalFile(*options->journalFile);
    }

    spdlog::info("Configuration loaded from: {}", configPath.string());

    devjournal::StoreOptions storeOptions;
    storeOptions.lockTimeoutMs = config.lockTimeoutMs;
    devjournal::EntryStore store(configManager.journalFile(), storeOptions);
    spdlog::debug("Using journal file: {}", store.path().string());

    const QStringList& commandLine = options->command;
    if (commandLine.isEmpty()) {
        std::cerr << devjournal::JournalCli::usage();
        return devjournal::ExitUsage;
    }

    devjournal::JournalCli cli(store, config, std::cout, std::cerr);
    return cli.run(commandLine);
}
