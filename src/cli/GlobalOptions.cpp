/**
 * DevJournal - Global Options Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "GlobalOptions.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>

namespace devjournal {

std::optional<GlobalOptions> parseGlobalOptions(const QStringList& arguments, std::string& error) {
    QCommandLineParser parser;
    parser.setApplicationDescription("Personal developer journal");
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);
    parser.addPositionalArgument("command", "add, list, search, stats, delete or populate");

    // -v belongs to --version
    const QCommandLineOption helpOption(QStringList() << "h" << "help", "Show this help");
    const QCommandLineOption versionOption(QStringList() << "v" << "version", "Show the version");

    const QCommandLineOption configDirOption(
        QStringList() << "c" << "config-directory",
        "Configuration directory path",
        "path"
    );
    const QCommandLineOption journalFileOption(
        QStringList() << "f" << "journal-file",
        "Journal file to use",
        "path"
    );
    const QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Log debug output to the console"
    );

    if (!parser.addOptions({helpOption, versionOption, configDirOption,
                            journalFileOption, verboseOption})) {
        error = "conflicting global option names";
        return std::nullopt;
    }

    if (!parser.parse(arguments)) {
        error = parser.errorText().toStdString();
        return std::nullopt;
    }

    GlobalOptions options;
    options.helpRequested = parser.isSet(helpOption);
    options.versionRequested = parser.isSet(versionOption);
    options.verbose = parser.isSet(verboseOption);
    if (parser.isSet(configDirOption)) {
        options.configDirectory = parser.value(configDirOption).toStdString();
    }
    if (parser.isSet(journalFileOption)) {
        options.journalFile = parser.value(journalFileOption).toStdString();
    }
    options.command = parser.positionalArguments();
    return options;
}

} // namespace devjournal
