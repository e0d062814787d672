/**
 * DevJournal - Command Line Interface Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "JournalCli.hpp"
#include "SeedData.hpp"
#include "core/JournalErrors.hpp"
#include "core/QueryEngine.hpp"

#include <functional>
#include <map>
#include <stdexcept>

#include <QCommandLineOption>
#include <QCommandLineParser>

#include <spdlog/spdlog.h>

namespace devjournal {

namespace {

constexpr int DASH_LENGTH = 80;

const std::string LINE_SEPARATOR(DASH_LENGTH, '-');
const std::string LINE_SEPARATOR_DOUBLE(DASH_LENGTH, '=');

const QCommandLineOption helpOption(QStringList() << "h" << "help", "Show command help");

/**
 * Parse sub-command arguments
 *
 * @return false and prints the parser error on invalid input
 */
bool parseArguments(QCommandLineParser& parser, const QString& command,
                    const QStringList& arguments, std::ostream& err) {
    parser.addOption(helpOption);
    if (!parser.parse(QStringList() << ("devjournal " + command) << arguments)) {
        err << "Error: " << parser.errorText().toStdString() << "\n";
        return false;
    }
    return true;
}

/**
 * Flatten repeated, comma separated option values
 */
QStringList splitTags(const QStringList& values) {
    QStringList tags;
    for (const auto& value : values) {
        tags.append(value.split(QLatin1Char(','), Qt::SkipEmptyParts));
    }
    return tags;
}

} // anonymous namespace

JournalCli::JournalCli(EntryStore& store, const ProgramConfig& config,
                       std::ostream& out, std::ostream& err)
    : m_store(store)
    , m_config(config)
    , m_out(out)
    , m_err(err) {
}

std::string JournalCli::usage() {
    return
        "Usage: devjournal [options] <command> [arguments]\n"
        "\n"
        "Commands:\n"
        "  add <title> <content> [--tags a,b]   Add a new journal entry\n"
        "  list [--tag t]... [--all-tags]       List entries, optionally filtered by tags\n"
        "  search <query> [--tags | --fuzzy]    Search titles, tags, or titles approximately\n"
        "  stats                                Show statistics about the journal\n"
        "  delete <id>                          Delete a journal entry by ID\n"
        "  populate                             Add the predefined example entries\n"
        "\n"
        "Options:\n"
        "  -f, --journal-file <path>            Journal file to use\n"
        "  -c, --config-directory <path>        Configuration directory path\n"
        "  -V, --verbose                        Log debug output to the console\n"
        "  -h, --help                           Show this help\n"
        "  -v, --version                        Show the version\n";
}

std::string JournalCli::summary(const JournalEntry& entry) {
    const QString tags = entry.tags.isEmpty() ? QStringLiteral("No tags") : entry.tags.join(", ");

    std::string text;
    text += LINE_SEPARATOR + "\n";
    text += entry.title.toUpper().toStdString() + ". -- " + entry.date.toStdString() + "\n";
    text += "ID: " + entry.id.toStdString() + "\n";
    text += "Tags: " + tags.toStdString() + "\n";
    text += LINE_SEPARATOR + "\n";
    text += entry.content.toStdString();
    return text;
}

int JournalCli::run(const QStringList& arguments) {
    if (arguments.isEmpty()) {
        m_err << usage();
        return ExitUsage;
    }

    const QString command = arguments.first();
    const QStringList rest = arguments.mid(1);

    const std::map<QString, std::function<int(const QStringList&)>> commands = {
        {"add", [this](const QStringList& args) { return runAdd(args); }},
        {"list", [this](const QStringList& args) { return runList(args); }},
        {"search", [this](const QStringList& args) { return runSearch(args); }},
        {"stats", [this](const QStringList& args) { return runStats(args); }},
        {"delete", [this](const QStringList& args) { return runDelete(args); }},
        {"populate", [this](const QStringList& args) { return runPopulate(args); }},
    };

    auto it = commands.find(command);
    if (it == commands.end()) {
        m_err << "Unknown command: " << command.toStdString() << "\n\n" << usage();
        return ExitUsage;
    }

    spdlog::debug("Running command: {}", command.toStdString());

    try {
        return it->second(rest);
    } catch (const ValidationError& e) {
        m_err << "Failed to " << command.toStdString() << ". Reason: " << e.what() << "\n";
        return ExitValidation;
    } catch (const NotFoundError& e) {
        m_err << "Failed to " << command.toStdString() << ". Reason: " << e.what() << "\n";
        return ExitNotFound;
    } catch (const StoreIoError& e) {
        spdlog::error("Storage failure: {}", e.what());
        m_err << "Storage error: " << e.what() << "\n";
        return ExitStorage;
    } catch (const MalformedStoreError& e) {
        m_err << "Storage error: " << e.what() << "\n";
        return ExitStorage;
    } catch (const std::invalid_argument& e) {
        m_err << "Error: " << e.what() << "\n";
        return ExitUsage;
    }
}

std::vector<JournalEntry> JournalCli::loadEntries() {
    LoadResult result = m_store.load();
    if (result.status == LoadStatus::Malformed) {
        m_err << "Warning: journal file " << m_store.path().string()
              << " could not be read (" << result.error << "); treating it as empty.\n";
        return {};
    }
    return result.orThrow();
}

void JournalCli::printEntries(const std::vector<JournalEntry>& entries) {
    for (const auto& entry : entries) {
        m_out << summary(entry) << "\n";
    }
    m_out << LINE_SEPARATOR << "\nTotal entries: " << entries.size() << "\n";
}

int JournalCli::runAdd(const QStringList& arguments) {
    QCommandLineParser parser;
    QCommandLineOption tagsOption(QStringList() << "t" << "tags",
                                  "Tags (comma separated, repeatable)", "tags");
    parser.addOption(tagsOption);
    if (!parseArguments(parser, "add", arguments, m_err)) {
        return ExitUsage;
    }
    if (parser.isSet(helpOption)) {
        m_out << "Usage: devjournal add <title> <content> [--tags a,b]\n";
        return ExitSuccess;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 2) {
        m_err << "Error: add expects <title> <content>\n";
        return ExitUsage;
    }

    JournalEntry entry = m_store.add(positional[0], positional[1],
                                     splitTags(parser.values(tagsOption)));
    m_out << "Journal entry '" << entry.title.toStdString() << "' saved with ID "
          << entry.id.toStdString() << ".\n";
    return ExitSuccess;
}

int JournalCli::runList(const QStringList& arguments) {
    QCommandLineParser parser;
    QCommandLineOption tagOption(QStringList() << "t" << "tag",
                                 "Filter entries by tag (repeatable)", "tag");
    QCommandLineOption allTagsOption("all-tags", "Require every --tag instead of any");
    parser.addOption(tagOption);
    parser.addOption(allTagsOption);
    if (!parseArguments(parser, "list", arguments, m_err)) {
        return ExitUsage;
    }
    if (parser.isSet(helpOption)) {
        m_out << "Usage: devjournal list [--tag t]... [--all-tags]\n";
        return ExitSuccess;
    }
    if (!parser.positionalArguments().isEmpty()) {
        m_err << "Error: list takes no positional arguments\n";
        return ExitUsage;
    }

    const std::vector<JournalEntry> entries = loadEntries();
    if (entries.empty()) {
        m_out << "No journal entries found.\n";
        return ExitSuccess;
    }

    const QStringList tags = splitTags(parser.values(tagOption));
    if (tags.isEmpty()) {
        printEntries(entries);
        return ExitSuccess;
    }

    const TagMatch mode = parser.isSet(allTagsOption) ? TagMatch::All : TagMatch::Any;
    const auto filtered = QueryEngine::filterByTags(entries, tags, mode);
    if (filtered.empty()) {
        m_out << "No journal entries found with tags: " << tags.join(", ").toStdString() << "\n";
        return ExitSuccess;
    }

    m_out << "Found " << filtered.size() << " entries with tags: "
          << tags.join(", ").toStdString() << "\n";
    printEntries(filtered);
    return ExitSuccess;
}

int JournalCli::runSearch(const QStringList& arguments) {
    QCommandLineParser parser;
    QCommandLineOption tagsOption("tags", "Search in tags");
    QCommandLineOption fuzzyOption("fuzzy", "Approximate title search");
    parser.addOption(tagsOption);
    parser.addOption(fuzzyOption);
    if (!parseArguments(parser, "search", arguments, m_err)) {
        return ExitUsage;
    }
    if (parser.isSet(helpOption)) {
        m_out << "Usage: devjournal search <query> [--tags | --fuzzy]\n";
        return ExitSuccess;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        m_err << "Error: search expects <query>\n";
        return ExitUsage;
    }
    if (parser.isSet(tagsOption) && parser.isSet(fuzzyOption)) {
        m_err << "Error: --tags and --fuzzy cannot be combined\n";
        return ExitUsage;
    }

    const std::vector<JournalEntry> entries = loadEntries();
    if (entries.empty()) {
        m_out << "No journal entries found.\n";
        return ExitSuccess;
    }

    const QString& query = positional.first();
    std::vector<JournalEntry> found;
    std::string label;
    if (parser.isSet(tagsOption)) {
        found = QueryEngine::searchByTag(entries, query);
        label = "tag";
    } else if (parser.isSet(fuzzyOption)) {
        found = QueryEngine::fuzzySearchEntries(entries, query,
                                                m_config.fuzzyMaxResults, m_config.fuzzyCutoff);
        label = "title close to";
    } else {
        found = QueryEngine::searchByTitle(entries, query);
        label = "title";
    }

    if (found.empty()) {
        m_out << "No journal entries found with " << label << " '" << query.toStdString() << "'\n";
        return ExitSuccess;
    }

    m_out << "\n" << LINE_SEPARATOR_DOUBLE << "\n";
    m_out << "Found entries with " << label << " '" << query.toStdString() << "'\n";
    printEntries(found);
    m_out << LINE_SEPARATOR_DOUBLE << "\n";
    return ExitSuccess;
}

int JournalCli::runStats(const QStringList& arguments) {
    QCommandLineParser parser;
    if (!parseArguments(parser, "stats", arguments, m_err)) {
        return ExitUsage;
    }
    if (parser.isSet(helpOption)) {
        m_out << "Usage: devjournal stats\n";
        return ExitSuccess;
    }

    const std::vector<JournalEntry> entries = loadEntries();
    if (entries.empty()) {
        m_out << "No journal entries found.\n";
        return ExitSuccess;
    }

    const JournalStats stats = QueryEngine::stats(entries);
    m_out << "Total entries: " << stats.count << "\n";
    m_out << "Total tags: " << stats.distinctTagCount << "\n";
    m_out << "Most common tag: "
          << (stats.mostCommonTag ? stats.mostCommonTag->toStdString() : std::string("none")) << "\n";
    m_out << "Total words: " << stats.totalWords << "\n";
    if (stats.avgWordsPerEntry) {
        m_out << "Average words per entry: "
              << QString::number(*stats.avgWordsPerEntry, 'f', 2).toStdString() << "\n";
    }
    return ExitSuccess;
}

int JournalCli::runDelete(const QStringList& arguments) {
    QCommandLineParser parser;
    if (!parseArguments(parser, "delete", arguments, m_err)) {
        return ExitUsage;
    }
    if (parser.isSet(helpOption)) {
        m_out << "Usage: devjournal delete <id>\n";
        return ExitSuccess;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        m_err << "Error: delete expects <id>\n";
        return ExitUsage;
    }

    m_store.remove(positional.first());
    m_out << "Journal entry '" << positional.first().toStdString() << "' deleted.\n";
    return ExitSuccess;
}

int JournalCli::runPopulate(const QStringList& arguments) {
    QCommandLineParser parser;
    if (!parseArguments(parser, "populate", arguments, m_err)) {
        return ExitUsage;
    }
    if (parser.isSet(helpOption)) {
        m_out << "Usage: devjournal populate\n";
        return ExitSuccess;
    }

    // Report bad seeds individually, then write the rest in one locked batch
    std::vector<EntryDraft> accepted;
    int failures = 0;
    for (const auto& seed : seedEntries()) {
        try {
            JournalEntry::validate(seed.title, seed.content);
            accepted.push_back(seed);
        } catch (const ValidationError& e) {
            ++failures;
            m_err << "Failed to add journal entry '" << seed.title.toStdString()
                  << "'. Reason: " << e.what() << "\n";
        }
    }

    if (!accepted.empty()) {
        for (const auto& entry : m_store.addAll(accepted)) {
            m_out << "Journal entry '" << entry.title.toStdString() << "' saved.\n";
        }
    }
    return failures == 0 ? ExitSuccess : ExitValidation;
}

} // namespace devjournal
