/**
 * DevJournal - Global Option Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include "cli/GlobalOptions.hpp"

using namespace devjournal;

namespace {

std::optional<GlobalOptions> parse(const QStringList& arguments) {
    std::string error;
    return parseGlobalOptions(QStringList() << "devjournal" << arguments, error);
}

} // anonymous namespace

TEST(GlobalOptionsTest, VerboseAndJournalFileAreRecognised) {
    auto options = parse({"--verbose", "-f", "/tmp/notes.json", "list", "--tag", "x"});

    ASSERT_TRUE(options.has_value());
    EXPECT_TRUE(options->verbose);
    EXPECT_FALSE(options->versionRequested);
    ASSERT_TRUE(options->journalFile.has_value());
    EXPECT_EQ(*options->journalFile, std::filesystem::path("/tmp/notes.json"));
    EXPECT_EQ(options->command, QStringList({"list", "--tag", "x"}));
}

TEST(GlobalOptionsTest, ShortVerboseIsDistinctFromVersion) {
    auto verbose = parse({"-V", "stats"});
    ASSERT_TRUE(verbose.has_value());
    EXPECT_TRUE(verbose->verbose);
    EXPECT_FALSE(verbose->versionRequested);
    EXPECT_EQ(verbose->command, QStringList({"stats"}));

    auto version = parse({"-v"});
    ASSERT_TRUE(version.has_value());
    EXPECT_TRUE(version->versionRequested);
    EXPECT_FALSE(version->verbose);
}

TEST(GlobalOptionsTest, ConfigDirectoryIsRecognised) {
    auto options = parse({"--config-directory", "/tmp/devjournal-config", "stats"});

    ASSERT_TRUE(options.has_value());
    ASSERT_TRUE(options->configDirectory.has_value());
    EXPECT_EQ(*options->configDirectory, std::filesystem::path("/tmp/devjournal-config"));
    EXPECT_FALSE(options->journalFile.has_value());
    EXPECT_FALSE(options->verbose);
}

TEST(GlobalOptionsTest, OptionsAfterTheCommandBelongToTheCommand) {
    auto options = parse({"add", "Title", "Body", "-v", "-f", "x"});

    ASSERT_TRUE(options.has_value());
    EXPECT_FALSE(options->versionRequested);
    EXPECT_FALSE(options->journalFile.has_value());
    EXPECT_EQ(options->command, QStringList({"add", "Title", "Body", "-v", "-f", "x"}));
}

TEST(GlobalOptionsTest, NoCommandLeavesCommandEmpty) {
    auto options = parse({});

    ASSERT_TRUE(options.has_value());
    EXPECT_TRUE(options->command.isEmpty());
    EXPECT_FALSE(options->helpRequested);
}

TEST(GlobalOptionsTest, HelpIsRecognised) {
    auto options = parse({"--help"});

    ASSERT_TRUE(options.has_value());
    EXPECT_TRUE(options->helpRequested);
}

TEST(GlobalOptionsTest, UnknownOptionOrMissingValueIsAnError) {
    std::string error;
    EXPECT_FALSE(parseGlobalOptions({"devjournal", "--bogus", "list"}, error).has_value());
    EXPECT_NE(error.find("bogus"), std::string::npos);

    error.clear();
    EXPECT_FALSE(parseGlobalOptions({"devjournal", "-f"}, error).has_value());
    EXPECT_FALSE(error.empty());
}
