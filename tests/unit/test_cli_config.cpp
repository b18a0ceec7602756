/**
 * @file test_cli_config.cpp
 * @brief Unit tests for uuidcore-cli argument parsing
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "config.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace uuidcore::cli;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::StartsWith;

class CliConfigTest : public ::testing::Test {
protected:
    // Helper to create argc/argv from vector of strings
    std::pair<int, std::vector<char*>> makeArgs(const std::vector<std::string>& args) {
        argv_storage_.clear();
        argv_storage_.reserve(args.size());

        for (const auto& arg : args) {
            argv_storage_.push_back(std::vector<char>(arg.begin(), arg.end()));
            argv_storage_.back().push_back('\0');
        }

        argv_ptrs_.clear();
        for (auto& storage : argv_storage_) {
            argv_ptrs_.push_back(storage.data());
        }

        return {static_cast<int>(argv_ptrs_.size()), argv_ptrs_};
    }

    CliConfig parse(const std::vector<std::string>& args) {
        auto [argc, argv] = makeArgs(args);
        return parseArgs(argc, argv.data());
    }

private:
    std::vector<std::vector<char>> argv_storage_;
    std::vector<char*> argv_ptrs_;
};

// =============================================================================
// Default Values
// =============================================================================

TEST_F(CliConfigTest, DefaultValues) {
    CliConfig config;

    EXPECT_FALSE(config.json_mode);
    EXPECT_TRUE(config.color);
    EXPECT_EQ(config.log_level, "WARN");
    EXPECT_FALSE(config.help);
    EXPECT_FALSE(config.version);
    EXPECT_THAT(config.error, IsEmpty());
    EXPECT_THAT(config.command, IsEmpty());
    EXPECT_THAT(config.args, IsEmpty());
}

// =============================================================================
// Commands and Options
// =============================================================================

TEST_F(CliConfigTest, CommandOnly) {
    auto config = parse({"uuidcore-cli", "generate"});

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.command, "generate");
    EXPECT_THAT(config.args, IsEmpty());
}

TEST_F(CliConfigTest, CommandWithArgs) {
    auto config = parse({"uuidcore-cli", "parse", "6ba7b810-9dad-11d1-80b4-00c04fd430c8"});

    EXPECT_EQ(config.command, "parse");
    EXPECT_THAT(config.args, ElementsAre("6ba7b810-9dad-11d1-80b4-00c04fd430c8"));
}

TEST_F(CliConfigTest, OptionsBeforeCommand) {
    auto config = parse({"uuidcore-cli", "--json", "--no-color", "--log-level", "debug",
                         "generate", "3"});

    EXPECT_TRUE(config.json_mode);
    EXPECT_FALSE(config.color);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.command, "generate");
    EXPECT_THAT(config.args, ElementsAre("3"));
}

TEST_F(CliConfigTest, ArgumentsAfterCommandAreNotOptions) {
    auto config = parse({"uuidcore-cli", "validate", "--json"});

    EXPECT_FALSE(config.json_mode);
    EXPECT_THAT(config.error, IsEmpty());
    EXPECT_THAT(config.args, ElementsAre("--json"));
}

TEST_F(CliConfigTest, LoneDashIsACommand) {
    auto config = parse({"uuidcore-cli", "-"});
    EXPECT_EQ(config.command, "-");
}

// =============================================================================
// Help, Version and Errors
// =============================================================================

TEST_F(CliConfigTest, Help) {
    EXPECT_TRUE(parse({"uuidcore-cli", "--help"}).help);
    EXPECT_TRUE(parse({"uuidcore-cli", "-h"}).help);
    EXPECT_THAT(parse({"uuidcore-cli", "-h"}).error, IsEmpty());
}

TEST_F(CliConfigTest, Version) {
    auto config = parse({"uuidcore-cli", "--version"});
    EXPECT_TRUE(config.version);
    EXPECT_FALSE(config.help);
}

TEST_F(CliConfigTest, NoCommand) {
    auto config = parse({"uuidcore-cli"});
    EXPECT_TRUE(config.help);
    EXPECT_EQ(config.error, "No command given");

    config = parse({"uuidcore-cli", "--json"});
    EXPECT_TRUE(config.help);
    EXPECT_EQ(config.error, "No command given");
}

TEST_F(CliConfigTest, MissingLogLevelValue) {
    auto config = parse({"uuidcore-cli", "--log-level"});
    EXPECT_TRUE(config.help);
    EXPECT_EQ(config.error, "Option --log-level requires a value");
}

TEST_F(CliConfigTest, UnknownOption) {
    auto config = parse({"uuidcore-cli", "--frobnicate", "generate"});
    EXPECT_TRUE(config.help);
    EXPECT_EQ(config.error, "Unknown option --frobnicate");
    EXPECT_THAT(config.command, IsEmpty());
}

TEST_F(CliConfigTest, UsageListsCommandsAndOptions) {
    std::ostringstream os;
    printUsage("uuidcore-cli", os);
    std::string usage = os.str();

    EXPECT_THAT(usage, StartsWith("uuidcore-cli - RFC 4122 UUID tool"));
    for (const char* word : {"generate", "parse", "inspect", "validate", "nil", "max",
                             "namespace", "encode", "decode", "--json", "--log-level",
                             "--no-color", "--version", "--help"}) {
        EXPECT_THAT(usage, HasSubstr(word));
    }
}
