/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading and command line overrides
 *
 * ## Test Coverage
 *
 * ### Environment (5 tests)
 * - DefaultsWithoutVariables
 * - ReadsAllVariables
 * - BooleanConventions: INCLUDE_HIDDEN off only for 0/false/False,
 *   READ_BINARY on only for 1/true/True
 * - EmptyExcludesDisablesPatterns
 * - MalformedMaxBytesThrows
 *
 * ### Finalize (4 tests)
 * - FinalizeResolvesRoot
 * - FinalizeRejectsMissingRoot
 * - FinalizeRejectsFileRoot
 * - FinalizeAppendsIgnoreFile
 *
 * ### Command line (4 tests)
 * - CommandLineOverridesEnvironment
 * - ExportFlagsOnlyWhenEnabled
 * - MissingValueThrows
 * - UsageListsExportFlags
 *
 * ### Logging (1 test)
 * - UnknownLogLevelThrows
 *
 * @note The environment is simulated with a lookup lambda; the process
 *       environment is never modified
 *
 * @see Config
 * @see applyCommandLine()
 */

#include <gtest/gtest.h>
#include "commandline.hpp"
#include "config.hpp"
#include "logging.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @class ConfigTest
 * @brief Fixture with a fake environment and a temporary root directory
 */
class ConfigTest : public ::testing::Test {
protected:
    /** @brief Variables visible to Config::fromEnvironment() */
    std::map<std::string, std::string> env;

    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   (std::string("filetree_config_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    Config load() {
        return Config::fromEnvironment(
            [this](const std::string &name) -> std::optional<std::string> {
                auto it = env.find(name);
                if (it == env.end())
                    return std::nullopt;
                return it->second;
            });
    }

    void createFile(const std::string &name, const std::string &content) {
        std::ofstream file(test_dir / name);
        file << content;
    }
};

TEST_F(ConfigTest, DefaultsWithoutVariables) {
    Config config = load();

    EXPECT_EQ(config.root, fs::path("."));
    EXPECT_EQ(config.output_file, "FILETREE.md");
    EXPECT_EQ(config.excludes, Config::defaultExcludes());
    EXPECT_TRUE(config.include_hidden);
    EXPECT_EQ(config.max_bytes, 300000u);
    EXPECT_FALSE(config.read_binary);
    EXPECT_EQ(config.select_color, "green");
    EXPECT_EQ(config.unselect_color, "grey50");
    EXPECT_EQ(config.icon_selected, "◉");
    EXPECT_EQ(config.icon_unselected, "◯");
    EXPECT_EQ(config.icon_mixed, "◐");
    EXPECT_EQ(config.log_level, "warn");
}

/**
 * @test ReadsAllVariables
 * @brief Every recognised variable reaches its Config field
 */
TEST_F(ConfigTest, ReadsAllVariables) {
    env = {{"ROOT_DIR", "/srv/code"},
           {"OUTPUT", "TREE.md"},
           {"EXCLUDES", " build, *.o ,,dist "},
           {"INCLUDE_HIDDEN", "0"},
           {"MAX_BYTES", " 1024 "},
           {"READ_BINARY", "true"},
           {"SELECT_COLOR", " Cyan "},
           {"UNSELECT_COLOR", "GREY70"},
           {"ICON_SELECTED", "[x]"},
           {"ICON_UNSELECTED", "[ ]"},
           {"ICON_MIXED", "[-]"},
           {"LOG_FILE", "/tmp/filetree.log"},
           {"LOG_LEVEL", "DEBUG"}};

    Config config = load();

    EXPECT_EQ(config.root, fs::path("/srv/code"));
    EXPECT_EQ(config.output_file, "TREE.md");
    EXPECT_EQ(config.excludes, (std::vector<std::string>{"build", "*.o", "dist"}));
    EXPECT_FALSE(config.include_hidden);
    EXPECT_EQ(config.max_bytes, 1024u);
    EXPECT_TRUE(config.read_binary);
    EXPECT_EQ(config.select_color, "cyan");
    EXPECT_EQ(config.unselect_color, "grey70");
    EXPECT_EQ(config.icon_selected, "[x]");
    EXPECT_EQ(config.icon_unselected, "[ ]");
    EXPECT_EQ(config.icon_mixed, "[-]");
    EXPECT_EQ(config.log_file, "/tmp/filetree.log");
    EXPECT_EQ(config.log_level, "debug");
}

/**
 * @test BooleanConventions
 * @brief Unrecognised words keep each flag at its default
 */
TEST_F(ConfigTest, BooleanConventions) {
    env = {{"INCLUDE_HIDDEN", "no"}, {"READ_BINARY", "yes"}};
    Config config = load();
    EXPECT_TRUE(config.include_hidden);
    EXPECT_FALSE(config.read_binary);

    env = {{"INCLUDE_HIDDEN", "False"}, {"READ_BINARY", "1"}};
    config = load();
    EXPECT_FALSE(config.include_hidden);
    EXPECT_TRUE(config.read_binary);
}

TEST_F(ConfigTest, EmptyExcludesDisablesPatterns) {
    env = {{"EXCLUDES", ""}};
    EXPECT_TRUE(load().excludes.empty());
}

TEST_F(ConfigTest, MalformedMaxBytesThrows) {
    env = {{"MAX_BYTES", "12kb"}};
    EXPECT_THROW(load(), ConfigError);

    env = {{"MAX_BYTES", "-5"}};
    EXPECT_THROW(load(), ConfigError);

    EXPECT_EQ(parseByteLimit("0", "test"), 0u);
}

/**
 * @test FinalizeResolvesRoot
 * @brief finalize() makes root canonical, so "dir/sub/.." becomes "dir"
 */
TEST_F(ConfigTest, FinalizeResolvesRoot) {
    fs::create_directories(test_dir / "sub");

    Config config;
    config.root = test_dir / "sub" / "..";
    config.finalize();

    EXPECT_TRUE(config.root.is_absolute());
    EXPECT_EQ(config.root, fs::canonical(test_dir));
    EXPECT_EQ(config.outputPath(), fs::canonical(test_dir) / "FILETREE.md");
}

TEST_F(ConfigTest, FinalizeRejectsMissingRoot) {
    Config config;
    config.root = test_dir / "missing";
    EXPECT_THROW(config.finalize(), ConfigError);
}

TEST_F(ConfigTest, FinalizeRejectsFileRoot) {
    createFile("plain.txt", "x");

    Config config;
    config.root = test_dir / "plain.txt";
    EXPECT_THROW(config.finalize(), ConfigError);
}

/**
 * @test FinalizeAppendsIgnoreFile
 * @brief Patterns from .filetreeignore follow the configured ones
 *
 * Comment lines and blank lines are skipped, entries are trimmed.
 */
TEST_F(ConfigTest, FinalizeAppendsIgnoreFile) {
    createFile(Config::IGNORE_FILE_NAME, "# generated\n"
                                         "build\n"
                                         "\n"
                                         "  *.log  \n");

    Config config;
    config.root = test_dir;
    config.excludes = {".git"};
    config.finalize();

    EXPECT_EQ(config.excludes,
              (std::vector<std::string>{".git", "build", "*.log"}));
    EXPECT_TRUE(readIgnoreFile(test_dir / "absent").empty());
}

/**
 * @test CommandLineOverridesEnvironment
 * @brief Options are applied on top of the environment values
 */
TEST_F(ConfigTest, CommandLineOverridesEnvironment) {
    env = {{"ROOT_DIR", "/from/env"}, {"INCLUDE_HIDDEN", "0"}};
    Config config = load();

    auto options = applyCommandLine(
        config,
        {"-p", "/from/args", "-o", "out.md", "-e", "*.tmp", "--hidden",
         "--max-bytes", "64", "--binary"},
        false);

    EXPECT_FALSE(options.show_help);
    EXPECT_EQ(config.root, fs::path("/from/args"));
    EXPECT_EQ(config.output_file, "out.md");
    EXPECT_EQ(config.excludes.back(), "*.tmp");
    EXPECT_TRUE(config.include_hidden);
    EXPECT_EQ(config.max_bytes, 64u);
    EXPECT_TRUE(config.read_binary);
}

TEST_F(ConfigTest, ExportFlagsOnlyWhenEnabled) {
    Config config;

    EXPECT_THROW(applyCommandLine(config, {"--stdout"}, false), ConfigError);

    auto options = applyCommandLine(
        config, {"-u", "--stdout", "-x", "src/b.bin", "--deselect", "docs"},
        true);
    EXPECT_TRUE(options.include_unselected);
    EXPECT_TRUE(options.to_stdout);
    EXPECT_EQ(options.deselect,
              (std::vector<std::string>{"src/b.bin", "docs"}));
}

TEST_F(ConfigTest, MissingValueThrows) {
    Config config;
    EXPECT_THROW(applyCommandLine(config, {"-p"}, false), ConfigError);
    EXPECT_THROW(applyCommandLine(config, {"--max-bytes", "lots"}, false),
                 ConfigError);
    EXPECT_THROW(applyCommandLine(config, {"--frobnicate"}, true), ConfigError);
}

TEST_F(ConfigTest, UsageListsExportFlags) {
    EXPECT_EQ(usage("filetree", false).find("--stdout"), std::string::npos);
    EXPECT_NE(usage("filetree-cli", true).find("--stdout"), std::string::npos);
    EXPECT_NE(usage("filetree-cli", true).find("--deselect"),
              std::string::npos);
}

TEST_F(ConfigTest, UnknownLogLevelThrows) {
    Config config;
    config.log_level = "chatty";
    EXPECT_THROW(setupLogging(config, LogTarget::FileOnly), ConfigError);

    config.log_level = "off";
    EXPECT_NO_THROW(setupLogging(config, LogTarget::FileOnly));
}
