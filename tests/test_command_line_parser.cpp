// EN: Unit tests for the daoctl command line parser
// FR: Tests unitaires pour l'analyseur de ligne de commande de daoctl

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>
#include <vector>

#include "infrastructure/cli/command_line_parser.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

using namespace DAO;
using namespace DAO::CLI;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

// EN: Test fixture for CommandLineParser tests
// FR: Fixture de test pour les tests CommandLineParser
class CommandLineParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().reset();
        Logger::getInstance().setConsoleOutput(false);
        parser_.addStandardOptions();
        parser_.addCommand("patch", "Apply OS package updates");
        parser_.addCommand("status <action>", "Print the last status token");
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
        Logger::getInstance().reset();
    }

    CommandLineParser parser_{"daoctl"};
};

TEST_F(CommandLineParserTest, CommandAndOptions) {
    auto result = parser_.parse({"--cve", "CVE-2024-6387", "isolate", "-d", "30", "--dry-run"});

    ASSERT_TRUE(result.ok());
    EXPECT_THAT(result.positional_arguments, ElementsAre("isolate"));
    EXPECT_EQ(result.overrides.at("action.cve").as<std::string>(), "CVE-2024-6387");
    EXPECT_EQ(result.overrides.at("shutdown.delay_seconds").as<int>(), 30);
    EXPECT_TRUE(result.overrides.at("execution.dry_run").as<bool>());
    EXPECT_EQ(result.parsed_options.size(), 3u);
}

TEST_F(CommandLineParserTest, InlineValueAndPositionalOperands) {
    auto result = parser_.parse({"status", "--base-dir=/var/lib/dao", "patch"});

    ASSERT_TRUE(result.ok());
    EXPECT_THAT(result.positional_arguments, ElementsAre("status", "patch"));
    EXPECT_EQ(result.overrides.at("paths.base_dir").as<std::string>(), "/var/lib/dao");
}

// EN: Negative flags store false into their configuration path
// FR: Les drapeaux négatifs stockent false dans leur chemin de configuration
TEST_F(CommandLineParserTest, NegativeFlagsStoreFalse) {
    auto result = parser_.parse({"--no-sudo", "--no-lock", "-q", "patch"});

    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.overrides.at("execution.use_sudo").as<bool>());
    EXPECT_FALSE(result.overrides.at("execution.exclusive_lock").as<bool>());
    EXPECT_FALSE(result.overrides.at("logging.console").as<bool>());
}

TEST_F(CommandLineParserTest, DoubleDashEndsOptions) {
    auto result = parser_.parse({"--", "--not-an-option"});
    ASSERT_TRUE(result.ok());
    EXPECT_THAT(result.positional_arguments, ElementsAre("--not-an-option"));
}

TEST_F(CommandLineParserTest, HelpAndVersion) {
    auto help = parser_.parse({"patch", "--help"});
    EXPECT_EQ(help.status, CliParseStatus::HELP_REQUESTED);
    EXPECT_THAT(help.help_text, HasSubstr("Usage: daoctl"));
    EXPECT_THAT(help.help_text, HasSubstr("status <action>"));
    EXPECT_THAT(help.help_text, HasSubstr("--dry-run"));
    EXPECT_THAT(help.help_text, ::testing::Not(HasSubstr("--version")));

    auto version = parser_.parse({"-V"});
    EXPECT_EQ(version.status, CliParseStatus::VERSION_REQUESTED);
    EXPECT_THAT(version.version_text, HasSubstr("daoctl"));
}

TEST_F(CommandLineParserTest, UnknownOption) {
    auto result = parser_.parse({"--force", "patch"});
    EXPECT_EQ(result.status, CliParseStatus::INVALID_OPTION);
    EXPECT_THAT(result.errors, ElementsAre("Unknown option: --force"));
}

TEST_F(CommandLineParserTest, MissingValue) {
    auto result = parser_.parse({"patch", "--cve"});
    EXPECT_EQ(result.status, CliParseStatus::MISSING_VALUE);
}

TEST_F(CommandLineParserTest, DelayOutOfRange) {
    auto result = parser_.parse({"shutdown", "--delay", "7200"});
    EXPECT_EQ(result.status, CliParseStatus::INVALID_VALUE);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_THAT(result.errors[0], HasSubstr("Value must be <= 3600"));

    auto not_a_number = parser_.parse({"shutdown", "--delay", "10s"});
    EXPECT_EQ(not_a_number.status, CliParseStatus::INVALID_VALUE);
}

TEST_F(CommandLineParserTest, LogLevelMustBeKnown) {
    auto result = parser_.parse({"--log-level", "trace", "patch"});
    EXPECT_EQ(result.status, CliParseStatus::INVALID_VALUE);
    EXPECT_THAT(result.errors[0], HasSubstr("Value must be one of"));
}

TEST_F(CommandLineParserTest, BooleanFlagRejectsValue) {
    auto result = parser_.parse({"--dry-run=false", "patch"});
    EXPECT_EQ(result.status, CliParseStatus::INVALID_VALUE);
}

// EN: Only "section.key" paths reach the configuration; internal paths stay on the result
// FR: Seuls les chemins "section.cle" atteignent la configuration ; les chemins internes restent dans le résultat
TEST_F(CommandLineParserTest, ApplyOverridesSkipsInternalPaths) {
    auto result = parser_.parse({"--json", "-c", "/etc/dao/dao.yaml", "--delay", "5", "shutdown"});
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.has("_json"));
    EXPECT_TRUE(result.has("_config_file"));

    auto& config = ConfigManager::getInstance();
    config.reset();
    EXPECT_EQ(CommandLineParser::applyOverrides(result, config), 1u);
    EXPECT_EQ(config.get("shutdown", "delay_seconds").as<int>(), 5);
    EXPECT_FALSE(config.has("_json", "value"));
}

TEST_F(CommandLineParserTest, DuplicateOptionRejected) {
    CliOptionDefinition duplicate;
    duplicate.long_name = "cve";
    duplicate.config_path = "action.cve";
    EXPECT_THROW(parser_.addOption(duplicate), std::invalid_argument);
}

TEST_F(CommandLineParserTest, UtilityHelpers) {
    EXPECT_TRUE(CommandLineUtils::isLongOption("--delay"));
    EXPECT_FALSE(CommandLineUtils::isLongOption("-d"));
    EXPECT_TRUE(CommandLineUtils::isShortOption("-d"));
    EXPECT_EQ(CommandLineUtils::extractOptionName("--base-dir=/tmp"), "base-dir");
    EXPECT_EQ(CommandLineUtils::cliParseStatusToString(CliParseStatus::MISSING_VALUE), "MISSING_VALUE");
}

// EN: Main function for running tests
// FR: Fonction principale pour exécuter les tests
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
