// EN: Unit tests for CliParser - option forms, typed values, defaults and configuration overrides
// FR: Tests unitaires de CliParser - formes d'options, valeurs typées, défauts et surcharges de configuration

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "infrastructure/cli/cli_parser.hpp"
#include "infrastructure/logging/logger.hpp"

using namespace PRR;
using namespace PRR::CLI;
using ::testing::HasSubstr;

class CliParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        ConfigManager::getInstance().reset();
        parser_.addOptions({
            {"config", 'c', CliOptionType::STRING, "Configuration file", "", std::nullopt},
            {"workers", 'w', CliOptionType::INTEGER, "Reconcile workers", "controller.workers", std::nullopt},
            {"log-level", std::nullopt, CliOptionType::STRING, "Log level", "logging.level", std::string("info")},
            {"dry-run", 'n', CliOptionType::BOOLEAN, "Print without writing", "", std::nullopt},
        });
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }

    CliParser parser_{"prrctl", "1.0.0"};
};

TEST_F(CliParserTest, AcceptsEveryOptionForm) {
    CliParseResult result = parser_.parse({"--config", "prr.yaml", "--workers=8", "-n"});

    EXPECT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_EQ(result.get("config"), std::optional<std::string>("prr.yaml"));
    EXPECT_EQ(result.get("workers"), std::optional<std::string>("8"));
    EXPECT_EQ(result.get("dry-run"), std::optional<std::string>("true"));
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(CliParserTest, ShortOptionTakesNextArgument) {
    CliParseResult result = parser_.parse({"-c", "other.yaml", "-w", "2"});

    EXPECT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_EQ(result.get("config"), std::optional<std::string>("other.yaml"));
    EXPECT_EQ(result.get("workers"), std::optional<std::string>("2"));
}

TEST_F(CliParserTest, DefaultsFillMissingOptions) {
    CliParseResult result = parser_.parse(std::vector<std::string>{});

    EXPECT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_EQ(result.get("log-level"), std::optional<std::string>("info"));
    EXPECT_FALSE(result.has("config"));
    EXPECT_FALSE(result.get("workers").has_value());
    // EN: Defaults are not configuration overrides.
    // FR: Les défauts ne sont pas des surcharges de configuration.
    EXPECT_TRUE(result.overrides.empty());
}

TEST_F(CliParserTest, HelpAndVersionStopParsing) {
    EXPECT_EQ(parser_.parse({"--workers", "2", "--help"}).status, CliParseStatus::HELP_REQUESTED);
    EXPECT_EQ(parser_.parse({"-h", "--bogus"}).status, CliParseStatus::HELP_REQUESTED);
    EXPECT_EQ(parser_.parse({"--version"}).status, CliParseStatus::VERSION_REQUESTED);
    EXPECT_EQ(parser_.generateVersionText(), "prrctl 1.0.0");
}

TEST_F(CliParserTest, ErrorsAreReported) {
    CliParseResult unknown = parser_.parse({"--bogus"});
    EXPECT_EQ(unknown.status, CliParseStatus::INVALID_OPTION);
    EXPECT_EQ(unknown.errors, (std::vector<std::string>{"Unknown option: --bogus"}));

    CliParseResult missing = parser_.parse({"--config"});
    EXPECT_EQ(missing.status, CliParseStatus::MISSING_VALUE);
    EXPECT_EQ(missing.errors[0], "Missing value for --config");

    CliParseResult invalid = parser_.parse({"--workers", "many"});
    EXPECT_EQ(invalid.status, CliParseStatus::INVALID_VALUE);
    EXPECT_EQ(invalid.errors[0], "Invalid value for --workers: many");

    EXPECT_EQ(parser_.parse({"--dry-run=maybe"}).status, CliParseStatus::INVALID_VALUE);
    EXPECT_EQ(parser_.parse({"positional"}).status, CliParseStatus::INVALID_OPTION);
}

TEST_F(CliParserTest, OverridesLandInConfiguration) {
    CliParseResult result = parser_.parse({"--workers", "6", "--log-level", "debug", "--config", "x.yaml"});
    ASSERT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_EQ(result.overrides.size(), 2u);

    ConfigManager& config = ConfigManager::getInstance();
    EXPECT_EQ(CliParser::applyOverrides(result, config), 2u);

    EXPECT_EQ(config.get("controller", "workers").as<int>(), 6);
    EXPECT_EQ(config.get("logging", "level").as<std::string>(), "debug");
}

TEST_F(CliParserTest, OverrideWithoutSectionIsSkipped) {
    parser_.addOption({"namespace", std::nullopt, CliOptionType::STRING, "Namespace", "namespace", std::nullopt});
    CliParseResult result = parser_.parse({"--namespace", "ci"});

    EXPECT_EQ(CliParser::applyOverrides(result, ConfigManager::getInstance()), 0u);
}

TEST_F(CliParserTest, RedefiningAnOptionReplacesIt) {
    parser_.addOption({"workers", 'w', CliOptionType::STRING, "Workers as text", "", std::nullopt});

    CliParseResult result = parser_.parse({"-w", "many"});
    EXPECT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_TRUE(result.overrides.empty());
}

TEST_F(CliParserTest, HelpTextListsOptions) {
    std::string help = parser_.generateHelpText();

    EXPECT_THAT(help, HasSubstr("Usage: prrctl [OPTIONS]"));
    EXPECT_THAT(help, HasSubstr("-c, --config VALUE"));
    EXPECT_THAT(help, HasSubstr("-w, --workers N"));
    EXPECT_THAT(help, HasSubstr("Log level (default: info)"));
    EXPECT_THAT(help, HasSubstr("-h, --help"));
}

TEST_F(CliParserTest, ValueParsing) {
    using CliParserUtils::parseCliValue;

    EXPECT_EQ(parseCliValue("42", CliOptionType::INTEGER)->as<int>(), 42);
    EXPECT_EQ(parseCliValue("-3", CliOptionType::INTEGER)->as<int>(), -3);
    EXPECT_FALSE(parseCliValue("", CliOptionType::INTEGER).has_value());
    EXPECT_FALSE(parseCliValue("4x", CliOptionType::INTEGER).has_value());
    EXPECT_FALSE(parseCliValue("0", CliOptionType::BOOLEAN)->as<bool>());
    EXPECT_TRUE(parseCliValue("true", CliOptionType::BOOLEAN)->as<bool>());
    EXPECT_EQ(parseCliValue("", CliOptionType::STRING)->as<std::string>(), "");
    EXPECT_EQ(CliParserUtils::cliParseStatusToString(CliParseStatus::MISSING_VALUE), "MISSING_VALUE");
}
