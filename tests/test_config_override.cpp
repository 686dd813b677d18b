// EN: Unit tests for the acectl command line parser and its override mapping.
// FR: Tests unitaires du parseur de ligne de commande acectl et de son mapping de surcharges.

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "infrastructure/cli/config_override.hpp"
#include "infrastructure/config/config_manager.hpp"

using namespace ACE;
using namespace ACE::CLI;

class ConfigOverrideParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        parser_ = std::make_unique<ConfigOverrideParser>();
        parser_->addConsolidationOptions();
    }

    CliParseResult parse(const std::vector<std::string>& args) {
        return parser_->parse(args);
    }

    std::unique_ptr<ConfigOverrideParser> parser_;
};

// EN: Long and short forms map to the same configuration path
// FR: Les formes longue et courte pointent vers le même chemin de configuration
TEST_F(ConfigOverrideParserTest, DatabasePathLongAndShort) {
    auto long_form = parse({"--db", "/data/archive.db"});
    ASSERT_EQ(long_form.status, CliParseStatus::SUCCESS);
    EXPECT_EQ(long_form.overrides.at("database.path").as<std::string>(), "/data/archive.db");

    auto short_form = parse({"-d", "/data/other.db"});
    ASSERT_EQ(short_form.status, CliParseStatus::SUCCESS);
    EXPECT_EQ(short_form.overrides.at("database.path").as<std::string>(), "/data/other.db");
}

// EN: Flags store their configured value without consuming the next argument
// FR: Les drapeaux stockent leur valeur sans consommer l'argument suivant
TEST_F(ConfigOverrideParserTest, FlagsStoreTheirValue) {
    auto result = parse({"--dry-run", "--no-backup", "--db", "a.db"});
    ASSERT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_TRUE(result.overrides.at("run.dry_run").as<bool>());
    EXPECT_FALSE(result.overrides.at("backup.enabled").as<bool>());
    EXPECT_EQ(result.overrides.at("database.path").as<std::string>(), "a.db");
    EXPECT_EQ(result.parsed_options.size(), 3u);
}

TEST_F(ConfigOverrideParserTest, MinimumConfidenceParsedAsDouble) {
    auto result = parse({"--min-confidence", "97.5"});
    ASSERT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_DOUBLE_EQ(result.overrides.at("scoring.min_confidence").as<double>(), 97.5);
}

// EN: Out of range and non numeric confidences are rejected differently
// FR: Les confiances hors plage et non numériques sont rejetées différemment
TEST_F(ConfigOverrideParserTest, MinimumConfidenceValidation) {
    auto too_high = parse({"--min-confidence", "150"});
    EXPECT_EQ(too_high.status, CliParseStatus::CONSTRAINT_VIOLATION);
    EXPECT_EQ(too_high.overrides.count("scoring.min_confidence"), 0u);

    auto negative = parse({"--min-confidence", "-1"});
    EXPECT_EQ(negative.status, CliParseStatus::CONSTRAINT_VIOLATION);

    auto garbage = parse({"--min-confidence", "abc"});
    EXPECT_EQ(garbage.status, CliParseStatus::INVALID_VALUE);

    auto trailing = parse({"--min-confidence", "90x"});
    EXPECT_EQ(trailing.status, CliParseStatus::INVALID_VALUE);
}

TEST_F(ConfigOverrideParserTest, LogLevelMustBeKnown) {
    auto ok = parse({"--log-level", "debug"});
    ASSERT_EQ(ok.status, CliParseStatus::SUCCESS);
    EXPECT_EQ(ok.overrides.at("logging.level").as<std::string>(), "debug");

    auto bad = parse({"--log-level", "chatty"});
    EXPECT_EQ(bad.status, CliParseStatus::CONSTRAINT_VIOLATION);
    ASSERT_EQ(bad.errors.size(), 1u);
    EXPECT_NE(bad.errors[0].find("--log-level"), std::string::npos);
}

TEST_F(ConfigOverrideParserTest, UnknownOptionIsReported) {
    auto result = parse({"--db", "a.db", "--turbo"});
    EXPECT_EQ(result.status, CliParseStatus::INVALID_OPTION);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "Unknown option: --turbo");
    // EN: Options before the failure are still recorded
    // FR: Les options avant l'échec restent enregistrées
    EXPECT_EQ(result.overrides.count("database.path"), 1u);
}

TEST_F(ConfigOverrideParserTest, MissingValueIsReported) {
    auto result = parse({"--db"});
    EXPECT_EQ(result.status, CliParseStatus::MISSING_VALUE);
    EXPECT_TRUE(result.overrides.empty());
}

// EN: The first failure keeps deciding the status
// FR: Le premier échec continue de déterminer le statut
TEST_F(ConfigOverrideParserTest, FirstFailureWins) {
    auto result = parse({"--bogus", "--min-confidence", "500"});
    EXPECT_EQ(result.status, CliParseStatus::INVALID_OPTION);
    EXPECT_EQ(result.errors.size(), 2u);
}

TEST_F(ConfigOverrideParserTest, PositionalArgumentsAreWarnings) {
    auto result = parse({"archive.db", "--dry-run"});
    EXPECT_EQ(result.status, CliParseStatus::SUCCESS);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0], "Unknown positional argument: archive.db");
}

TEST_F(ConfigOverrideParserTest, HelpAndVersionShortCircuit) {
    auto help = parse({"--db", "a.db", "-h", "--bogus"});
    EXPECT_EQ(help.status, CliParseStatus::HELP_REQUESTED);
    EXPECT_NE(help.help_text.find("Usage: acectl --db PATH [OPTIONS]"), std::string::npos);
    EXPECT_TRUE(help.errors.empty());

    auto version = parse({"--version"});
    EXPECT_EQ(version.status, CliParseStatus::VERSION_REQUESTED);
    EXPECT_EQ(version.version_text.rfind("acectl ", 0), 0u);
}

// EN: Options without a configuration path land in the argument map
// FR: Les options sans chemin de configuration vont dans la table des arguments
TEST_F(ConfigOverrideParserTest, ConfigFileIsAnArgument) {
    auto result = parse({"-c", "consolidate.yaml"});
    ASSERT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_EQ(result.arguments.at("config"), "consolidate.yaml");
    EXPECT_TRUE(result.overrides.empty());
}

TEST_F(ConfigOverrideParserTest, ArgcArgvSkipsProgramName) {
    std::vector<std::string> storage = {"acectl", "--entity-type", "Organization"};
    std::vector<char*> argv;
    for (auto& s : storage) argv.push_back(s.data());

    auto result = parser_->parse(static_cast<int>(argv.size()), argv.data());
    ASSERT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(result.overrides.at("run.entity_type").as<std::string>(), "Organization");
}

TEST_F(ConfigOverrideParserTest, HelpGroupsByCategory) {
    std::string help = parser_->generateHelpText("acectl");
    auto general = help.find("General Options:");
    auto run = help.find("Run Options:");
    auto audit = help.find("Audit Options:");
    auto logging = help.find("Logging Options:");
    ASSERT_NE(general, std::string::npos);
    ASSERT_NE(run, std::string::npos);
    ASSERT_NE(audit, std::string::npos);
    ASSERT_NE(logging, std::string::npos);
    EXPECT_LT(general, run);
    EXPECT_LT(run, audit);
    EXPECT_LT(audit, logging);
    EXPECT_NE(help.find("--min-confidence <DOUBLE>"), std::string::npos);
}

TEST_F(ConfigOverrideParserTest, VersionInfoIsConfigurable) {
    parser_->setVersionInfo("2.3.4", "test build");
    EXPECT_EQ(parser_->generateVersionText(), "acectl 2.3.4 (test build)\n");
}

TEST_F(ConfigOverrideParserTest, DuplicateOptionsThrow) {
    CliOptionDefinition dup;
    dup.long_name = "db";
    EXPECT_THROW(parser_->addOption(dup), std::invalid_argument);

    CliOptionDefinition dup_short;
    dup_short.long_name = "database";
    dup_short.short_name = 'd';
    EXPECT_THROW(parser_->addOption(dup_short), std::invalid_argument);

    CliOptionDefinition unnamed;
    EXPECT_THROW(parser_->addOption(unnamed), std::invalid_argument);
}

TEST_F(ConfigOverrideParserTest, KnowsItsOptions) {
    EXPECT_TRUE(parser_->hasOption("dry-run"));
    EXPECT_TRUE(parser_->hasOption("recount-mentions"));
    EXPECT_FALSE(parser_->hasOption("threads"));
    EXPECT_FALSE(parser_->getOptionDefinitions().empty());
}

// EN: Parsed overrides are written into the configuration manager by section
// FR: Les surcharges analysées sont écrites dans le gestionnaire par section
class ConfigOverrideApplyTest : public ConfigOverrideParserTest {
protected:
    void SetUp() override {
        ConfigOverrideParserTest::SetUp();
        ConfigManager::getInstance().reset();
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
    }
};

TEST_F(ConfigOverrideApplyTest, OverridesLandInSections) {
    auto result = parse({"--db", "/tmp/x.db", "--dry-run", "--min-confidence", "98"});
    ASSERT_EQ(result.status, CliParseStatus::SUCCESS);

    auto& manager = ConfigManager::getInstance();
    EXPECT_EQ(ConfigOverrideParser::applyOverrides(result, manager), 3u);

    EXPECT_EQ(manager.get("database", "path").as<std::string>(), "/tmp/x.db");
    EXPECT_TRUE(manager.get("run", "dry_run").as<bool>());
    EXPECT_DOUBLE_EQ(manager.get("scoring", "min_confidence").as<double>(), 98.0);
}

TEST_F(ConfigOverrideApplyTest, NothingToApply) {
    auto result = parse({"--config", "c.yaml"});
    EXPECT_EQ(ConfigOverrideParser::applyOverrides(result, ConfigManager::getInstance()), 0u);
    EXPECT_FALSE(ConfigManager::getInstance().has("database", "path"));
}

TEST(ConfigOverrideUtilsTest, OptionShapes) {
    using namespace ConfigOverrideUtils;
    EXPECT_TRUE(isShortOption("-d"));
    EXPECT_FALSE(isShortOption("-1"));
    EXPECT_FALSE(isShortOption("--db"));
    EXPECT_TRUE(isLongOption("--db"));
    EXPECT_FALSE(isLongOption("--"));
    EXPECT_FALSE(isLongOption("---x"));
    EXPECT_EQ(extractOptionName("--dry-run"), "dry-run");
    EXPECT_EQ(extractOptionName("-n"), "n");
    EXPECT_EQ(extractOptionName("plain"), "");
}

TEST(ConfigOverrideUtilsTest, ValueParsing) {
    using namespace ConfigOverrideUtils;
    EXPECT_TRUE(parseCliValue("yes", CliOptionType::BOOLEAN).as<bool>());
    EXPECT_FALSE(parseCliValue("off", CliOptionType::BOOLEAN).as<bool>());
    EXPECT_EQ(parseCliValue("42", CliOptionType::INTEGER).as<int>(), 42);
    EXPECT_DOUBLE_EQ(parseCliValue("2.5", CliOptionType::DOUBLE).as<double>(), 2.5);

    auto list = parseCliValue("a, b,c", CliOptionType::STRING_LIST).as<std::vector<std::string>>();
    EXPECT_EQ(list, (std::vector<std::string>{"a", "b", "c"}));
}

TEST(ConfigOverrideUtilsTest, ValueValidation) {
    using namespace ConfigOverrideUtils;
    std::string error;

    CliOptionDefinition interval;
    interval.long_name = "interval";
    interval.type = CliOptionType::INTEGER;
    interval.constraint = CliOptionConstraint::POSITIVE;
    EXPECT_EQ(validateCliValue("5", interval, error), CliParseStatus::SUCCESS);
    EXPECT_EQ(validateCliValue("0", interval, error), CliParseStatus::CONSTRAINT_VIOLATION);
    EXPECT_EQ(validateCliValue("1.5", interval, error), CliParseStatus::INVALID_VALUE);
    EXPECT_EQ(validateCliValue("99999999999999", interval, error), CliParseStatus::INVALID_VALUE);

    CliOptionDefinition flag;
    flag.long_name = "flag";
    flag.type = CliOptionType::BOOLEAN;
    EXPECT_EQ(validateCliValue("maybe", flag, error), CliParseStatus::INVALID_VALUE);

    CliOptionDefinition text;
    text.long_name = "text";
    EXPECT_EQ(validateCliValue("", text, error), CliParseStatus::INVALID_VALUE);
    EXPECT_FALSE(error.empty());
}

TEST(ConfigOverrideUtilsTest, EnumNames) {
    using namespace ConfigOverrideUtils;
    EXPECT_EQ(cliParseStatusToString(CliParseStatus::MISSING_VALUE), "MISSING_VALUE");
    EXPECT_EQ(cliParseStatusToString(CliParseStatus::CONSTRAINT_VIOLATION), "CONSTRAINT_VIOLATION");
    EXPECT_EQ(cliOptionTypeToString(CliOptionType::STRING_LIST), "STRING_LIST");
}
