#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include <memory>
#include "../src/core/config.hpp"
#include "../src/core/errors.hpp"
#include "../src/core/logger.hpp"

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a temporary directory for test files
        test_dir = std::filesystem::temp_directory_path() / "log_sentinel_config_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        // Clean up test files
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string createTestConfigFile(const std::string& content) {
        auto config_path = test_dir / "test_config.ini";
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigTest, DefaultsWithoutSections) {
    std::string config_file = createTestConfigFile("# nothing here\n");
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_EQ(config->ingestion.parse_workers, 4u);
    EXPECT_EQ(config->ingestion.shard_count, 8u);
    EXPECT_EQ(config->behavior.auth_failure_threshold, 10u);
    EXPECT_EQ(config->behavior.auth_window_seconds, 300u);
    EXPECT_EQ(config->alerting.coalescing_interval_seconds, 60u);
    EXPECT_EQ(config->storage.backend, "memory");
    EXPECT_FALSE(config->web_server.enabled);
    ASSERT_EQ(config->formats.priority.size(), 4u);
    EXPECT_EQ(config->formats.priority.front(), "json");
}

TEST_F(ConfigTest, ParsesAllSections) {
    std::string config_content = R"(
batch_input_paths = /var/log/a.log, /var/log/b.log
live_input_path = /var/log/live.log

[Ingestion]
parse_workers = 2
shard_count = 16
max_line_length = 4096

[Formats]
priority = combined, common

[Behavior]
auth_window_seconds = 120
auth_failure_threshold = 5
request_rate_threshold = 50
confidence_floor = 0.6

[SignatureRules]
max_decode_passes = 3
disable = sqli.comment, xss.dom_sink
rule.custom.wp_admin = PathTraversal|0.6|raw|wp-config\.php

[Alerting]
coalescing_interval_seconds = 30
corroboration_min_triggers = 4

[Metrics]
top_k_capacity = 64

[Enrichment]
bot_ua_substrings = Bot, Crawler

[Storage]
backend = MongoDB
mongo_uri = mongodb://db:27017
mongo_database = sentinel

[WebServer]
enabled = yes
host = 127.0.0.1
port = 9090
heartbeat_seconds = 5

[Logging]
default_level = DEBUG
io.* = ERROR
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));
    EXPECT_EQ(manager.get_config_path(), config_file);

    auto config = manager.get_config();
    ASSERT_EQ(config->batch_input_paths.size(), 2u);
    EXPECT_EQ(config->batch_input_paths[1], "/var/log/b.log");
    EXPECT_EQ(config->live_input_path, "/var/log/live.log");

    EXPECT_EQ(config->ingestion.parse_workers, 2u);
    EXPECT_EQ(config->ingestion.shard_count, 16u);
    EXPECT_EQ(config->ingestion.max_line_length, 4096u);

    ASSERT_EQ(config->formats.priority.size(), 2u);
    EXPECT_EQ(config->formats.priority[0], "combined");

    EXPECT_EQ(config->behavior.auth_window_seconds, 120u);
    EXPECT_EQ(config->behavior.auth_failure_threshold, 5u);
    EXPECT_EQ(config->behavior.request_rate_threshold, 50u);
    EXPECT_DOUBLE_EQ(config->behavior.confidence_floor, 0.6);

    EXPECT_EQ(config->signatures.max_decode_passes, 3);
    ASSERT_EQ(config->signatures.disabled_rules.size(), 2u);
    EXPECT_EQ(config->signatures.disabled_rules[1], "xss.dom_sink");
    ASSERT_EQ(config->signatures.custom_rules.size(), 1u);
    const auto &rule = config->signatures.custom_rules[0];
    EXPECT_EQ(rule.id, "custom.wp_admin");
    EXPECT_EQ(rule.attack_type, "PathTraversal");
    EXPECT_DOUBLE_EQ(rule.confidence, 0.6);
    EXPECT_TRUE(rule.match_raw);
    EXPECT_EQ(rule.pattern, "wp-config\\.php");

    EXPECT_EQ(config->alerting.coalescing_interval_seconds, 30u);
    EXPECT_EQ(config->alerting.corroboration_min_triggers, 4u);
    EXPECT_EQ(config->metrics.top_k_capacity, 64u);

    ASSERT_EQ(config->enrichment.bot_ua_substrings.size(), 2u);
    EXPECT_EQ(config->enrichment.bot_ua_substrings[0], "bot");

    EXPECT_EQ(config->storage.backend, "mongodb");
    EXPECT_EQ(config->storage.mongo_database, "sentinel");

    EXPECT_TRUE(config->web_server.enabled);
    EXPECT_EQ(config->web_server.host, "127.0.0.1");
    EXPECT_EQ(config->web_server.port, 9090);
    EXPECT_EQ(config->web_server.heartbeat_seconds, 5u);

    EXPECT_EQ(config->logging.log_levels.at(LogComponent::CORE), LogLevel::DEBUG);
    EXPECT_EQ(config->logging.log_levels.at(LogComponent::IO_STORE), LogLevel::ERROR);
    EXPECT_EQ(config->logging.log_levels.at(LogComponent::IO_WEB), LogLevel::ERROR);
}

TEST_F(ConfigTest, InvalidRegexRejectedAndPreviousConfigKept) {
    std::string good = createTestConfigFile("[Behavior]\nauth_failure_threshold = 7\n");
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(good));

    std::string bad = createTestConfigFile(
        "[SignatureRules]\nrule.broken = SQLInjection|0.5|normalized|(unclosed\n");
    EXPECT_FALSE(manager.load_configuration(bad));
    EXPECT_EQ(manager.get_config()->behavior.auth_failure_threshold, 7u);
}

TEST_F(ConfigTest, OrThrowCarriesEveryValidationMessage) {
    std::string config_content = R"(
[Behavior]
auth_failure_threshold = 0
dos_auth_failure_share = 1.5

[WebServer]
port = 70000
)";
    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    try {
        manager.load_configuration_or_throw(config_file);
        FAIL() << "Expected ClassifierConfigError";
    } catch (const ClassifierConfigError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::ClassifierConfigError);
        EXPECT_EQ(e.details().size(), 3u);
    }
}

TEST_F(ConfigTest, NonNumericValuesAreRejectedNotDefaulted) {
    std::string config_content = R"(
[Behavior]
auth_failure_threshold = ten
request_rate_threshold = -5
confidence_floor = high
)";
    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    EXPECT_FALSE(manager.load_configuration(config_file));
    try {
        manager.load_configuration_or_throw(config_file);
        FAIL() << "Expected ClassifierConfigError";
    } catch (const ClassifierConfigError &e) {
        ASSERT_EQ(e.details().size(), 3u);
        EXPECT_NE(e.details()[0].find("Line 3"), std::string::npos);
        EXPECT_NE(e.details()[0].find("auth_failure_threshold"), std::string::npos);
        EXPECT_NE(e.details()[1].find("'-5'"), std::string::npos);
        EXPECT_NE(e.details()[2].find("confidence_floor"), std::string::npos);
    }
}

TEST_F(ConfigTest, UnrecognizedBooleanRejected) {
    std::string config_file = createTestConfigFile("[WebServer]\nenabled = maybe\n");
    Config::ConfigManager manager;
    EXPECT_THROW(manager.load_configuration_or_throw(config_file),
                 ClassifierConfigError);
}

TEST_F(ConfigTest, MalformedRuleDefinitionThrows) {
    std::string config_file = createTestConfigFile(
        "[SignatureRules]\nrule.short = SQLInjection|0.5\n");
    Config::ConfigManager manager;
    EXPECT_THROW(manager.load_configuration_or_throw(config_file),
                 ClassifierConfigError);
}

TEST_F(ConfigTest, UnknownAttackTypeRejected) {
    std::string config_file = createTestConfigFile(
        "[SignatureRules]\nrule.odd = BruteForce|0.5|normalized|admin\n");
    Config::ConfigManager manager;
    EXPECT_FALSE(manager.load_configuration(config_file));
}

TEST_F(ConfigTest, CustomFormatParsed) {
    std::string config_content = R"(
[Formats]
priority = simple
format.simple = strict|^(?P<client_ip>\S+) \[(?P<timestamp>[^\]]+)\] (?P<path>\S+) (?P<status>\d{3})$
)";
    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));
    auto config = manager.get_config();
    ASSERT_EQ(config->formats.custom_formats.count("simple"), 1u);
    EXPECT_TRUE(config->formats.custom_formats.at("simple").strict);
}

TEST_F(ConfigTest, FormatWithoutRequiredGroupsRejected) {
    std::string config_content = R"(
[Formats]
format.partial = strict|^(?P<client_ip>\S+) (?P<status>\d{3})$
)";
    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    EXPECT_FALSE(manager.load_configuration(config_file));
}

TEST_F(ConfigTest, UnknownFormatInPriorityRejected) {
    std::string config_file =
        createTestConfigFile("[Formats]\npriority = nonexistent\n");
    Config::ConfigManager manager;
    EXPECT_FALSE(manager.load_configuration(config_file));
}

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
    Config::ConfigManager manager;
    EXPECT_FALSE(manager.load_configuration((test_dir / "missing.ini").string()));
    EXPECT_EQ(manager.get_config()->ingestion.shard_count, 8u);
    EXPECT_FALSE(manager.reload());
}
