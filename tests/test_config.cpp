#include <gtest/gtest.h>
#include "../include/config.hpp"
#include "../include/errors.hpp"
#include "test_helpers.hpp"

using namespace tokbench;
using tokbench::testing::TempDir;
using tokbench::testing::write_file;

TEST(ConfigTest, LoadsEveryRecognizedKey) {
    TempDir dir;
    const std::string path = dir.file("config.json");
    write_file(path, R"({
        "language": "chinese",
        "tokenizers": ["icu", "maxmatch"],
        "batch_size": 250,
        "resume": false,
        "store_path": "/tmp/results",
        "input_path": "zh.txt",
        "vocabulary_path": "zh_words.csv",
        "num_workers": 4,
        "max_line_bytes": 4096,
        "filter_foreign_tokens": false,
        "compact_on_finish": true,
        "progress_interval": 5000,
        "tokenizer_options": {
            "maxmatch": {"dictionary_path": "dict.txt"},
            "icu": {"locale": "zh_Hans"}
        },
        "logging": {"directory": "run_logs", "level": "debug", "console": true}
    })");

    BenchmarkConfig config;
    config.load_from_json(path);

    EXPECT_EQ(config.language, Language::Chinese);
    EXPECT_EQ(config.tokenizers, (std::vector<std::string>{"icu", "maxmatch"}));
    EXPECT_EQ(config.batch_size, 250u);
    EXPECT_FALSE(config.resume);
    EXPECT_EQ(config.store_path, "/tmp/results");
    EXPECT_EQ(config.input_path, "zh.txt");
    EXPECT_EQ(config.vocabulary_path, "zh_words.csv");
    EXPECT_EQ(config.num_workers, 4u);
    EXPECT_EQ(config.max_line_bytes, 4096u);
    EXPECT_FALSE(config.filter_foreign_tokens);
    EXPECT_TRUE(config.compact_on_finish);
    EXPECT_EQ(config.progress_interval, 5000u);
    EXPECT_EQ(config.options_for("maxmatch").dictionary_path, "dict.txt");
    EXPECT_EQ(config.options_for("icu").locale, "zh_Hans");
    EXPECT_TRUE(config.options_for("regex").pattern.empty());
    EXPECT_EQ(config.logging.directory, "run_logs");
    EXPECT_EQ(config.logging.level, LogLevel::DEBUG);
    EXPECT_TRUE(config.logging.console);
    EXPECT_NO_THROW(config.require_inputs());
}

TEST(ConfigTest, AppliesDefaults) {
    TempDir dir;
    const std::string path = dir.file("config.json");
    write_file(path, R"({"language": "ur", "tokenizers": ["rule"]})");

    BenchmarkConfig config;
    config.load_from_json(path);
    EXPECT_EQ(config.language, Language::Urdu);
    EXPECT_EQ(config.batch_size, 1000u);
    EXPECT_TRUE(config.resume);
    EXPECT_EQ(config.store_path, "store");
    EXPECT_EQ(config.num_workers, 1u);
    EXPECT_TRUE(config.filter_foreign_tokens);
    EXPECT_FALSE(config.compact_on_finish);
    EXPECT_EQ(config.logging.level, LogLevel::INFO);
    EXPECT_THROW(config.require_inputs(), ConfigError);
}

TEST(ConfigTest, CleaningOverridesAcceptHexCodePoints) {
    TempDir dir;
    const std::string path = dir.file("config.json");
    write_file(path, R"({
        "language": "hi",
        "tokenizers": ["rule"],
        "cleaning": {
            "hindi": {
                "rules": [
                    {"first": "U+0900", "last": "0x097F", "action": "keep"},
                    {"first": 65, "action": "replace", "replacement": "U+0905"}
                ],
                "default_action": "drop"
            },
            "ur": {"default_action": "space"}
        }
    })");

    BenchmarkConfig config;
    config.load_from_json(path);
    CleaningRuleTable table = config.cleaning_table();
    ASSERT_EQ(table.rules.size(), 2u);
    EXPECT_EQ(table.rules[0].first, 0x0900u);
    EXPECT_EQ(table.rules[0].last, 0x097Fu);
    EXPECT_EQ(table.rules[1].first, 65u);
    EXPECT_EQ(table.rules[1].last, 65u);
    EXPECT_EQ(table.rules[1].replacement, 0x0905u);
    EXPECT_EQ(table.default_action, CleanAction::Drop);

    // Latin letters other than A now fall through to the drop default
    EXPECT_EQ(TextCleaner(Language::Hindi, table).clean_text("Ax क"), "अ क");
}

TEST(ConfigTest, OverrideWithoutRulesKeepsDefaultRules) {
    BenchmarkConfig config;
    config.language = Language::Urdu;
    CleaningOverride override_action;
    override_action.has_default_action = true;
    override_action.default_action = CleanAction::Keep;
    config.cleaning["ur"] = override_action;

    CleaningRuleTable table = config.cleaning_table();
    EXPECT_EQ(table.rules.size(), CleaningRuleTable::defaults_for(Language::Urdu).rules.size());
    EXPECT_EQ(table.default_action, CleanAction::Keep);
}

TEST(ConfigTest, RejectsInvalidConfigurations) {
    TempDir dir;
    const std::string path = dir.file("config.json");
    BenchmarkConfig config;

    EXPECT_THROW(config.load_from_json(dir.file("missing.json")), ConfigError);

    write_file(path, "{ not json");
    EXPECT_THROW(config.load_from_json(path), ConfigError);

    write_file(path, R"({"tokenizers": ["rule"]})");
    EXPECT_THROW(config.load_from_json(path), ConfigError);

    write_file(path, R"({"language": "fr", "tokenizers": ["rule"]})");
    EXPECT_THROW(config.load_from_json(path), ConfigError);

    write_file(path, R"({"language": "ur", "tokenizers": ["bpe"]})");
    EXPECT_THROW(config.load_from_json(path), ConfigError);

    write_file(path, R"({"language": "ur", "tokenizers": ["rule", "rule"]})");
    EXPECT_THROW(config.load_from_json(path), ConfigError);

    write_file(path, R"({"language": "ur", "tokenizers": []})");
    EXPECT_THROW(config.load_from_json(path), ConfigError);

    write_file(path, R"({"language": "ur", "tokenizers": ["rule"], "batch_size": 0})");
    EXPECT_THROW(config.load_from_json(path), ConfigError);

    write_file(path, R"({"language": "ur", "tokenizers": ["rule"], "batch_size": "big"})");
    EXPECT_THROW(config.load_from_json(path), ConfigError);

    write_file(path, R"({"language": "ur", "tokenizers": ["rule"], "logging": {"level": "loud"}})");
    EXPECT_THROW(config.load_from_json(path), ConfigError);

    write_file(path, R"({"language": "ur", "tokenizers": ["rule"],
                         "cleaning": {"ur": {"rules": [{"first": "U+0700", "last": "U+0600", "action": "keep"}]}}})");
    EXPECT_THROW(config.load_from_json(path), ConfigError);
}

TEST(ConfigTest, SerializesBackToJson) {
    BenchmarkConfig config;
    config.language = Language::Hindi;
    config.tokenizers = {"regex"};
    config.tokenizer_options["regex"].pattern = "\\S+";

    nlohmann::json j = config;
    EXPECT_EQ(j.at("language").get<std::string>(), "hi");
    EXPECT_EQ(j.at("tokenizer_options").at("regex").at("pattern").get<std::string>(), "\\S+");

    BenchmarkConfig parsed = j.get<BenchmarkConfig>();
    EXPECT_EQ(parsed.language, Language::Hindi);
    EXPECT_EQ(parsed.tokenizers, config.tokenizers);
    EXPECT_EQ(parsed.options_for("regex").pattern, "\\S+");
}
