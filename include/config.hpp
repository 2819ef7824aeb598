#ifndef TOKBENCH_CONFIG_HPP
#define TOKBENCH_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "language.hpp"
#include "logger.hpp"
#include "text_cleaner.hpp"
#include "tokenizer_factory.hpp"

namespace tokbench {

struct LoggingConfig {
    std::string directory = "logs";
    LogLevel level = LogLevel::INFO;
    bool console = false;
};

// Override of one language's cleaning table. Rules, when given, replace the
// default rules; default_action, when given, replaces the default action.
struct CleaningOverride {
    bool has_rules = false;
    std::vector<CleaningRule> rules;
    bool has_default_action = false;
    CleanAction default_action = CleanAction::Space;
};

/**
 * @brief Settings of one benchmark run.
 *
 * Loaded from a JSON file; every key is optional except `language`,
 * `tokenizers`, `input_path` and `vocabulary_path`, which the run commands
 * require. Unknown keys are ignored.
 */
struct BenchmarkConfig {
    Language language = Language::Urdu;
    std::vector<std::string> tokenizers;
    size_t batch_size = 1000;
    bool resume = true;
    std::string store_path = "store";
    std::string input_path;
    std::string vocabulary_path;
    size_t num_workers = 1;
    size_t max_line_bytes = 1 << 20;
    bool filter_foreign_tokens = true;
    bool compact_on_finish = false;
    uint64_t progress_interval = 100000;

    TokenizerOptionsMap tokenizer_options;
    // Keyed by language code
    std::map<std::string, CleaningOverride> cleaning;
    LoggingConfig logging;

    /**
     * @brief Loads configuration from a JSON file.
     * @throws ConfigError if the file is missing, malformed or invalid
     */
    void load_from_json(const std::string& path);

    // Throws ConfigError on out-of-range values or unknown tokenizer ids.
    void validate() const;

    // Throws ConfigError unless the corpus and vocabulary paths are set.
    void require_inputs() const;

    TokenizerOptions options_for(const std::string& tokenizer_id) const;

    // Default table of the configured language with any override applied.
    CleaningRuleTable cleaning_table() const;
};

void to_json(nlohmann::json& j, const LoggingConfig& l);
void from_json(const nlohmann::json& j, LoggingConfig& l);

void to_json(nlohmann::json& j, const TokenizerOptions& t);
void from_json(const nlohmann::json& j, TokenizerOptions& t);

void to_json(nlohmann::json& j, const CleaningRule& r);
void from_json(const nlohmann::json& j, CleaningRule& r);

void to_json(nlohmann::json& j, const CleaningOverride& c);
void from_json(const nlohmann::json& j, CleaningOverride& c);

void to_json(nlohmann::json& j, const BenchmarkConfig& c);
void from_json(const nlohmann::json& j, BenchmarkConfig& c);

} // namespace tokbench

#endif // TOKBENCH_CONFIG_HPP
