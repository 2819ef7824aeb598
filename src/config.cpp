#include "../include/config.hpp"
#include "../include/errors.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <set>
#include <nlohmann/json.hpp>

namespace tokbench {

namespace {

// Code points may be written as numbers or as "U+0600" / "0x0600" strings.
char32_t code_point_from_json(const nlohmann::json& j) {
    if (j.is_number_unsigned() || j.is_number_integer()) {
        int64_t value = j.get<int64_t>();
        if (value < 0 || value > 0x10FFFF) {
            throw ConfigError("Code point out of range: " + j.dump());
        }
        return static_cast<char32_t>(value);
    }
    if (j.is_string()) {
        std::string text = j.get<std::string>();
        if (text.size() > 2 && (text.compare(0, 2, "U+") == 0 || text.compare(0, 2, "u+") == 0 ||
                                text.compare(0, 2, "0x") == 0 || text.compare(0, 2, "0X") == 0)) {
            text = text.substr(2);
        }
        size_t consumed = 0;
        unsigned long value = 0;
        try {
            value = std::stoul(text, &consumed, 16);
        } catch (const std::exception&) {
            throw ConfigError("Invalid code point: " + j.dump());
        }
        if (consumed != text.size() || value > 0x10FFFF) {
            throw ConfigError("Invalid code point: " + j.dump());
        }
        return static_cast<char32_t>(value);
    }
    throw ConfigError("Code point must be a number or hex string: " + j.dump());
}

std::string code_point_to_string(char32_t c) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "U+%04X", static_cast<unsigned>(c));
    return buffer;
}

} // namespace

void to_json(nlohmann::json& j, const LoggingConfig& l) {
    j = nlohmann::json{
        {"directory", l.directory},
        {"level", log_level_name(l.level)},
        {"console", l.console}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& l) {
    l.directory = j.value("directory", l.directory);
    if (j.contains("level")) {
        try {
            l.level = parse_log_level(j.at("level").get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ConfigError(e.what());
        }
    }
    l.console = j.value("console", l.console);
}

void to_json(nlohmann::json& j, const TokenizerOptions& t) {
    j = nlohmann::json{
        {"dictionary_path", t.dictionary_path},
        {"pattern", t.pattern},
        {"locale", t.locale}
    };
}

void from_json(const nlohmann::json& j, TokenizerOptions& t) {
    t.dictionary_path = j.value("dictionary_path", t.dictionary_path);
    t.pattern = j.value("pattern", t.pattern);
    t.locale = j.value("locale", t.locale);
}

void to_json(nlohmann::json& j, const CleaningRule& r) {
    j = nlohmann::json{
        {"first", code_point_to_string(r.first)},
        {"last", code_point_to_string(r.last)},
        {"action", clean_action_name(r.action)}
    };
    if (r.action == CleanAction::Replace) {
        j["replacement"] = code_point_to_string(r.replacement);
    }
}

void from_json(const nlohmann::json& j, CleaningRule& r) {
    r.first = code_point_from_json(j.at("first"));
    r.last = j.contains("last") ? code_point_from_json(j.at("last")) : r.first;
    if (r.last < r.first) {
        throw ConfigError("Cleaning rule range is reversed: " + j.dump());
    }
    r.action = parse_clean_action(j.at("action").get<std::string>());
    r.replacement = 0;
    if (r.action == CleanAction::Replace) {
        if (!j.contains("replacement")) {
            throw ConfigError("Replace rule without replacement: " + j.dump());
        }
        r.replacement = code_point_from_json(j.at("replacement"));
    }
}

void to_json(nlohmann::json& j, const CleaningOverride& c) {
    j = nlohmann::json::object();
    if (c.has_rules) {
        j["rules"] = c.rules;
    }
    if (c.has_default_action) {
        j["default_action"] = clean_action_name(c.default_action);
    }
}

void from_json(const nlohmann::json& j, CleaningOverride& c) {
    if (j.contains("rules")) {
        c.has_rules = true;
        c.rules = j.at("rules").get<std::vector<CleaningRule>>();
    }
    if (j.contains("default_action")) {
        c.has_default_action = true;
        c.default_action = parse_clean_action(j.at("default_action").get<std::string>());
    }
}

void to_json(nlohmann::json& j, const BenchmarkConfig& c) {
    j = nlohmann::json{
        {"language", language_code(c.language)},
        {"tokenizers", c.tokenizers},
        {"batch_size", c.batch_size},
        {"resume", c.resume},
        {"store_path", c.store_path},
        {"input_path", c.input_path},
        {"vocabulary_path", c.vocabulary_path},
        {"num_workers", c.num_workers},
        {"max_line_bytes", c.max_line_bytes},
        {"filter_foreign_tokens", c.filter_foreign_tokens},
        {"compact_on_finish", c.compact_on_finish},
        {"progress_interval", c.progress_interval},
        {"tokenizer_options", c.tokenizer_options},
        {"cleaning", c.cleaning},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, BenchmarkConfig& c) {
    if (j.contains("language")) {
        c.language = parse_language(j.at("language").get<std::string>());
    }
    c.tokenizers = j.value("tokenizers", c.tokenizers);
    c.batch_size = j.value("batch_size", c.batch_size);
    c.resume = j.value("resume", c.resume);
    c.store_path = j.value("store_path", c.store_path);
    c.input_path = j.value("input_path", c.input_path);
    c.vocabulary_path = j.value("vocabulary_path", c.vocabulary_path);
    c.num_workers = j.value("num_workers", c.num_workers);
    c.max_line_bytes = j.value("max_line_bytes", c.max_line_bytes);
    c.filter_foreign_tokens = j.value("filter_foreign_tokens", c.filter_foreign_tokens);
    c.compact_on_finish = j.value("compact_on_finish", c.compact_on_finish);
    c.progress_interval = j.value("progress_interval", c.progress_interval);

    if (j.contains("tokenizer_options")) {
        c.tokenizer_options = j.at("tokenizer_options").get<TokenizerOptionsMap>();
    }
    if (j.contains("cleaning")) {
        for (const auto& item : j.at("cleaning").items()) {
            // Accept language names as keys and store them by code
            c.cleaning[language_code(parse_language(item.key()))] = item.value().get<CleaningOverride>();
        }
    }
    if (j.contains("logging")) {
        c.logging = j.at("logging").get<LoggingConfig>();
    }
}

void BenchmarkConfig::load_from_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Could not open config file: " + path);
    }

    try {
        nlohmann::json j;
        file >> j;
        if (!j.contains("language")) {
            throw ConfigError("Missing required key \"language\"");
        }
        from_json(j, *this);
    } catch (const ConfigError& e) {
        throw ConfigError("Error loading config from " + path + ": " + e.what());
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Error loading config from " + path + ": " + e.what());
    }

    validate();
}

void BenchmarkConfig::validate() const {
    if (tokenizers.empty()) {
        throw ConfigError("\"tokenizers\" must list at least one tokenizer id");
    }
    const auto& known = available_tokenizers();
    std::set<std::string> seen;
    for (const auto& id : tokenizers) {
        if (std::find(known.begin(), known.end(), id) == known.end()) {
            throw ConfigError("Unknown tokenizer id: " + id);
        }
        if (!seen.insert(id).second) {
            throw ConfigError("Tokenizer listed twice: " + id);
        }
    }
    for (const auto& entry : tokenizer_options) {
        if (std::find(known.begin(), known.end(), entry.first) == known.end()) {
            throw ConfigError("Options given for unknown tokenizer id: " + entry.first);
        }
    }
    if (batch_size == 0) {
        throw ConfigError("\"batch_size\" must be positive");
    }
    if (num_workers == 0) {
        throw ConfigError("\"num_workers\" must be positive");
    }
    if (max_line_bytes == 0) {
        throw ConfigError("\"max_line_bytes\" must be positive");
    }
    if (progress_interval == 0) {
        throw ConfigError("\"progress_interval\" must be positive");
    }
    if (store_path.empty()) {
        throw ConfigError("\"store_path\" must not be empty");
    }
}

void BenchmarkConfig::require_inputs() const {
    if (input_path.empty()) {
        throw ConfigError("\"input_path\" is required for this command");
    }
    if (vocabulary_path.empty()) {
        throw ConfigError("\"vocabulary_path\" is required for this command");
    }
}

TokenizerOptions BenchmarkConfig::options_for(const std::string& tokenizer_id) const {
    auto it = tokenizer_options.find(tokenizer_id);
    return it == tokenizer_options.end() ? TokenizerOptions{} : it->second;
}

CleaningRuleTable BenchmarkConfig::cleaning_table() const {
    CleaningRuleTable table = CleaningRuleTable::defaults_for(language);
    auto it = cleaning.find(language_code(language));
    if (it != cleaning.end()) {
        if (it->second.has_rules) {
            table.rules = it->second.rules;
        }
        if (it->second.has_default_action) {
            table.default_action = it->second.default_action;
        }
    }
    return table;
}

} // namespace tokbench
