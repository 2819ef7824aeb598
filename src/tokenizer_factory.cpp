#include "../include/tokenizer_factory.hpp"
#include "../include/errors.hpp"
#include "../include/tokenizers/icu_word_tokenizer.hpp"
#include "../include/tokenizers/max_match_tokenizer.hpp"
#include "../include/tokenizers/regex_tokenizer.hpp"
#include "../include/tokenizers/rule_tokenizer.hpp"

namespace tokbench {

const std::vector<std::string>& available_tokenizers() {
    static const std::vector<std::string> ids = {"icu", "regex", "rule", "maxmatch"};
    return ids;
}

std::unique_ptr<WordTokenizer> make_tokenizer(const std::string& id,
                                              Language language,
                                              const TokenizerOptions& options,
                                              bool filter_foreign_tokens) {
    if (id == "icu") {
        return std::make_unique<IcuWordTokenizer>(language, options.locale, filter_foreign_tokens);
    }
    if (id == "regex") {
        std::string pattern = options.pattern.empty() ? RegexTokenizer::DEFAULT_PATTERN : options.pattern;
        return std::make_unique<RegexTokenizer>(language, pattern, filter_foreign_tokens);
    }
    if (id == "rule") {
        return std::make_unique<RuleTokenizer>(language, filter_foreign_tokens);
    }
    if (id == "maxmatch") {
        return std::make_unique<MaxMatchTokenizer>(language, options.dictionary_path, filter_foreign_tokens);
    }

    std::string known;
    for (const auto& name : available_tokenizers()) {
        known += (known.empty() ? "" : ", ") + name;
    }
    throw ConfigError("Unknown tokenizer '" + id + "', available: " + known);
}

} // namespace tokbench
