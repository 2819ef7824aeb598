#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "word_tokenizer.hpp"

namespace tokbench {

// Per-tokenizer settings from the "tokenizer_options" config section.
struct TokenizerOptions {
    std::string dictionary_path;  // maxmatch
    std::string pattern;          // regex, empty means the default pattern
    std::string locale;           // icu, empty means the language's locale
};

using TokenizerOptionsMap = std::map<std::string, TokenizerOptions>;

// Ids accepted by make_tokenizer: "icu", "regex", "rule", "maxmatch".
const std::vector<std::string>& available_tokenizers();

/**
 * @brief Creates a fresh, uninitialized adapter.
 * @throws ConfigError for an unknown id
 */
std::unique_ptr<WordTokenizer> make_tokenizer(const std::string& id,
                                              Language language,
                                              const TokenizerOptions& options = {},
                                              bool filter_foreign_tokens = true);

} // namespace tokbench
