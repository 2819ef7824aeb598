#pragma once
#include <string>
#include <vector>

namespace tokbench {

enum class Language {
    Urdu,
    Chinese,
    Hindi
};

struct CodePointRange {
    char32_t first;
    char32_t last;

    bool contains(char32_t c) const { return c >= first && c <= last; }
};

// Short code used in store keys and reports: "ur", "zh", "hi".
std::string language_code(Language language);

// Accepts codes and English names ("ur", "urdu", "zh", "zh-hans", "chinese", "hi", "hindi").
// Throws ConfigError for anything else.
Language parse_language(const std::string& name);

// ICU locale id used for break iteration.
const char* icu_locale(Language language);

// Code point ranges that count as the language's own script.
const std::vector<CodePointRange>& script_ranges(Language language);

/**
 * @brief True if token contains at least one letter (general category Lo)
 * inside the language's script ranges.
 */
bool has_script_letter(const std::string& token, Language language);

} // namespace tokbench
