#include "../include/language.hpp"
#include "../include/errors.hpp"
#include "../include/unicode_utils.hpp"
#include <algorithm>
#include <cctype>
#include <unicode/uchar.h>

namespace tokbench {

std::string language_code(Language language) {
    switch (language) {
        case Language::Urdu:    return "ur";
        case Language::Chinese: return "zh";
        case Language::Hindi:   return "hi";
    }
    return "ur";
}

Language parse_language(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "ur" || lower == "urd" || lower == "urdu") return Language::Urdu;
    if (lower == "zh" || lower == "zh-hans" || lower == "chinese") return Language::Chinese;
    if (lower == "hi" || lower == "hin" || lower == "hindi") return Language::Hindi;
    throw ConfigError("Unsupported language '" + name + "', choose from ur, zh and hi");
}

const char* icu_locale(Language language) {
    switch (language) {
        case Language::Urdu:    return "ur";
        case Language::Chinese: return "zh";
        case Language::Hindi:   return "hi";
    }
    return "root";
}

const std::vector<CodePointRange>& script_ranges(Language language) {
    static const std::vector<CodePointRange> urdu = {
        {0x0600, 0x06FF},   // Arabic
        {0x0750, 0x077F},   // Arabic Supplement
        {0xFB50, 0xFDFF},   // Arabic Presentation Forms-A
        {0xFE70, 0xFEFF}    // Arabic Presentation Forms-B
    };
    static const std::vector<CodePointRange> chinese = {
        {0x4E00, 0x9FFF},   // CJK Unified Ideographs
        {0x3400, 0x4DBF},   // Extension A
        {0x20000, 0x2A6DF}, // Extension B
        {0x2A700, 0x2B73F}  // Extension C
    };
    static const std::vector<CodePointRange> hindi = {
        {0x0900, 0x097F}    // Devanagari
    };

    switch (language) {
        case Language::Urdu:    return urdu;
        case Language::Chinese: return chinese;
        case Language::Hindi:   return hindi;
    }
    return urdu;
}

bool has_script_letter(const std::string& token, Language language) {
    const auto& ranges = script_ranges(language);
    bool found = false;
    for_each_code_point(token, [&](char32_t c) {
        if (found || u_charType(static_cast<UChar32>(c)) != U_OTHER_LETTER) {
            return;
        }
        found = std::any_of(ranges.begin(), ranges.end(),
                            [c](const CodePointRange& range) { return range.contains(c); });
    });
    return found;
}

} // namespace tokbench
