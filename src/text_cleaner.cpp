#include "../include/text_cleaner.hpp"
#include "../include/errors.hpp"
#include "../include/unicode_utils.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <utility>

namespace tokbench {

const char* clean_action_name(CleanAction action) {
    switch (action) {
        case CleanAction::Keep:    return "keep";
        case CleanAction::Drop:    return "drop";
        case CleanAction::Space:   return "space";
        case CleanAction::Replace: return "replace";
    }
    return "keep";
}

CleanAction parse_clean_action(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "keep") return CleanAction::Keep;
    if (lower == "drop") return CleanAction::Drop;
    if (lower == "space") return CleanAction::Space;
    if (lower == "replace") return CleanAction::Replace;
    throw ConfigError("Unknown cleaning action: " + name);
}

CleanAction CleaningRuleTable::action_for(char32_t c, char32_t& replacement) const {
    for (const auto& rule : rules) {
        if (rule.matches(c)) {
            replacement = rule.replacement;
            return rule.action;
        }
    }
    return default_action;
}

CleaningRuleTable CleaningRuleTable::defaults_for(Language language) {
    CleaningRuleTable table;

    switch (language) {
        case Language::Urdu:
            // Arabic letter variants written as their Urdu forms
            table.rules.push_back({0x064A, 0x064A, CleanAction::Replace, 0x06CC});  // yeh -> farsi yeh
            table.rules.push_back({0x0649, 0x0649, CleanAction::Replace, 0x06CC});  // alef maksura
            table.rules.push_back({0x0643, 0x0643, CleanAction::Replace, 0x06A9});  // kaf -> keheh
            // harakat, superscript alef, tatweel
            table.rules.push_back({0x064B, 0x0652, CleanAction::Drop});
            table.rules.push_back({0x0670, 0x0670, CleanAction::Drop});
            table.rules.push_back({0x0640, 0x0640, CleanAction::Drop});
            // Arabic-Indic and Extended Arabic-Indic digits
            table.rules.push_back({0x0660, 0x0669, CleanAction::Drop});
            table.rules.push_back({0x06F0, 0x06F9, CleanAction::Drop});
            // comma, semicolon, question mark, full stop, percent and separators
            table.rules.push_back({0x060C, 0x060C, CleanAction::Space});
            table.rules.push_back({0x061B, 0x061B, CleanAction::Space});
            table.rules.push_back({0x061F, 0x061F, CleanAction::Space});
            table.rules.push_back({0x066A, 0x066D, CleanAction::Space});
            table.rules.push_back({0x06D4, 0x06D4, CleanAction::Space});
            table.rules.push_back({0x0600, 0x06FF, CleanAction::Keep});
            table.rules.push_back({0x0750, 0x077F, CleanAction::Keep});
            table.rules.push_back({0x200C, 0x200C, CleanAction::Keep});  // ZWNJ joins Urdu compounds
            // ASCII punctuation separates words; other foreign code points vanish
            table.rules.push_back({0x0021, 0x002F, CleanAction::Space});
            table.rules.push_back({0x003A, 0x0040, CleanAction::Space});
            table.rules.push_back({0x005B, 0x0060, CleanAction::Space});
            table.rules.push_back({0x007B, 0x007E, CleanAction::Space});
            table.default_action = CleanAction::Drop;
            break;

        case Language::Chinese:
            // 一二三四五六七八九零 are treated as numerals
            for (char32_t numeral : {U'一', U'二', U'三', U'四', U'五', U'六', U'七', U'八', U'九', U'零'}) {
                table.rules.push_back({numeral, numeral, CleanAction::Space});
            }
            table.rules.push_back({0x4E00, 0x9FFF, CleanAction::Keep});
            table.rules.push_back({0x3400, 0x4DBF, CleanAction::Keep});
            table.default_action = CleanAction::Space;
            break;

        case Language::Hindi:
            table.rules.push_back({0x0966, 0x096F, CleanAction::Drop});   // Devanagari digits
            table.rules.push_back({0x0964, 0x0965, CleanAction::Space});  // danda, double danda
            table.rules.push_back({0x0900, 0x097F, CleanAction::Keep});
            table.rules.push_back({0x0030, 0x0039, CleanAction::Drop});
            table.default_action = CleanAction::Space;
            break;
    }
    return table;
}

TextCleaner::TextCleaner(Language language)
    : language_(language), table_(CleaningRuleTable::defaults_for(language)) {}

TextCleaner::TextCleaner(Language language, CleaningRuleTable table)
    : language_(language), table_(std::move(table)) {}

std::string TextCleaner::clean_text(const std::string& text) const {
    auto code_points = decode_utf8(text);
    if (!code_points) {
        throw CleaningError("ill-formed UTF-8 input");
    }

    std::string out;
    out.reserve(text.size());
    bool pending_space = false;

    auto emit = [&](char32_t c) {
        if (pending_space && !out.empty()) {
            out.push_back(' ');
        }
        pending_space = false;
        append_utf8(out, c);
    };

    for (char32_t c : *code_points) {
        if (is_white_space(c)) {
            pending_space = true;
            continue;
        }

        char32_t replacement = 0;
        switch (table_.action_for(c, replacement)) {
            case CleanAction::Keep:
                emit(c);
                break;
            case CleanAction::Replace:
                emit(replacement);
                break;
            case CleanAction::Space:
                pending_space = true;
                break;
            case CleanAction::Drop:
                break;
        }
    }
    return out;
}

CleanedSentence TextCleaner::clean(const Sentence& sentence) const {
    CleanedSentence result;
    result.language = sentence.language;
    result.offset = sentence.offset;
    result.text = clean_text(sentence.text);
    result.degenerate = result.text.empty();
    return result;
}

CleanedSentence clean(const Sentence& sentence, Language language) {
    return TextCleaner(language).clean(sentence);
}

} // namespace tokbench
