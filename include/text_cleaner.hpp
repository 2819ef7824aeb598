#pragma once
#include <string>
#include <vector>
#include "types.hpp"

namespace tokbench {

enum class CleanAction {
    Keep,     // copy the code point
    Drop,     // delete it
    Space,    // replace it with a space
    Replace   // substitute CleaningRule::replacement
};

const char* clean_action_name(CleanAction action);
CleanAction parse_clean_action(const std::string& name);

struct CleaningRule {
    char32_t first;
    char32_t last;
    CleanAction action;
    char32_t replacement = 0;

    bool matches(char32_t c) const { return c >= first && c <= last; }
};

/**
 * @brief Ordered rule table for one language.
 *
 * White space always becomes a single space. Every other code point takes
 * the action of the first matching rule, or default_action when none matches.
 */
struct CleaningRuleTable {
    std::vector<CleaningRule> rules;
    CleanAction default_action = CleanAction::Space;

    CleanAction action_for(char32_t c, char32_t& replacement) const;

    static CleaningRuleTable defaults_for(Language language);
};

class TextCleaner {
public:
    explicit TextCleaner(Language language);
    TextCleaner(Language language, CleaningRuleTable table);

    /**
     * @brief Applies the rule table, collapses white space runs and trims.
     * @throws CleaningError if the sentence is not well-formed UTF-8.
     */
    CleanedSentence clean(const Sentence& sentence) const;

    std::string clean_text(const std::string& text) const;

    Language language() const { return language_; }
    const CleaningRuleTable& rule_table() const { return table_; }

private:
    Language language_;
    CleaningRuleTable table_;
};

// Cleans with the default table of the given language.
CleanedSentence clean(const Sentence& sentence, Language language);

} // namespace tokbench
