#pragma once
#include <memory>
#include <string>
#include <unicode/regex.h>
#include "../word_tokenizer.hpp"

namespace tokbench {

/**
 * @brief Emits every match of an ICU regular expression, in order.
 *
 * The default pattern splits runs of word characters from runs of
 * punctuation, the WordPunct convention.
 */
class RegexTokenizer : public WordTokenizer {
public:
    static constexpr const char* DEFAULT_PATTERN = "\\w+|[^\\w\\s]+";

    RegexTokenizer(Language language, std::string pattern = DEFAULT_PATTERN, bool filter_foreign_tokens = true);

    const std::string& pattern() const { return pattern_; }

protected:
    void setup() override;
    std::vector<std::string> do_tokenize(const std::string& text) override;

private:
    std::string pattern_;
    std::unique_ptr<icu::RegexPattern> compiled_;
};

} // namespace tokbench
