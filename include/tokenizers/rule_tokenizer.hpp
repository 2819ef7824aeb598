#pragma once
#include "../word_tokenizer.hpp"

namespace tokbench {

/**
 * @brief Rule-based tokenizer in the style of IndicNLP's trivial tokenizer.
 *
 * Splits on white space and emits every punctuation code point as a token
 * of its own. No setup is required.
 */
class RuleTokenizer : public WordTokenizer {
public:
    explicit RuleTokenizer(Language language, bool filter_foreign_tokens = true);

protected:
    void setup() override {}
    std::vector<std::string> do_tokenize(const std::string& text) override;
};

} // namespace tokbench
