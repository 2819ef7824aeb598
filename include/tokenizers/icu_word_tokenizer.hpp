#pragma once
#include <memory>
#include <string>
#include <unicode/brkiter.h>
#include "../word_tokenizer.hpp"

namespace tokbench {

/**
 * @brief Segmentation-based tokenizer backed by ICU's word BreakIterator.
 *
 * Chinese text is segmented with ICU's CJK dictionary; Urdu and Hindi follow
 * the UAX #29 word rules. Segments whose rule status is UBRK_WORD_NONE
 * (spaces, punctuation) are not emitted.
 */
class IcuWordTokenizer : public WordTokenizer {
public:
    IcuWordTokenizer(Language language, std::string locale = "", bool filter_foreign_tokens = true);

protected:
    void setup() override;
    std::vector<std::string> do_tokenize(const std::string& text) override;

private:
    std::string locale_;
    std::unique_ptr<icu::BreakIterator> iterator_;
};

} // namespace tokbench
