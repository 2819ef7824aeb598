#include "../../include/tokenizers/icu_word_tokenizer.hpp"
#include "../../include/errors.hpp"
#include <unicode/locid.h>
#include <unicode/ubrk.h>
#include <unicode/unistr.h>
#include <utility>

namespace tokbench {

IcuWordTokenizer::IcuWordTokenizer(Language language, std::string locale, bool filter_foreign_tokens)
    : WordTokenizer("icu", language, filter_foreign_tokens),
      locale_(locale.empty() ? icu_locale(language) : std::move(locale)) {}

void IcuWordTokenizer::setup() {
    UErrorCode status = U_ZERO_ERROR;
    iterator_.reset(icu::BreakIterator::createWordInstance(icu::Locale(locale_.c_str()), status));
    if (U_FAILURE(status) || !iterator_) {
        iterator_.reset();
        throw TokenizerInitError("icu: cannot create word break iterator for locale '" + locale_ +
                                 "': " + u_errorName(status));
    }
}

std::vector<std::string> IcuWordTokenizer::do_tokenize(const std::string& text) {
    // The iterator keeps a reference to the text, which must outlive the loop
    const icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);
    iterator_->setText(unicode_text);

    std::vector<std::string> tokens;
    int32_t start = iterator_->first();
    for (int32_t end = iterator_->next(); end != icu::BreakIterator::DONE; start = end, end = iterator_->next()) {
        if (iterator_->getRuleStatus() == UBRK_WORD_NONE) {
            continue;
        }
        std::string token;
        unicode_text.tempSubStringBetween(start, end).toUTF8String(token);
        tokens.push_back(std::move(token));
    }
    return tokens;
}

} // namespace tokbench
