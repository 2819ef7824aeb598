#include "../../include/tokenizers/regex_tokenizer.hpp"
#include "../../include/errors.hpp"
#include <unicode/unistr.h>
#include <utility>

namespace tokbench {

RegexTokenizer::RegexTokenizer(Language language, std::string pattern, bool filter_foreign_tokens)
    : WordTokenizer("regex", language, filter_foreign_tokens), pattern_(std::move(pattern)) {}

void RegexTokenizer::setup() {
    UParseError parse_error;
    UErrorCode status = U_ZERO_ERROR;
    compiled_.reset(icu::RegexPattern::compile(icu::UnicodeString::fromUTF8(pattern_), 0, parse_error, status));
    if (U_FAILURE(status) || !compiled_) {
        compiled_.reset();
        throw TokenizerInitError("regex: invalid pattern '" + pattern_ + "' at offset " +
                                 std::to_string(parse_error.offset) + ": " + u_errorName(status));
    }
}

std::vector<std::string> RegexTokenizer::do_tokenize(const std::string& text) {
    const icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexMatcher> matcher(compiled_->matcher(unicode_text, status));
    if (U_FAILURE(status) || !matcher) {
        throw TokenizerRuntimeError(std::string("regex: matcher creation failed: ") + u_errorName(status));
    }

    std::vector<std::string> tokens;
    while (matcher->find(status)) {
        icu::UnicodeString group = matcher->group(status);
        if (U_FAILURE(status)) {
            break;
        }
        if (group.isEmpty()) {
            continue;
        }
        std::string token;
        group.toUTF8String(token);
        tokens.push_back(std::move(token));
    }
    if (U_FAILURE(status)) {
        throw TokenizerRuntimeError(std::string("regex: matching failed: ") + u_errorName(status));
    }
    return tokens;
}

} // namespace tokbench
