#include "../../include/tokenizers/rule_tokenizer.hpp"
#include "../../include/errors.hpp"
#include "../../include/unicode_utils.hpp"
#include <unicode/uchar.h>

namespace tokbench {

RuleTokenizer::RuleTokenizer(Language language, bool filter_foreign_tokens)
    : WordTokenizer("rule", language, filter_foreign_tokens) {}

std::vector<std::string> RuleTokenizer::do_tokenize(const std::string& text) {
    auto code_points = decode_utf8(text);
    if (!code_points) {
        throw TokenizerRuntimeError("rule: ill-formed UTF-8 input");
    }

    std::vector<std::string> tokens;
    std::string current;
    auto flush = [&]() {
        if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    };

    for (char32_t c : *code_points) {
        if (is_white_space(c)) {
            flush();
        } else if (u_ispunct(static_cast<UChar32>(c))) {
            flush();
            std::string punctuation;
            append_utf8(punctuation, c);
            tokens.push_back(std::move(punctuation));
        } else {
            append_utf8(current, c);
        }
    }
    flush();
    return tokens;
}

} // namespace tokbench
