#include "../include/word_tokenizer.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"
#include <algorithm>
#include <utility>

namespace tokbench {

WordTokenizer::WordTokenizer(std::string id, Language language, bool filter_foreign_tokens)
    : id_(std::move(id)), language_(language), filter_foreign_tokens_(filter_foreign_tokens) {}

void WordTokenizer::initialize() {
    if (state_ == State::Ready) {
        return;
    }
    if (state_ == State::Failed) {
        throw TokenizerInitError(init_error_);
    }

    try {
        setup();
    } catch (const TokenizerInitError& e) {
        state_ = State::Failed;
        init_error_ = e.what();
        throw;
    } catch (const std::exception& e) {
        state_ = State::Failed;
        init_error_ = id_ + " (" + language_code(language_) + ") setup failed: " + e.what();
        throw TokenizerInitError(init_error_);
    }

    state_ = State::Ready;
    log_debug("Tokenizer " + id_ + " initialized for " + language_code(language_));
}

std::vector<std::string> WordTokenizer::tokenize(const std::string& text) {
    initialize();

    std::vector<std::string> tokens;
    try {
        tokens = do_tokenize(text);
    } catch (const TokenizerRuntimeError&) {
        throw;
    } catch (const std::exception& e) {
        throw TokenizerRuntimeError(id_ + ": " + e.what());
    }

    if (filter_foreign_tokens_) {
        const Language language = language_;
        tokens.erase(std::remove_if(tokens.begin(), tokens.end(),
                                    [language](const std::string& token) {
                                        return !has_script_letter(token, language);
                                    }),
                     tokens.end());
    }
    return tokens;
}

TokenSequence WordTokenizer::tokenize_sentence(const CleanedSentence& sentence) {
    TokenSequence sequence;
    sequence.language = sentence.language;
    sequence.tokenizer_id = id_;
    sequence.offset = sentence.offset;
    sequence.tokens = tokenize(sentence.text);
    return sequence;
}

} // namespace tokbench
