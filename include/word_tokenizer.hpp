#pragma once
#include <string>
#include <vector>
#include "types.hpp"

namespace tokbench {

/**
 * @brief Uniform adapter over one word tokenizer for one language.
 *
 * Setup (models, dictionaries, compiled patterns) runs lazily on the first
 * initialize() or tokenize() call and only once per instance. A failed setup
 * is remembered: every later call rethrows TokenizerInitError without
 * retrying. Instances are confined to a single shard worker.
 */
class WordTokenizer {
public:
    WordTokenizer(std::string id, Language language, bool filter_foreign_tokens = true);
    virtual ~WordTokenizer() = default;

    WordTokenizer(const WordTokenizer&) = delete;
    WordTokenizer& operator=(const WordTokenizer&) = delete;

    const std::string& id() const { return id_; }
    Language language() const { return language_; }

    // Idempotent. Throws TokenizerInitError.
    void initialize();
    bool is_initialized() const { return state_ == State::Ready; }

    /**
     * @brief Ordered tokens of text.
     *
     * When foreign-token filtering is on, tokens without a letter of the
     * language's script (punctuation, Latin words, digits) are removed.
     * @throws TokenizerInitError if setup fails
     * @throws TokenizerRuntimeError if the underlying tokenizer fails on text
     */
    std::vector<std::string> tokenize(const std::string& text);

    TokenSequence tokenize_sentence(const CleanedSentence& sentence);

protected:
    virtual void setup() = 0;
    virtual std::vector<std::string> do_tokenize(const std::string& text) = 0;

private:
    enum class State {
        Uninitialized,
        Ready,
        Failed
    };

    std::string id_;
    Language language_;
    bool filter_foreign_tokens_;
    State state_ = State::Uninitialized;
    std::string init_error_;
};

} // namespace tokbench
