#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "language.hpp"

namespace tokbench {

// One corpus line. offset is the 0-based line number within the language's corpus file.
struct Sentence {
    std::string text;
    Language language = Language::Urdu;
    uint64_t offset = 0;
};

struct CleanedSentence {
    std::string text;
    Language language = Language::Urdu;
    uint64_t offset = 0;
    bool degenerate = false;  // empty after cleaning
};

struct TokenSequence {
    Language language = Language::Urdu;
    std::string tokenizer_id;
    uint64_t offset = 0;
    std::vector<std::string> tokens;
};

/**
 * @brief Per (sentence, tokenizer) match counts. Invariant: hits <= tokens.
 */
struct HitRecord {
    uint64_t hits = 0;
    uint64_t tokens = 0;

    bool operator==(const HitRecord& other) const {
        return hits == other.hits && tokens == other.tokens;
    }
};

} // namespace tokbench
