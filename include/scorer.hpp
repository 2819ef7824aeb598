#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "types.hpp"
#include "vocabulary.hpp"

namespace tokbench {

/**
 * @brief Counts tokens whose normalized form is in the vocabulary.
 *
 * Multiset semantics: a repeated token is counted once per occurrence.
 * An empty token list scores {0, 0}.
 */
HitRecord score(const std::vector<std::string>& tokens, const GroundTruthVocabulary& vocabulary);

class Scorer {
public:
    explicit Scorer(const GroundTruthVocabulary& vocabulary) : vocabulary_(vocabulary) {}

    HitRecord score(const std::vector<std::string>& tokens) const;
    HitRecord score(const TokenSequence& sequence) const { return score(sequence.tokens); }

private:
    const GroundTruthVocabulary& vocabulary_;
};

// hits / tokens, 0 when tokens == 0.
double hit_ratio(uint64_t hits, uint64_t tokens);

} // namespace tokbench
