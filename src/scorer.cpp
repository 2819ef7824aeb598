#include "../include/scorer.hpp"

namespace tokbench {

HitRecord score(const std::vector<std::string>& tokens, const GroundTruthVocabulary& vocabulary) {
    HitRecord record;
    record.tokens = tokens.size();
    for (const auto& token : tokens) {
        if (vocabulary.contains(token)) {
            ++record.hits;
        }
    }
    return record;
}

HitRecord Scorer::score(const std::vector<std::string>& tokens) const {
    return tokbench::score(tokens, vocabulary_);
}

double hit_ratio(uint64_t hits, uint64_t tokens) {
    if (tokens == 0) {
        return 0.0;
    }
    return static_cast<double>(hits) / static_cast<double>(tokens);
}

} // namespace tokbench
