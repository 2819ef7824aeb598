#pragma once
#include <string>
#include <unordered_set>
#include "language.hpp"
#include "token_normalizer.hpp"

namespace tokbench {

/**
 * @brief Ground-truth word set for one language, stored in normalized form.
 *
 * Loaded once before a run and only read afterwards, so concurrent
 * contains() calls from shard workers are safe.
 */
class GroundTruthVocabulary {
public:
    explicit GroundTruthVocabulary(Language language);

    /**
     * @brief Loads a word list. ".csv" files contribute their first column,
     * anything else one word per line. A leading "Words" header line (the
     * format of exported word lists) and blank lines are skipped.
     * @throws LoadError if the file cannot be opened.
     */
    static GroundTruthVocabulary load_from_file(const std::string& path, Language language);

    // Normalizes and inserts; returns false for empty or duplicate words.
    bool add(const std::string& word);

    // Normalizes token with the same policy used when building the set.
    bool contains(const std::string& token) const;
    bool contains_normalized(const std::string& normalized_token) const;

    std::string normalize(const std::string& token) const { return normalizer_.normalize(token); }

    size_t size() const { return words_.size(); }
    bool empty() const { return words_.empty(); }
    Language language() const { return language_; }

private:
    Language language_;
    TokenNormalizer normalizer_;
    std::unordered_set<std::string> words_;

    static std::string first_csv_field(const std::string& line);
};

} // namespace tokbench
