#pragma once
#include <string>
#include <unicode/normalizer2.h>

namespace tokbench {

/**
 * @brief Matching normal form shared by vocabulary construction and scoring.
 *
 * ICU NFKC_Casefold (compatibility composition, full case folding, removal of
 * default ignorables such as ZWJ/ZWNJ) followed by trimming white space.
 * Diacritics are left alone.
 */
class TokenNormalizer {
public:
    TokenNormalizer();

    std::string normalize(const std::string& token) const;

private:
    const icu::Normalizer2* normalizer_;
};

} // namespace tokbench
