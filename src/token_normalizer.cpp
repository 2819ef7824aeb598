#include "../include/token_normalizer.hpp"
#include <stdexcept>
#include <unicode/normalizer2.h>
#include <unicode/unistr.h>

namespace tokbench {

TokenNormalizer::TokenNormalizer() : normalizer_(nullptr) {
    UErrorCode status = U_ZERO_ERROR;
    normalizer_ = icu::Normalizer2::getNFKCCasefoldInstance(status);
    if (U_FAILURE(status) || normalizer_ == nullptr) {
        throw std::runtime_error(std::string("Failed to load NFKC_Casefold data: ") + u_errorName(status));
    }
}

std::string TokenNormalizer::normalize(const std::string& token) const {
    icu::UnicodeString source = icu::UnicodeString::fromUTF8(token);
    UErrorCode status = U_ZERO_ERROR;
    icu::UnicodeString normalized = normalizer_->normalize(source, status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("Normalization failed: ") + u_errorName(status));
    }
    normalized.trim();

    std::string result;
    normalized.toUTF8String(result);
    return result;
}

} // namespace tokbench
