#include "../include/unicode_utils.hpp"
#include <cstdint>
#include <limits>
#include <unicode/utf8.h>
#include <unicode/uchar.h>

namespace tokbench {

std::optional<std::u32string> decode_utf8(const std::string& text) {
    if (text.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        return std::nullopt;
    }

    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const int32_t length = static_cast<int32_t>(text.size());
    std::u32string result;
    result.reserve(text.size());

    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        if (c < 0) {
            return std::nullopt;
        }
        result.push_back(static_cast<char32_t>(c));
    }
    return result;
}

bool is_valid_utf8(const std::string& text) {
    return decode_utf8(text).has_value();
}

void append_utf8(std::string& out, char32_t code_point) {
    uint8_t buffer[U8_MAX_LENGTH];
    int32_t length = 0;
    U8_APPEND_UNSAFE(buffer, length, static_cast<UChar32>(code_point));
    out.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(length));
}

std::string encode_utf8(const std::u32string& code_points) {
    std::string out;
    out.reserve(code_points.size() * 2);
    for (char32_t c : code_points) {
        append_utf8(out, c);
    }
    return out;
}

void for_each_code_point(const std::string& text, const std::function<void(char32_t)>& visit) {
    if (text.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        return;
    }
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const int32_t length = static_cast<int32_t>(text.size());

    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        if (c >= 0) {
            visit(static_cast<char32_t>(c));
        }
    }
}

bool is_white_space(char32_t code_point) {
    return u_isUWhiteSpace(static_cast<UChar32>(code_point));
}

} // namespace tokbench
