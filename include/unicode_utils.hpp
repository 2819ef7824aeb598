#pragma once
#include <string>
#include <optional>
#include <functional>

namespace tokbench {

// Decodes UTF-8 into code points. Returns std::nullopt for ill-formed input.
std::optional<std::u32string> decode_utf8(const std::string& text);

bool is_valid_utf8(const std::string& text);

void append_utf8(std::string& out, char32_t code_point);
std::string encode_utf8(const std::u32string& code_points);

// Visits every well-formed code point; ill-formed bytes are skipped.
void for_each_code_point(const std::string& text, const std::function<void(char32_t)>& visit);

// Unicode White_Space property.
bool is_white_space(char32_t code_point);

} // namespace tokbench
