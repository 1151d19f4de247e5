#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>

namespace oprops::codec {

inline constexpr char32_t replacement_char = 0xFFFD;

void append_utf8(std::string& out, char32_t cp);

// Decodes one code point starting at pos and advances pos.
// Invalid sequences yield U+FFFD and consume one byte.
char32_t next_code_point(std::string_view text, std::size_t& pos);

std::size_t code_point_count(std::string_view text);

std::string latin1_to_utf8(std::string_view bytes);

// Code points above U+00FF become '?'.
std::string utf8_to_latin1(std::string_view text);

// Appends \uXXXX for one UTF-16 code unit, uppercase hex.
void append_unicode_escape(std::string& out, char16_t unit);

// Appends \uXXXX (two escapes above U+FFFF).
void append_escaped_code_point(std::string& out, char32_t cp);

bool is_high_surrogate(char32_t unit) noexcept;
bool is_low_surrogate(char32_t unit) noexcept;

// Reads the remaining stream content. Throws IOError on stream failure.
std::string read_all(std::istream& in);

} // namespace oprops::codec
