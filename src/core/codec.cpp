#include "codec.hpp"

#include "oprops/errors.hpp"

#include <iterator>

namespace oprops::codec {

void append_utf8(std::string& out, char32_t cp) {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        cp = replacement_char;

    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

char32_t next_code_point(std::string_view text, std::size_t& pos) {
    auto lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80) {
        ++pos;
        return lead;
    }

    std::size_t length = 0;
    char32_t cp = 0;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp = lead & 0x07;
    } else {
        ++pos;
        return replacement_char;
    }

    if (pos + length > text.size()) {
        ++pos;
        return replacement_char;
    }
    for (std::size_t i = 1; i < length; ++i) {
        auto cont = static_cast<unsigned char>(text[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            ++pos;
            return replacement_char;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    pos += length;
    return cp;
}

std::size_t code_point_count(std::string_view text) {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        next_code_point(text, pos);
        ++count;
    }
    return count;
}

std::string latin1_to_utf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (char c : bytes)
        append_utf8(out, static_cast<unsigned char>(c));
    return out;
}

std::string utf8_to_latin1(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = next_code_point(text, pos);
        out.push_back(cp <= 0xFF ? static_cast<char>(cp) : '?');
    }
    return out;
}

void append_unicode_escape(std::string& out, char16_t unit) {
    static constexpr char hex_digits[] = "0123456789ABCDEF";
    out += "\\u";
    out.push_back(hex_digits[(unit >> 12) & 0xF]);
    out.push_back(hex_digits[(unit >> 8) & 0xF]);
    out.push_back(hex_digits[(unit >> 4) & 0xF]);
    out.push_back(hex_digits[unit & 0xF]);
}

void append_escaped_code_point(std::string& out, char32_t cp) {
    if (cp < 0x10000) {
        append_unicode_escape(out, static_cast<char16_t>(cp));
        return;
    }
    cp -= 0x10000;
    append_unicode_escape(out, static_cast<char16_t>(0xD800 + (cp >> 10)));
    append_unicode_escape(out, static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
}

bool is_high_surrogate(char32_t unit) noexcept {
    return unit >= 0xD800 && unit <= 0xDBFF;
}

bool is_low_surrogate(char32_t unit) noexcept {
    return unit >= 0xDC00 && unit <= 0xDFFF;
}

std::string read_all(std::istream& in) {
    if (!in)
        throw IOError{"input stream is not readable"};

    std::string data{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad())
        throw IOError{"read failed"};
    return data;
}

} // namespace oprops::codec
