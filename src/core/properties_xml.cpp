#include "oprops/properties_engine.hpp"
#include "oprops/errors.hpp"

#include "codec.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <utility>
#include <vector>

namespace oprops {

namespace {

constexpr std::string_view properties_dtd = "http://java.sun.com/dtd/properties.dtd";

enum class XmlCharset { Utf8, Latin1, Ascii };

std::string lowercase(std::string_view text) {
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return std::tolower(c);
    });
    return out;
}

std::optional<XmlCharset> charset_for(std::string_view name) {
    std::string lower = lowercase(name);
    if (lower == "utf-8" || lower == "utf8")
        return XmlCharset::Utf8;
    if (lower == "iso-8859-1" || lower == "iso8859-1" || lower == "8859_1" || lower == "latin1" || lower == "latin-1")
        return XmlCharset::Latin1;
    if (lower == "us-ascii" || lower == "ascii")
        return XmlCharset::Ascii;
    return std::nullopt;
}

bool encodable(char32_t cp, XmlCharset charset) {
    switch (charset) {
    case XmlCharset::Utf8: return true;
    case XmlCharset::Latin1: return cp <= 0xFF;
    case XmlCharset::Ascii: return cp <= 0x7F;
    }
    return false;
}

bool is_xml_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == ':' || c == '-' || c == '.' ||
           static_cast<unsigned char>(c) >= 0x80;
}

/*
 * Minimal pull parser for the properties document type.
 * Operates on UTF-8 text with line endings already normalized to '\n'.
 */
class XmlReader {
public:
    XmlReader(std::string_view doc, PropertyStorage& storage) : doc_(doc), storage_(storage) {}

    std::size_t parse() {
        skip_misc();
        if (starts_with("<!DOCTYPE")) {
            parse_doctype();
            skip_misc();
        }

        if (at_end())
            throw FormatError{"missing root element"};
        expect('<');
        std::string root = read_name();
        if (root != "properties")
            throw FormatError{"root element must be <properties>, found <" + root + ">"};
        read_attributes();
        if (!consume("/>")) {
            expect('>');
            parse_properties_content();
        }

        skip_misc();
        if (!at_end())
            throw FormatError{"unexpected content after root element"};
        return count_;
    }

private:
    void parse_properties_content() {
        bool seen_comment = false;
        bool seen_entry = false;

        for (;;) {
            skip_space();
            if (at_end())
                throw FormatError{"unexpected end of document inside <properties>"};

            if (starts_with("<!--")) {
                skip_comment();
                continue;
            }
            if (starts_with("<?")) {
                skip_pi();
                continue;
            }
            if (consume("</")) {
                close_tag("properties");
                return;
            }
            if (peek() != '<')
                throw FormatError{"text is not allowed directly inside <properties>"};

            ++pos_;
            std::string name = read_name();
            auto attributes = read_attributes();
            bool empty_element = consume("/>");
            if (!empty_element)
                expect('>');

            if (name == "comment") {
                if (seen_comment || seen_entry)
                    throw FormatError{"<comment> must appear at most once, before any <entry>"};
                seen_comment = true;
                if (!empty_element)
                    read_text("comment");
            } else if (name == "entry") {
                seen_entry = true;
                auto key = std::find_if(attributes.begin(), attributes.end(), [](const auto& attr) {
                    return attr.first == "key";
                });
                if (key == attributes.end())
                    throw FormatError{"<entry> requires a key attribute"};
                std::string value = empty_element ? std::string{} : read_text("entry");
                storage_.put(key->second, std::move(value));
                ++count_;
            } else {
                throw FormatError{"unexpected element <" + name + ">"};
            }
        }
    }

    // Character data up to the matching close tag; child elements are rejected.
    std::string read_text(std::string_view element) {
        std::string text;
        for (;;) {
            if (at_end())
                throw FormatError{"unexpected end of document inside <" + std::string{element} + ">"};

            char c = peek();
            if (c == '&') {
                read_reference(text);
            } else if (c != '<') {
                text.push_back(c);
                ++pos_;
            } else if (starts_with("<![CDATA[")) {
                pos_ += 9;
                auto end = doc_.find("]]>", pos_);
                if (end == std::string_view::npos)
                    throw FormatError{"unterminated CDATA section"};
                text.append(doc_.substr(pos_, end - pos_));
                pos_ = end + 3;
            } else if (starts_with("<!--")) {
                skip_comment();
            } else if (starts_with("<?")) {
                skip_pi();
            } else if (consume("</")) {
                close_tag(element);
                return text;
            } else {
                throw FormatError{"element content is not allowed inside <" + std::string{element} + ">"};
            }
        }
    }

    std::vector<std::pair<std::string, std::string>> read_attributes() {
        std::vector<std::pair<std::string, std::string>> attributes;
        for (;;) {
            skip_space();
            if (at_end())
                throw FormatError{"unexpected end of document inside tag"};
            char c = peek();
            if (c == '>' || c == '/')
                return attributes;

            std::string name = read_name();
            skip_space();
            expect('=');
            skip_space();
            if (at_end())
                throw FormatError{"unexpected end of document inside tag"};
            char quote = peek();
            if (quote != '"' && quote != '\'')
                throw FormatError{"attribute value must be quoted"};
            ++pos_;

            std::string value;
            for (;;) {
                if (at_end())
                    throw FormatError{"unterminated attribute value"};
                c = peek();
                if (c == quote) {
                    ++pos_;
                    break;
                }
                if (c == '<')
                    throw FormatError{"'<' is not allowed in attribute values"};
                if (c == '&') {
                    read_reference(value);
                } else {
                    value.push_back(is_xml_space(c) ? ' ' : c);
                    ++pos_;
                }
            }
            attributes.emplace_back(std::move(name), std::move(value));
        }
    }

    void read_reference(std::string& out) {
        auto end = doc_.find(';', pos_);
        if (end == std::string_view::npos)
            throw FormatError{"unterminated entity reference"};
        std::string_view ref = doc_.substr(pos_ + 1, end - pos_ - 1);
        pos_ = end + 1;

        if (ref == "amp") out.push_back('&');
        else if (ref == "lt") out.push_back('<');
        else if (ref == "gt") out.push_back('>');
        else if (ref == "quot") out.push_back('"');
        else if (ref == "apos") out.push_back('\'');
        else if (ref.size() > 1 && ref.front() == '#') {
            std::string_view digits = ref.substr(1);
            int base = 10;
            if (!digits.empty() && (digits.front() == 'x' || digits.front() == 'X')) {
                digits.remove_prefix(1);
                base = 16;
            }
            std::uint32_t cp = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), cp, base);
            if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size() ||
                cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                throw FormatError{"invalid character reference &" + std::string{ref} + ";"};
            codec::append_utf8(out, static_cast<char32_t>(cp));
        } else {
            throw FormatError{"undefined entity &" + std::string{ref} + ";"};
        }
    }

    void parse_doctype() {
        pos_ += 9;
        skip_space();
        std::string name = read_name();
        if (name != "properties")
            throw FormatError{"DOCTYPE must declare <properties>, found " + name};

        // External id and optional internal subset
        char quote = 0;
        int bracket_depth = 0;
        for (; pos_ < doc_.size(); ++pos_) {
            char c = doc_[pos_];
            if (quote != 0) {
                if (c == quote)
                    quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '[') {
                ++bracket_depth;
            } else if (c == ']') {
                --bracket_depth;
            } else if (c == '>' && bracket_depth == 0) {
                ++pos_;
                return;
            }
        }
        throw FormatError{"unterminated DOCTYPE declaration"};
    }

    void close_tag(std::string_view expected) {
        std::string name = read_name();
        if (name != expected)
            throw FormatError{"mismatched close tag </" + name + ">, expected </" + std::string{expected} + ">"};
        skip_space();
        expect('>');
    }

    std::string read_name() {
        std::size_t start = pos_;
        while (pos_ < doc_.size() && is_name_char(doc_[pos_]))
            ++pos_;
        if (start == pos_)
            throw FormatError{at_end() ? "unexpected end of document" : "expected a name"};
        return std::string{doc_.substr(start, pos_ - start)};
    }

    // Whitespace, comments and processing instructions between markup
    void skip_misc() {
        for (;;) {
            skip_space();
            if (starts_with("<!--"))
                skip_comment();
            else if (starts_with("<?"))
                skip_pi();
            else
                return;
        }
    }

    void skip_comment() {
        auto end = doc_.find("-->", pos_ + 4);
        if (end == std::string_view::npos)
            throw FormatError{"unterminated comment"};
        pos_ = end + 3;
    }

    void skip_pi() {
        auto end = doc_.find("?>", pos_ + 2);
        if (end == std::string_view::npos)
            throw FormatError{"unterminated processing instruction"};
        pos_ = end + 2;
    }

    void skip_space() {
        while (pos_ < doc_.size() && is_xml_space(doc_[pos_]))
            ++pos_;
    }

    void expect(char c) {
        if (at_end())
            throw FormatError{std::string{"unexpected end of document, expected '"} + c + "'"};
        if (doc_[pos_] != c)
            throw FormatError{std::string{"expected '"} + c + "', found '" + doc_[pos_] + "'"};
        ++pos_;
    }

    bool consume(std::string_view token) {
        if (!starts_with(token))
            return false;
        pos_ += token.size();
        return true;
    }

    bool starts_with(std::string_view token) const { return doc_.substr(pos_).starts_with(token); }
    bool at_end() const { return pos_ >= doc_.size(); }
    char peek() const { return doc_[pos_]; }

    std::string_view doc_;
    PropertyStorage& storage_;
    std::size_t pos_{0};
    std::size_t count_{0};
};

std::string normalize_line_endings(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
        } else {
            out.push_back(text[i]);
        }
    }
    return out;
}

// Encoding named in the XML declaration, UTF-8 when absent.
XmlCharset declared_charset(std::string_view doc) {
    if (!doc.starts_with("<?xml"))
        return XmlCharset::Utf8;
    auto end = doc.find("?>");
    if (end == std::string_view::npos)
        throw FormatError{"unterminated XML declaration"};

    std::string_view decl = doc.substr(0, end);
    auto attr = decl.find("encoding");
    if (attr == std::string_view::npos)
        return XmlCharset::Utf8;
    auto open = decl.find_first_of("\"'", attr);
    if (open == std::string_view::npos)
        throw FormatError{"malformed encoding declaration"};
    auto close = decl.find(decl[open], open + 1);
    if (close == std::string_view::npos)
        throw FormatError{"malformed encoding declaration"};

    std::string_view name = decl.substr(open + 1, close - open - 1);
    auto charset = charset_for(name);
    if (!charset)
        throw FormatError{"unsupported document encoding " + std::string{name}};
    return *charset;
}

void append_escaped(std::string& out, std::string_view text, XmlCharset charset, bool escape_quotes) {
    std::size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = codec::next_code_point(text, pos);
        switch (cp) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"':
            out += escape_quotes ? "&quot;" : "\"";
            break;
        default:
            if (encodable(cp, charset)) {
                codec::append_utf8(out, cp);
            } else {
                std::array<char, 8> hex{};
                auto [ptr, ec] = std::to_chars(hex.data(), hex.data() + hex.size(), static_cast<std::uint32_t>(cp), 16);
                out += "&#x";
                out.append(hex.data(), ptr);
                out += ';';
            }
            break;
        }
    }
}

} // namespace

std::size_t PropertiesEngine::load_xml(std::istream& in) {
    std::string data = codec::read_all(in);
    return load_xml(data);
}

std::size_t PropertiesEngine::load_xml(std::string_view document) {
    if (document.starts_with("\xEF\xBB\xBF"))
        document.remove_prefix(3);

    std::string utf8;
    if (declared_charset(document) == XmlCharset::Latin1)
        utf8 = codec::latin1_to_utf8(document);
    else
        utf8 = std::string{document};

    std::string normalized = normalize_line_endings(utf8);
    XmlReader reader{normalized, storage_};
    return reader.parse();
}

void PropertiesEngine::store_xml(std::ostream& out, const std::optional<std::string>& comment,
                                 std::string_view encoding) {
    auto charset = charset_for(encoding);
    if (!charset)
        throw IOError{"unsupported encoding " + std::string{encoding}};
    require_values();

    std::string doc;
    doc += "<?xml version=\"1.0\" encoding=\"";
    doc += encoding;
    doc += "\" standalone=\"no\"?>\n";
    doc += "<!DOCTYPE properties SYSTEM \"";
    doc += properties_dtd;
    doc += "\">\n";
    doc += "<properties>\n";

    if (comment) {
        doc += "<comment>";
        append_escaped(doc, *comment, *charset, false);
        doc += "</comment>\n";
    }

    for (const auto& key : storage_.keys()) {
        doc += "<entry key=\"";
        append_escaped(doc, key, *charset, true);
        doc += "\">";
        append_escaped(doc, storage_.get(key).value_or(""), *charset, false);
        doc += "</entry>\n";
    }
    doc += "</properties>\n";

    StreamSink sink{out};
    if (*charset == XmlCharset::Utf8)
        sink.write(doc);
    else
        sink.write(codec::utf8_to_latin1(doc));
    sink.flush();
}

} // namespace oprops
