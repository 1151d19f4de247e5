#include "oprops/properties_engine.hpp"
#include "oprops/errors.hpp"

#include "codec.hpp"

#include <array>

namespace oprops {

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\f';
}

bool is_line_end(char c) {
    return c == '\n' || c == '\r';
}

/*
 * Splits text into logical lines.
 * Comment and blank lines are skipped, leading whitespace is stripped and
 * backslash continuations are joined. Escapes are left for unescape().
 */
class LineReader {
public:
    explicit LineReader(std::string_view text) : text_(text) {}

    bool next(std::string& line) {
        line.clear();
        bool skip_blank = true;
        bool appended_line_begin = false;
        bool new_line = true;
        bool preceding_backslash = false;
        bool skip_lf = false;

        while (pos_ < text_.size()) {
            char c = text_[pos_++];

            if (skip_lf) {
                skip_lf = false;
                if (c == '\n')
                    continue;
            }

            if (skip_blank) {
                if (is_blank(c))
                    continue;
                if (!appended_line_begin && is_line_end(c))
                    continue;
                skip_blank = false;
                appended_line_begin = false;
            }

            if (new_line) {
                new_line = false;
                if (c == '#' || c == '!') {
                    // Comment lines never continue
                    while (pos_ < text_.size() && !is_line_end(text_[pos_]))
                        ++pos_;
                    skip_blank = true;
                    new_line = true;
                    continue;
                }
            }

            if (!is_line_end(c)) {
                line.push_back(c);
                preceding_backslash = (c == '\\') ? !preceding_backslash : false;
                continue;
            }

            if (line.empty()) {
                skip_blank = true;
                new_line = true;
                continue;
            }

            if (preceding_backslash) {
                line.pop_back();
                skip_blank = true;
                appended_line_begin = true;
                preceding_backslash = false;
                if (c == '\r')
                    skip_lf = true;
                continue;
            }

            return true;
        }

        if (line.empty())
            return false;
        if (preceding_backslash)
            line.pop_back();
        return true;
    }

private:
    std::string_view text_;
    std::size_t pos_{0};
};

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

// Resolves \t \n \r \f \uXXXX and \x escapes.
std::string unescape(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    char32_t pending_high = 0;

    auto flush_pending = [&] {
        if (pending_high != 0) {
            codec::append_utf8(out, codec::replacement_char);
            pending_high = 0;
        }
    };

    std::size_t pos = 0;
    while (pos < in.size()) {
        char c = in[pos++];
        if (c != '\\') {
            flush_pending();
            out.push_back(c);
            continue;
        }
        if (pos >= in.size())
            break;

        c = in[pos++];
        if (c != 'u') {
            flush_pending();
            switch (c) {
            case 't': out.push_back('\t'); break;
            case 'r': out.push_back('\r'); break;
            case 'n': out.push_back('\n'); break;
            case 'f': out.push_back('\f'); break;
            default: out.push_back(c); break;
            }
            continue;
        }

        if (pos + 4 > in.size())
            throw FormatError{"Malformed \\uxxxx encoding."};
        char32_t unit = 0;
        for (int i = 0; i < 4; ++i) {
            int digit = hex_value(in[pos++]);
            if (digit < 0)
                throw FormatError{"Malformed \\uxxxx encoding."};
            unit = (unit << 4) | static_cast<char32_t>(digit);
        }

        if (codec::is_high_surrogate(unit)) {
            flush_pending();
            pending_high = unit;
        } else if (codec::is_low_surrogate(unit)) {
            if (pending_high != 0) {
                codec::append_utf8(out, 0x10000 + ((pending_high - 0xD800) << 10) + (unit - 0xDC00));
                pending_high = 0;
            } else {
                codec::append_utf8(out, codec::replacement_char);
            }
        } else {
            flush_pending();
            codec::append_utf8(out, unit);
        }
    }
    flush_pending();
    return out;
}

// Escapes a key or value for the text format. Keys escape every space,
// values only a leading one.
std::string escape(std::string_view text, bool escape_space, bool escape_unicode) {
    std::string out;
    out.reserve(text.size() * 2);

    std::size_t pos = 0;
    bool first = true;
    while (pos < text.size()) {
        char32_t cp = codec::next_code_point(text, pos);

        if (cp > 61 && cp < 127) {
            if (cp == '\\')
                out += "\\\\";
            else
                out.push_back(static_cast<char>(cp));
            first = false;
            continue;
        }

        switch (cp) {
        case ' ':
            if (first || escape_space)
                out.push_back('\\');
            out.push_back(' ');
            break;
        case '\t': out += "\\t"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\f': out += "\\f"; break;
        case '=':
        case ':':
        case '#':
        case '!':
            out.push_back('\\');
            out.push_back(static_cast<char>(cp));
            break;
        default:
            if ((cp < 0x20 || cp > 0x7E) && escape_unicode)
                codec::append_escaped_code_point(out, cp);
            else
                codec::append_utf8(out, cp);
            break;
        }
        first = false;
    }
    return out;
}

/*
 * Writes chunks in the target encoding. Chunks are built as UTF-8;
 * for ISO-8859-1 they only ever hold code points up to U+00FF.
 */
class TextWriter {
public:
    TextWriter(CharSink& out, Encoding encoding) : out_(out), encoding_(encoding) {}

    void write(std::string_view chunk) {
        if (chunk.empty())
            return;
        if (encoding_ == Encoding::Iso8859_1)
            out_.write(codec::utf8_to_latin1(chunk));
        else
            out_.write(chunk);
    }

    void new_line() { out_.write(kLineSeparator); }

    void flush() { out_.flush(); }

private:
    CharSink& out_;
    Encoding encoding_;
};

// Each line of the comment gets a '#' unless it already starts with '#' or '!'.
void write_comments(TextWriter& writer, std::string_view comments) {
    writer.write("#");

    std::string pending;
    std::size_t pos = 0;
    while (pos < comments.size()) {
        char32_t cp = codec::next_code_point(comments, pos);

        if (cp > 0xFF) {
            codec::append_escaped_code_point(pending, cp);
            continue;
        }
        if (cp != '\n' && cp != '\r') {
            codec::append_utf8(pending, cp);
            continue;
        }

        writer.write(pending);
        pending.clear();
        writer.new_line();
        if (cp == '\r' && pos < comments.size() && comments[pos] == '\n')
            ++pos;
        if (pos == comments.size() || (comments[pos] != '#' && comments[pos] != '!'))
            writer.write("#");
    }
    writer.write(pending);
    writer.new_line();
}

} // namespace

std::size_t PropertiesEngine::load(std::istream& in, Encoding encoding) {
    std::string data = codec::read_all(in);
    return load(data, encoding);
}

std::size_t PropertiesEngine::load(std::string_view text, Encoding encoding) {
    std::string decoded;
    if (encoding == Encoding::Iso8859_1) {
        decoded = codec::latin1_to_utf8(text);
        text = decoded;
    }

    LineReader reader{text};
    std::string line;
    std::size_t count = 0;

    while (reader.next(line)) {
        std::size_t key_len = 0;
        std::size_t value_start = line.size();
        bool has_separator = false;
        bool preceding_backslash = false;

        while (key_len < line.size()) {
            char c = line[key_len];
            if ((c == '=' || c == ':') && !preceding_backslash) {
                value_start = key_len + 1;
                has_separator = true;
                break;
            }
            if (is_blank(c) && !preceding_backslash) {
                value_start = key_len + 1;
                break;
            }
            preceding_backslash = (c == '\\') ? !preceding_backslash : false;
            ++key_len;
        }

        while (value_start < line.size()) {
            char c = line[value_start];
            if (!is_blank(c)) {
                if (!has_separator && (c == '=' || c == ':'))
                    has_separator = true;
                else
                    break;
            }
            ++value_start;
        }

        std::string_view raw{line};
        storage_.put(unescape(raw.substr(0, key_len)), unescape(raw.substr(value_start)));
        ++count;
    }
    return count;
}

void PropertiesEngine::store(CharSink& out, const std::optional<std::string>& comment, Encoding encoding) {
    require_values();

    TextWriter writer{out, encoding};
    if (comment)
        write_comments(writer, *comment);

    writer.write("#" + format_date(std::time(nullptr)));
    writer.new_line();

    bool escape_unicode = encoding == Encoding::Iso8859_1;
    for (const auto& key : storage_.keys()) {
        auto value = storage_.get(key);
        writer.write(escape(key, true, escape_unicode) + "=" + escape(value.value_or(""), false, escape_unicode));
        writer.new_line();
    }
    writer.flush();
}

void PropertiesEngine::list(std::ostream& out) const {
    out << "-- listing properties --\n";
    for (const auto& key : storage_.keys()) {
        std::string value = storage_.get(key).value_or("");
        if (codec::code_point_count(value) > 40) {
            std::size_t pos = 0;
            for (int i = 0; i < 37; ++i)
                codec::next_code_point(value, pos);
            value.resize(pos);
            value += "...";
        }
        out << key << '=' << value << '\n';
    }
    out.flush();
    if (!out)
        throw IOError{"write failed"};
}

std::string PropertiesEngine::format_date(std::time_t when) {
    std::tm local{};
    localtime_r(&when, &local);

    std::array<char, 64> buffer{};
    std::size_t n = std::strftime(buffer.data(), buffer.size(), "%a %b %d %H:%M:%S %Z %Y", &local);
    return std::string{buffer.data(), n};
}

// Null values cannot be written; fail before producing any output.
void PropertiesEngine::require_values() const {
    for (const auto& key : storage_.keys()) {
        if (!storage_.get(key))
            throw InvalidState{"cannot store null value for key '" + key + "'"};
    }
}

} // namespace oprops
