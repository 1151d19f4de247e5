#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace oprops {

// Line separator used by every text writer in this library.
inline constexpr std::string_view kLineSeparator = "\n";

/*
 * Destination for character output.
 * Writers hand over line-oriented chunks: a line's content and its
 * separator may arrive as separate writes.
 */
class CharSink {
public:
    virtual ~CharSink() = default;

    virtual void write(std::string_view chunk) = 0;
    virtual void flush() {}
};

// Writes to a std::ostream. Throws IOError once the stream fails.
class StreamSink : public CharSink {
public:
    explicit StreamSink(std::ostream& out) noexcept : out_(out) {}

    void write(std::string_view chunk) override;
    void flush() override;

private:
    std::ostream& out_;
};

// Collects everything written in memory.
class StringSink : public CharSink {
public:
    void write(std::string_view chunk) override { buffer_.append(chunk); }

    const std::string& str() const noexcept { return buffer_; }

private:
    std::string buffer_;
};

} // namespace oprops
