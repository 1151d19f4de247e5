#pragma once

#include "oprops/char_sink.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace oprops {

/*
 * CharSink decorator that drops the last comment line written before the
 * first data line.
 *
 * Text stores always end their comment block with a "#<date>" line, so
 * wrapping the sink with this writer removes the timestamp while keeping any
 * caller comment lines in front of it.
 *
 * A chunk starting with '#' or '!' begins a comment line.
 * One complete comment line is always held back. It is released only when
 * another comment line completes, and discarded when a data chunk arrives.
 */
class CommentFilteringWriter : public CharSink {
public:
    enum class State { Passthrough, Buffering };

    explicit CommentFilteringWriter(CharSink& out) noexcept : out_(out) {}

    CommentFilteringWriter(const CommentFilteringWriter&) = delete;
    CommentFilteringWriter& operator=(const CommentFilteringWriter&) = delete;

    void write(std::string_view chunk) override;

    // Forwards to the wrapped sink. The withheld line is never released.
    void flush() override;

    State state() const noexcept { return state_; }
    bool has_withheld_line() const noexcept { return withheld_.has_value(); }

private:
    void complete_line();

    CharSink& out_;
    State state_{State::Passthrough};
    std::string current_;
    std::optional<std::string> withheld_;
};

} // namespace oprops
