#include "oprops/comment_filtering_writer.hpp"

#include <utility>

namespace oprops {

void CommentFilteringWriter::write(std::string_view chunk) {
    if (chunk.empty())
        return;

    if (state_ == State::Buffering) {
        current_.append(chunk);
        if (current_.ends_with(kLineSeparator))
            complete_line();
        return;
    }

    // Passthrough. Data lines escape a leading '#' or '!', so either marks a comment
    if (chunk.front() == '#' || chunk.front() == '!') {
        state_ = State::Buffering;
        current_.assign(chunk);
        if (current_.ends_with(kLineSeparator))
            complete_line();
        return;
    }

    // First data chunk: the withheld line was the last comment line, drop it
    withheld_.reset();
    out_.write(chunk);
}

void CommentFilteringWriter::flush() {
    out_.flush();
}

void CommentFilteringWriter::complete_line() {
    if (withheld_)
        out_.write(*withheld_);

    withheld_ = std::move(current_);
    current_.clear();
    state_ = State::Passthrough;
}

} // namespace oprops
