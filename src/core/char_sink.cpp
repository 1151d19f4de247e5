#include "oprops/char_sink.hpp"
#include "oprops/errors.hpp"

namespace oprops {

void StreamSink::write(std::string_view chunk) {
    out_.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    if (!out_)
        throw IOError{"write failed"};
}

void StreamSink::flush() {
    out_.flush();
    if (!out_)
        throw IOError{"flush failed"};
}

} // namespace oprops
