#pragma once

namespace oprops {

// Character encoding of a text-format stream.
enum class Encoding {
    Iso8859_1, // byte stream; characters outside printable ASCII are \u-escaped on write
    Utf8       // character stream; non-ASCII characters pass through unescaped
};

} // namespace oprops
