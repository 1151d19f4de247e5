#pragma once

#include <stdexcept>
#include <string>

namespace oprops {

// Malformed escape sequence, truncated XML or schema mismatch while loading.
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& msg) : std::runtime_error(msg) {}
};

// Stream read/write failure.
class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& msg) : std::runtime_error(msg) {}
};

// Store cannot be built or written in its current form
// (incompatible snapshot, null value on store).
class InvalidState : public std::runtime_error {
public:
    explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace oprops
