#pragma once

#include "oprops/char_sink.hpp"
#include "oprops/encoding.hpp"
#include "oprops/property_storage.hpp"

#include <cstddef>
#include <ctime>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace oprops {

/*
 * Reads and writes the .properties text format and the XML properties format.
 *
 * The engine keeps no entries of its own: every lookup, insert and key
 * enumeration goes to the bound PropertyStorage. Construct one per operation.
 */
class PropertiesEngine {
public:
    explicit PropertiesEngine(PropertyStorage& storage) noexcept : storage_(storage) {}

    PropertiesEngine(const PropertiesEngine&) = delete;
    PropertiesEngine& operator=(const PropertiesEngine&) = delete;

    // Parses key=value lines and puts each entry as soon as it is read.
    // Returns the number of entries read.
    // Throws FormatError on a malformed \uxxxx escape, IOError on read failure.
    // Entries read before a failure stay in storage.
    std::size_t load(std::istream& in, Encoding encoding);
    std::size_t load(std::string_view text, Encoding encoding);

    // Throws FormatError on malformed or truncated XML, or a schema violation.
    std::size_t load_xml(std::istream& in);
    std::size_t load_xml(std::string_view document);

    // Writes the optional comment, a "#<date>" line and one line per entry.
    // Throws InvalidState if a value is null, IOError if the sink fails.
    void store(CharSink& out, const std::optional<std::string>& comment, Encoding encoding);

    // Throws IOError for an unsupported encoding or a failed stream.
    void store_xml(std::ostream& out, const std::optional<std::string>& comment, std::string_view encoding);

    // Human-readable dump, long values truncated.
    void list(std::ostream& out) const;

    // Formats a timestamp the way the date comment line shows it,
    // e.g. "Mon Oct 19 14:03:11 UTC 2026". Local time.
    static std::string format_date(std::time_t when);

private:
    void require_values() const;

    PropertyStorage& storage_;
};

} // namespace oprops
