#include "oprops/snapshot.hpp"
#include "oprops/errors.hpp"

#include <algorithm>
#include <bit>
#include <cstring>
#include <limits>
#include <string>
#include <utility>

namespace oprops {

namespace {

constexpr std::uint32_t byteswap32(std::uint32_t v) noexcept {
    return ((v & 0xFF000000u) >> 24) |
           ((v & 0x00FF0000u) >> 8) |
           ((v & 0x0000FF00u) << 8) |
           ((v & 0x000000FFu) << 24);
}

constexpr std::uint32_t to_le32(std::uint32_t v) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        return v;
    }
    return byteswap32(v);
}

constexpr std::uint32_t from_le32(std::uint32_t v) noexcept { return to_le32(v); }

class SnapshotWriter {
public:
    explicit SnapshotWriter(std::ostream& out) : out_(out) {}

    void bytes(const char* data, std::size_t size) {
        out_.write(data, static_cast<std::streamsize>(size));
        if (!out_)
            throw IOError{"snapshot write failed"};
    }

    void u8(std::uint8_t v) {
        char c = static_cast<char>(v);
        bytes(&c, 1);
    }

    void u32(std::uint32_t v) {
        const auto le = to_le32(v);
        char buf[sizeof(le)];
        std::memcpy(buf, &le, sizeof(le));
        bytes(buf, sizeof(buf));
    }

    void string(const std::string& s) {
        if (s.size() > std::numeric_limits<std::uint32_t>::max())
            throw InvalidState{"string too large for snapshot"};
        u32(static_cast<std::uint32_t>(s.size()));
        bytes(s.data(), s.size());
    }

private:
    std::ostream& out_;
};

class SnapshotReader {
public:
    explicit SnapshotReader(std::istream& in) : in_(in) {}

    void bytes(char* data, std::size_t size, const char* field) {
        in_.read(data, static_cast<std::streamsize>(size));
        if (static_cast<std::size_t>(in_.gcount()) != size)
            throw InvalidState{std::string{"truncated snapshot: missing "} + field};
    }

    std::uint8_t u8(const char* field) {
        char c = 0;
        bytes(&c, 1, field);
        return static_cast<std::uint8_t>(c);
    }

    std::uint32_t u32(const char* field) {
        char buf[sizeof(std::uint32_t)];
        bytes(buf, sizeof(buf), field);
        std::uint32_t v{};
        std::memcpy(&v, buf, sizeof(v));
        return from_le32(v);
    }

    std::string string(const char* field) {
        std::uint32_t size = u32(field);
        std::string s;
        // Grow in bounded steps so a corrupt length cannot force a huge allocation
        constexpr std::size_t step = 64 * 1024;
        while (s.size() < size) {
            std::size_t n = std::min<std::size_t>(step, size - s.size());
            std::size_t offset = s.size();
            s.resize(offset + n);
            bytes(s.data() + offset, n, field);
        }
        return s;
    }

private:
    std::istream& in_;
};

} // namespace

void write_snapshot(std::ostream& out, const OrderedMap& map, bool suppress_date) {
    if (map.size() > std::numeric_limits<std::uint32_t>::max())
        throw InvalidState{"too many entries for snapshot"};

    SnapshotWriter writer{out};
    writer.bytes(snapshot_magic.data(), snapshot_magic.size());
    writer.u8(snapshot_version);

    std::uint8_t flags = 0;
    if (suppress_date)
        flags |= snapshot_flag_suppress_date;
    if (map.sorted())
        flags |= snapshot_flag_sorted;
    writer.u8(flags);

    writer.u32(static_cast<std::uint32_t>(map.size()));
    for (const auto& entry : map) {
        writer.string(entry.key);
        writer.u8(entry.value ? 1 : 0);
        if (entry.value)
            writer.string(*entry.value);
    }
    out.flush();
    if (!out)
        throw IOError{"snapshot flush failed"};
}

SnapshotContents read_snapshot(std::istream& in) {
    if (!in || in.peek() == std::char_traits<char>::eof())
        throw InvalidState{"stream data required"};

    SnapshotReader reader{in};
    std::array<char, 4> magic{};
    reader.bytes(magic.data(), magic.size(), "magic");
    if (magic != snapshot_magic)
        throw InvalidState{"not an ordered store snapshot"};

    auto version = reader.u8("version");
    if (version != snapshot_version)
        throw InvalidState{"unsupported snapshot version " + std::to_string(version)};

    auto flags = reader.u8("flags");
    if ((flags & ~(snapshot_flag_suppress_date | snapshot_flag_sorted)) != 0)
        throw InvalidState{"unknown snapshot flags"};

    SnapshotContents contents;
    contents.suppress_date = (flags & snapshot_flag_suppress_date) != 0;
    contents.sorted = (flags & snapshot_flag_sorted) != 0;

    auto count = reader.u32("entry count");
    for (std::uint32_t i = 0; i < count; ++i) {
        Entry entry;
        entry.key = reader.string("entry key");
        auto has_value = reader.u8("entry value flag");
        if (has_value > 1)
            throw InvalidState{"corrupt entry value flag"};
        if (has_value)
            entry.value = reader.string("entry value");
        contents.entries.push_back(std::move(entry));
    }
    return contents;
}

} // namespace oprops
