#pragma once

#include "oprops/ordered_map.hpp"

#include <array>
#include <cstdint>
#include <istream>
#include <ostream>
#include <vector>

namespace oprops {

// Persisted store layout (little-endian):
//   magic[4] "OPRS"
//   u8  version
//   u8  flags (bit0 suppress-date, bit1 sorted)
//   u32 entry_count
//   per entry:
//     u32 key_len, key bytes
//     u8  has_value
//     [u32 value_len, value bytes]   when has_value == 1
inline constexpr std::array<char, 4> snapshot_magic{'O', 'P', 'R', 'S'};
inline constexpr std::uint8_t snapshot_version = 1;
inline constexpr std::uint8_t snapshot_flag_suppress_date = 0x01;
inline constexpr std::uint8_t snapshot_flag_sorted = 0x02;

struct SnapshotContents {
    bool suppress_date{false};
    bool sorted{false};
    std::vector<Entry> entries;
};

// Throws IOError if the stream fails.
void write_snapshot(std::ostream& out, const OrderedMap& map, bool suppress_date);

// Reads the whole snapshot before returning anything.
// Throws InvalidState on empty, truncated or unrecognized input.
SnapshotContents read_snapshot(std::istream& in);

} // namespace oprops
