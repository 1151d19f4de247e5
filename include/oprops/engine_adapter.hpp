#pragma once

#include "oprops/char_sink.hpp"
#include "oprops/encoding.hpp"
#include "oprops/ordered_map.hpp"
#include "oprops/property_storage.hpp"

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace oprops {

/*
 * PropertyStorage view over an OrderedMap.
 * Reads and writes go straight to the map, nothing is copied.
 * A binding built from a const map rejects put() with InvalidState.
 */
class OrderedMapStorage : public PropertyStorage {
public:
    explicit OrderedMapStorage(OrderedMap& map) noexcept : map_(map), writable_(&map) {}
    explicit OrderedMapStorage(const OrderedMap& map) noexcept : map_(map), writable_(nullptr) {}

    std::optional<std::string> get(std::string_view key) const override;
    std::optional<std::string> put(std::string_view key, std::optional<std::string> value) override;
    std::vector<std::string> keys() const override;

private:
    const OrderedMap& map_;
    OrderedMap* writable_;
};

/*
 * Runs PropertiesEngine operations against an OrderedMap.
 * Every call builds its own engine bound to the given map only,
 * so calls on different maps never share state.
 */
class EngineAdapter {
public:
    static std::size_t load(OrderedMap& map, std::istream& in, Encoding encoding);
    static std::size_t load_xml(OrderedMap& map, std::istream& in);

    static void store(const OrderedMap& map, CharSink& out,
                      const std::optional<std::string>& comment, Encoding encoding);
    static void store_xml(const OrderedMap& map, std::ostream& out,
                          const std::optional<std::string>& comment, std::string_view encoding);

    static void list(const OrderedMap& map, std::ostream& out);
};

} // namespace oprops
