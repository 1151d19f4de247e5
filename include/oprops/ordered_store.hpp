#pragma once

#include "oprops/char_sink.hpp"
#include "oprops/encoding.hpp"
#include "oprops/ordered_map.hpp"

#include <cstddef>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace oprops {

/*
 * Properties container that keeps its keys in a defined order.
 *
 * By default the order is the order in which keys were first added, whether
 * through set() or by reading them top to bottom in load(). A custom key
 * ordering can be configured through StoreBuilder.
 *
 * Optionally the "#<date>" comment line is left out when storing as text.
 *
 * Parsing and writing are done by PropertiesEngine, bound directly to this
 * store's map for the duration of each call.
 *
 * Default property chains are not supported.
 *
 * Not synchronized: concurrent access where at least one thread modifies
 * the store must be serialized by the caller.
 */
class OrderedStore {
public:
    // Insertion order, date comment written on store.
    OrderedStore() = default;

    OrderedStore(const OrderedStore& other) = default;
    OrderedStore& operator=(const OrderedStore& other) = default;
    OrderedStore(OrderedStore&& other) noexcept = default;
    OrderedStore& operator=(OrderedStore&& other) noexcept = default;

    // Copies entries, ordering and the suppress-date flag.
    // The copy shares the source's comparator object.
    static OrderedStore copy_of(const OrderedStore& source);

    std::optional<std::string> get(std::string_view key) const;
    std::string get(std::string_view key, std::string_view default_value) const;

    // Returns the previous value. A nullopt value keeps the key present
    // but unreadable through get().
    std::optional<std::string> set(std::string_view key, std::optional<std::string> value);

    std::optional<std::string> remove(std::string_view key);

    bool contains(std::string_view key) const;
    std::size_t size() const noexcept;
    bool empty() const noexcept;

    // Snapshots; later mutation does not affect them.
    std::vector<std::string> keys() const;
    std::vector<Entry> entries() const;

    // Reads key=value text. Iso8859_1 for byte streams, Utf8 for character streams.
    // On FormatError or IOError the entries read so far are kept.
    void load(std::istream& in, Encoding encoding = Encoding::Iso8859_1);
    void load_xml(std::istream& in);

    void store(std::ostream& out, const std::optional<std::string>& comment,
               Encoding encoding = Encoding::Iso8859_1) const;
    void store(CharSink& out, const std::optional<std::string>& comment,
               Encoding encoding = Encoding::Iso8859_1) const;

    void store_xml(std::ostream& out, const std::optional<std::string>& comment,
                   std::string_view encoding = "UTF-8") const;

    void list(std::ostream& out) const;

    // Plain copy without ordering guarantees. Null values are left out.
    std::unordered_map<std::string, std::string> to_unordered_map() const;

    // "{b=222, c=333, a=111}"
    std::string to_string() const;

    // Binary snapshot, restored with read_snapshot().
    void write_snapshot(std::ostream& out) const;
    // Throws InvalidState on empty, truncated or incompatible input, or if the
    // snapshot was taken from a sorted store and no comparator is given.
    static OrderedStore read_snapshot(std::istream& in, KeyComparator comparator = {});

    const std::shared_ptr<const KeyComparator>& comparator() const noexcept { return map_.comparator(); }
    bool suppress_date() const noexcept { return suppress_date_; }

    // Order-sensitive
    bool operator==(const OrderedStore& other) const;

    std::size_t hash() const noexcept;

private:
    friend class StoreBuilder;

    OrderedStore(OrderedMap map, bool suppress_date) : map_(std::move(map)), suppress_date_(suppress_date) {}

    OrderedMap map_;
    bool suppress_date_{false};
};

std::ostream& operator<<(std::ostream& os, const OrderedStore& store);

} // namespace oprops

namespace std {

template <>
struct hash<oprops::OrderedStore> {
    std::size_t operator()(const oprops::OrderedStore& store) const noexcept {
        return store.hash();
    }
};

} // namespace std
