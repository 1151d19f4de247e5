#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace oprops {

// Strict weak ordering over keys ("less than").
using KeyComparator = std::function<bool(std::string_view, std::string_view)>;

struct Entry {
    std::string key;
    std::optional<std::string> value;

    bool operator==(const Entry&) const = default;
};

/*
 * Key -> optional value container with a defined iteration order.
 *
 * Without a comparator the order is first-insertion order and re-inserting a
 * key keeps its position. With a comparator the order is the comparator's,
 * and keys it considers equivalent map to the same entry.
 *
 * Not synchronized.
 */
class OrderedMap {
public:
    using const_iterator = std::list<Entry>::const_iterator;

    // Insertion order
    OrderedMap() = default;

    // Comparator order. A null or empty comparator means insertion order.
    explicit OrderedMap(std::shared_ptr<const KeyComparator> comparator);

    OrderedMap(const OrderedMap& other);
    OrderedMap& operator=(const OrderedMap& other);
    OrderedMap(OrderedMap&& other) noexcept = default;
    OrderedMap& operator=(OrderedMap&& other) noexcept = default;

    // Returns the stored value, nullopt if the key is absent or its value is null.
    std::optional<std::string> get(std::string_view key) const;

    // Inserts or replaces. Returns the previous value, if any.
    std::optional<std::string> put(std::string_view key, std::optional<std::string> value);

    std::optional<std::string> remove(std::string_view key);

    bool contains(std::string_view key) const;
    std::size_t size() const noexcept;
    bool empty() const noexcept;
    void clear() noexcept;

    std::vector<std::string> keys() const;
    std::vector<Entry> entries() const;

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    bool sorted() const noexcept { return comparator_ != nullptr; }
    const std::shared_ptr<const KeyComparator>& comparator() const noexcept { return comparator_; }

private:
    struct KeyLess {
        std::shared_ptr<const KeyComparator> comparator;

        bool operator()(std::string_view a, std::string_view b) const {
            return comparator ? (*comparator)(a, b) : a < b;
        }
    };

    // Index keys view into the owning list node, which never moves.
    using Index = std::map<std::string_view, std::list<Entry>::iterator, KeyLess>;

    void copy_from(const OrderedMap& other);

    std::shared_ptr<const KeyComparator> comparator_;
    std::list<Entry> entries_;
    Index index_{KeyLess{}};
};

} // namespace oprops
