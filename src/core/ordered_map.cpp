#include "oprops/ordered_map.hpp"

namespace oprops {

OrderedMap::OrderedMap(std::shared_ptr<const KeyComparator> comparator)
    : index_{KeyLess{}} {
    if (comparator && *comparator) {
        comparator_ = std::move(comparator);
        index_ = Index{KeyLess{comparator_}};
    }
}

OrderedMap::OrderedMap(const OrderedMap& other)
    : comparator_(other.comparator_), index_{KeyLess{other.comparator_}} {
    copy_from(other);
}

OrderedMap& OrderedMap::operator=(const OrderedMap& other) {
    if (this != &other) {
        entries_.clear();
        comparator_ = other.comparator_;
        index_ = Index{KeyLess{comparator_}};
        copy_from(other);
    }
    return *this;
}

void OrderedMap::copy_from(const OrderedMap& other) {
    // Source order is already the target order, so append
    for (const auto& entry : other.entries_) {
        auto node = entries_.insert(entries_.end(), entry);
        index_.emplace(std::string_view{node->key}, node);
    }
}

std::optional<std::string> OrderedMap::get(std::string_view key) const {
    auto it = index_.find(key);
    if (it == index_.end())
        return std::nullopt;
    return it->second->value;
}

std::optional<std::string> OrderedMap::put(std::string_view key, std::optional<std::string> value) {
    auto it = index_.lower_bound(key);
    if (it != index_.end() && !index_.key_comp()(key, it->first)) {
        // Existing entry keeps its key and position
        auto previous = std::move(it->second->value);
        it->second->value = std::move(value);
        return previous;
    }

    // Insertion order appends; comparator order goes before the next larger key
    auto position = (sorted() && it != index_.end()) ? it->second : entries_.end();
    auto node = entries_.insert(position, Entry{std::string{key}, std::move(value)});
    index_.emplace_hint(it, std::string_view{node->key}, node);
    return std::nullopt;
}

std::optional<std::string> OrderedMap::remove(std::string_view key) {
    auto it = index_.find(key);
    if (it == index_.end())
        return std::nullopt;

    auto node = it->second;
    auto previous = std::move(node->value);
    index_.erase(it);
    entries_.erase(node);
    return previous;
}

bool OrderedMap::contains(std::string_view key) const {
    return index_.find(key) != index_.end();
}

std::size_t OrderedMap::size() const noexcept {
    return entries_.size();
}

bool OrderedMap::empty() const noexcept {
    return entries_.empty();
}

void OrderedMap::clear() noexcept {
    index_.clear();
    entries_.clear();
}

std::vector<std::string> OrderedMap::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_)
        result.push_back(entry.key);
    return result;
}

std::vector<Entry> OrderedMap::entries() const {
    return {entries_.begin(), entries_.end()};
}

} // namespace oprops
