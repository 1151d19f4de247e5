#include "oprops/ordered_store.hpp"
#include "oprops/comment_filtering_writer.hpp"
#include "oprops/engine_adapter.hpp"
#include "oprops/errors.hpp"
#include "oprops/log.hpp"
#include "oprops/snapshot.hpp"
#include "oprops/store_builder.hpp"

#include <algorithm>
#include <exception>

namespace oprops {

namespace {

void log_failure(std::string_view operation, const std::exception& e) {
    if (log_enabled(LogLevel::Debug))
        log(LogLevel::Debug, std::string{operation} + " failed: " + e.what());
}

} // namespace

OrderedStore OrderedStore::copy_of(const OrderedStore& source) {
    OrderedStore copy = StoreBuilder{}
        .with_ordering(source.comparator())
        .with_suppress_date_in_comment(source.suppress_date_)
        .build();
    for (const auto& entry : source.map_)
        copy.map_.put(entry.key, entry.value);
    return copy;
}

std::optional<std::string> OrderedStore::get(std::string_view key) const {
    return map_.get(key);
}

std::string OrderedStore::get(std::string_view key, std::string_view default_value) const {
    auto value = map_.get(key);
    return value ? std::move(*value) : std::string{default_value};
}

std::optional<std::string> OrderedStore::set(std::string_view key, std::optional<std::string> value) {
    return map_.put(key, std::move(value));
}

std::optional<std::string> OrderedStore::remove(std::string_view key) {
    return map_.remove(key);
}

bool OrderedStore::contains(std::string_view key) const {
    return map_.contains(key);
}

std::size_t OrderedStore::size() const noexcept {
    return map_.size();
}

bool OrderedStore::empty() const noexcept {
    return map_.empty();
}

std::vector<std::string> OrderedStore::keys() const {
    return map_.keys();
}

std::vector<Entry> OrderedStore::entries() const {
    return map_.entries();
}

void OrderedStore::load(std::istream& in, Encoding encoding) {
    try {
        auto count = EngineAdapter::load(map_, in, encoding);
        if (log_enabled(LogLevel::Debug))
            log(LogLevel::Debug, "loaded " + std::to_string(count) + " properties, store now holds " + std::to_string(map_.size()));
    } catch (const std::exception& e) {
        log_failure("load", e);
        throw;
    }
}

void OrderedStore::load_xml(std::istream& in) {
    try {
        auto count = EngineAdapter::load_xml(map_, in);
        if (log_enabled(LogLevel::Debug))
            log(LogLevel::Debug, "loaded " + std::to_string(count) + " properties from XML");
    } catch (const std::exception& e) {
        log_failure("load_xml", e);
        throw;
    }
}

void OrderedStore::store(std::ostream& out, const std::optional<std::string>& comment, Encoding encoding) const {
    StreamSink sink{out};
    store(sink, comment, encoding);
}

void OrderedStore::store(CharSink& out, const std::optional<std::string>& comment, Encoding encoding) const {
    try {
        if (suppress_date_) {
            CommentFilteringWriter filter{out};
            EngineAdapter::store(map_, filter, comment, encoding);
        } else {
            EngineAdapter::store(map_, out, comment, encoding);
        }
        if (log_enabled(LogLevel::Debug))
            log(LogLevel::Debug, "stored " + std::to_string(map_.size()) + " properties");
    } catch (const std::exception& e) {
        log_failure("store", e);
        throw;
    }
}

void OrderedStore::store_xml(std::ostream& out, const std::optional<std::string>& comment,
                             std::string_view encoding) const {
    try {
        EngineAdapter::store_xml(map_, out, comment, encoding);
        if (log_enabled(LogLevel::Debug))
            log(LogLevel::Debug, "stored " + std::to_string(map_.size()) + " properties as XML");
    } catch (const std::exception& e) {
        log_failure("store_xml", e);
        throw;
    }
}

void OrderedStore::list(std::ostream& out) const {
    EngineAdapter::list(map_, out);
}

std::unordered_map<std::string, std::string> OrderedStore::to_unordered_map() const {
    std::unordered_map<std::string, std::string> result;
    result.reserve(map_.size());
    for (const auto& entry : map_) {
        if (entry.value)
            result.emplace(entry.key, *entry.value);
    }
    return result;
}

std::string OrderedStore::to_string() const {
    std::string out{"{"};
    bool first = true;
    for (const auto& entry : map_) {
        if (!first)
            out += ", ";
        first = false;
        out += entry.key;
        out += '=';
        out += entry.value ? *entry.value : std::string{"null"};
    }
    out += '}';
    return out;
}

void OrderedStore::write_snapshot(std::ostream& out) const {
    oprops::write_snapshot(out, map_, suppress_date_);
}

OrderedStore OrderedStore::read_snapshot(std::istream& in, KeyComparator comparator) {
    SnapshotContents contents = oprops::read_snapshot(in);
    if (contents.sorted && !comparator)
        throw InvalidState{"snapshot was taken from a sorted store, a comparator is required"};

    StoreBuilder builder;
    builder.with_suppress_date_in_comment(contents.suppress_date);
    if (contents.sorted)
        builder.with_ordering(std::move(comparator));

    OrderedStore store = builder.build();
    for (auto& entry : contents.entries)
        store.map_.put(entry.key, std::move(entry.value));
    return store;
}

bool OrderedStore::operator==(const OrderedStore& other) const {
    if (this == &other)
        return true;
    if (map_.size() != other.map_.size())
        return false;
    return std::equal(map_.begin(), map_.end(), other.map_.begin());
}

std::size_t OrderedStore::hash() const noexcept {
    std::size_t seed = 1;
    auto combine = [&seed](std::size_t h) {
        seed = seed * 31 + h;
    };
    for (const auto& entry : map_) {
        combine(std::hash<std::string>{}(entry.key));
        combine(entry.value ? std::hash<std::string>{}(*entry.value) : 0);
    }
    return seed;
}

std::ostream& operator<<(std::ostream& os, const OrderedStore& store) {
    return os << store.to_string();
}

} // namespace oprops
