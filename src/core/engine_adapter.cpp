#include "oprops/engine_adapter.hpp"
#include "oprops/errors.hpp"
#include "oprops/properties_engine.hpp"

#include <utility>

namespace oprops {

std::optional<std::string> OrderedMapStorage::get(std::string_view key) const {
    return map_.get(key);
}

std::optional<std::string> OrderedMapStorage::put(std::string_view key, std::optional<std::string> value) {
    if (!writable_)
        throw InvalidState{"storage is bound read-only"};
    return writable_->put(key, std::move(value));
}

std::vector<std::string> OrderedMapStorage::keys() const {
    return map_.keys();
}


std::size_t EngineAdapter::load(OrderedMap& map, std::istream& in, Encoding encoding) {
    OrderedMapStorage storage{map};
    PropertiesEngine engine{storage};
    return engine.load(in, encoding);
}

std::size_t EngineAdapter::load_xml(OrderedMap& map, std::istream& in) {
    OrderedMapStorage storage{map};
    PropertiesEngine engine{storage};
    return engine.load_xml(in);
}

void EngineAdapter::store(const OrderedMap& map, CharSink& out,
                          const std::optional<std::string>& comment, Encoding encoding) {
    OrderedMapStorage storage{map};
    PropertiesEngine engine{storage};
    engine.store(out, comment, encoding);
}

void EngineAdapter::store_xml(const OrderedMap& map, std::ostream& out,
                              const std::optional<std::string>& comment, std::string_view encoding) {
    OrderedMapStorage storage{map};
    PropertiesEngine engine{storage};
    engine.store_xml(out, comment, encoding);
}

void EngineAdapter::list(const OrderedMap& map, std::ostream& out) {
    OrderedMapStorage storage{map};
    PropertiesEngine engine{storage};
    engine.list(out);
}

} // namespace oprops
