#pragma once

#include "oprops/ordered_map.hpp"
#include "oprops/ordered_store.hpp"

#include <cstddef>
#include <memory>

namespace oprops {

/*
 * Configures and creates OrderedStore instances.
 *
 *   auto store = StoreBuilder{}
 *       .with_ordering([](std::string_view a, std::string_view b) { return a < b; })
 *       .with_suppress_date_in_comment(true)
 *       .build();
 */
class StoreBuilder {
public:
    // Keys ordered by the comparator. An empty function restores insertion order.
    StoreBuilder& with_ordering(KeyComparator comparator);

    // Share an existing comparator object, as OrderedStore::copy_of() does.
    // A null pointer restores insertion order.
    StoreBuilder& with_ordering(std::shared_ptr<const KeyComparator> comparator);
    StoreBuilder& with_ordering(std::nullptr_t);

    // Leave out the "#<date>" comment line when storing as text.
    StoreBuilder& with_suppress_date_in_comment(bool suppress_date);

    OrderedStore build() const;

private:
    std::shared_ptr<const KeyComparator> comparator_;
    bool suppress_date_{false};
};

} // namespace oprops
