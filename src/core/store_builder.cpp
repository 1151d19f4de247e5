#include "oprops/store_builder.hpp"

#include <utility>

namespace oprops {

StoreBuilder& StoreBuilder::with_ordering(KeyComparator comparator) {
    if (comparator)
        comparator_ = std::make_shared<const KeyComparator>(std::move(comparator));
    else
        comparator_.reset();
    return *this;
}

StoreBuilder& StoreBuilder::with_ordering(std::shared_ptr<const KeyComparator> comparator) {
    comparator_ = std::move(comparator);
    return *this;
}

StoreBuilder& StoreBuilder::with_ordering(std::nullptr_t) {
    comparator_.reset();
    return *this;
}

StoreBuilder& StoreBuilder::with_suppress_date_in_comment(bool suppress_date) {
    suppress_date_ = suppress_date;
    return *this;
}

OrderedStore StoreBuilder::build() const {
    return OrderedStore{OrderedMap{comparator_}, suppress_date_};
}

} // namespace oprops
