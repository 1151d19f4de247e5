#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace oprops {

/*
 * Storage the properties engine reads from and writes into.
 * The engine owns no entries; everything goes through this interface.
 */
class PropertyStorage {
public:
    virtual ~PropertyStorage() = default;

    virtual std::optional<std::string> get(std::string_view key) const = 0;

    virtual std::optional<std::string> put(std::string_view key, std::optional<std::string> value) = 0;

    // Keys in iteration order
    virtual std::vector<std::string> keys() const = 0;
};

} // namespace oprops
