#pragma once

#include "money.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace inventory_tracker {

/// Wall-clock instant, millisecond resolution (what the data file can hold).
using Timestamp = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::milliseconds>;

/// One inventory item.
struct Product {
    int         id            = 0;
    std::string name;
    Money       price;
    int         stockQuantity = 0;
    std::string category;
    Timestamp   lastUpdated{};   // creation or last stock mutation
};

inline bool operator==(const Product& a, const Product& b) {
    return a.id == b.id
        && a.name == b.name
        && a.price == b.price
        && a.stockQuantity == b.stockQuantity
        && a.category == b.category
        && a.lastUpdated == b.lastUpdated;
}

inline bool operator!=(const Product& a, const Product& b) {
    return !(a == b);
}

/// Field edits for an existing product; unset fields are left alone.
struct ProductUpdate {
    std::optional<std::string> name;
    std::optional<Money>       price;
    std::optional<std::string> category;
};

} // namespace inventory_tracker
