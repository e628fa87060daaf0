#pragma once

#include "models.hpp"
#include "util.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace inventory_tracker {

/// In-memory owner of the product set.
/// Every mutation goes through here so the stock and id invariants hold
/// regardless of what the caller does.
class InventoryRepository {
public:
    using Clock = std::function<Timestamp()>;

    /// @param clock  Source of "now" for lastUpdated (defaults to system time).
    explicit InventoryRepository(Clock clock = nowTimestamp);

    /// Create a product with the next id and lastUpdated = now.
    /// Throws std::invalid_argument for a blank name/category or a negative
    /// price/quantity; nothing is inserted in that case.
    Product create(const std::string& name,
                   Money price,
                   int quantity,
                   const std::string& category);

    /// Erase a product permanently.  Its id is never handed out again.
    bool remove(int id);

    std::optional<Product> findById(int id) const;

    /// Case-insensitive substring match on name, ascending id.
    /// An empty query matches nothing.
    std::vector<Product> findByName(const std::string& substring) const;

    /// stockQuantity += delta.  Returns false, changing nothing, if the id is
    /// unknown or the result would be negative.
    bool adjustStock(int id, int delta);

    /// Apply name/price/category edits all-or-nothing.  Returns false for an
    /// unknown id; throws std::invalid_argument for invalid values.
    bool updateDetails(int id, const ProductUpdate& update);

    /// Snapshot of every product, ascending id.
    std::vector<Product> listAll() const;

    /// Products with stockQuantity <= threshold, ascending stock then id.
    std::vector<Product> listLowStock(int threshold) const;

    /// Case-insensitive exact match on category, ascending id.
    std::vector<Product> listByCategory(const std::string& category) const;

    /// Distinct categories, sorted case-insensitively.
    std::vector<std::string> categories() const;

    /// Exact sum of price * stockQuantity.
    Money totalValue() const;

    /// Replace the whole set (startup load).  Next id becomes max id + 1.
    /// Throws std::invalid_argument, leaving the current set untouched, if the
    /// records break an invariant (duplicate/non-positive id, negative
    /// price/stock, blank name/category).
    void loadFrom(std::vector<Product> records);

    std::size_t size() const { return mProducts.size(); }
    int         nextId() const { return mNextId; }

private:
    Clock                  mClock;
    std::map<int, Product> mProducts;   // keyed and ordered by id
    int                    mNextId = 1;

    /// now(), but never earlier than @p previous.
    Timestamp stampAfter(Timestamp previous) const;
};

} // namespace inventory_tracker
