#include "repository.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

namespace inventory_tracker {

namespace {

void validateFields(const std::string& name, Money price,
                    const std::string& category) {
    if (isBlank(name)) {
        throw std::invalid_argument("Product name must not be blank");
    }
    if (isBlank(category)) {
        throw std::invalid_argument("Product category must not be blank");
    }
    if (price.isNegative()) {
        throw std::invalid_argument("Product price must not be negative");
    }
}

} // namespace

InventoryRepository::InventoryRepository(Clock clock)
    : mClock(std::move(clock)) {
    if (!mClock) {
        throw std::invalid_argument("InventoryRepository requires a clock");
    }
}

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------

Product InventoryRepository::create(const std::string& name,
                                    Money price,
                                    int quantity,
                                    const std::string& category) {
    validateFields(name, price, category);
    if (quantity < 0) {
        throw std::invalid_argument("Initial stock quantity must not be negative");
    }
    if (mNextId == std::numeric_limits<int>::max()) {
        throw std::overflow_error("Product id space exhausted");
    }

    Product p;
    p.id            = mNextId;
    p.name          = name;
    p.price         = price;
    p.stockQuantity = quantity;
    p.category      = category;
    p.lastUpdated   = mClock();

    mProducts.emplace(p.id, p);
    ++mNextId;
    return p;
}

bool InventoryRepository::remove(int id) {
    return mProducts.erase(id) > 0;
}

bool InventoryRepository::adjustStock(int id, int delta) {
    auto it = mProducts.find(id);
    if (it == mProducts.end()) {
        return false;
    }

    Product& p = it->second;
    const int64_t result = static_cast<int64_t>(p.stockQuantity) + delta;
    if (result < 0 || result > std::numeric_limits<int>::max()) {
        return false;
    }

    p.stockQuantity = static_cast<int>(result);
    p.lastUpdated   = stampAfter(p.lastUpdated);
    return true;
}

bool InventoryRepository::updateDetails(int id, const ProductUpdate& update) {
    auto it = mProducts.find(id);
    if (it == mProducts.end()) {
        return false;
    }

    Product& p = it->second;
    const std::string& name     = update.name     ? *update.name     : p.name;
    const Money        price    = update.price    ? *update.price    : p.price;
    const std::string& category = update.category ? *update.category : p.category;
    validateFields(name, price, category);

    // Copy first: name/category may alias p's own members.
    std::string newName     = name;
    std::string newCategory = category;
    p.name     = std::move(newName);
    p.price    = price;
    p.category = std::move(newCategory);
    return true;
}

void InventoryRepository::loadFrom(std::vector<Product> records) {
    std::map<int, Product> loaded;
    int maxId = 0;

    for (auto& p : records) {
        const std::string where = " (product id " + std::to_string(p.id) + ")";
        if (p.id <= 0) {
            throw std::invalid_argument("Product id must be positive" + where);
        }
        if (p.id == std::numeric_limits<int>::max()) {
            throw std::invalid_argument("Product id leaves no room for new ids" + where);
        }
        if (p.stockQuantity < 0) {
            throw std::invalid_argument("Stock quantity must not be negative" + where);
        }
        try {
            validateFields(p.name, p.price, p.category);
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument(e.what() + where);
        }

        maxId = std::max(maxId, p.id);
        const int id = p.id;
        if (!loaded.emplace(id, std::move(p)).second) {
            throw std::invalid_argument("Duplicate product id " + std::to_string(id));
        }
    }

    mProducts = std::move(loaded);
    mNextId   = maxId + 1;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<Product> InventoryRepository::findById(int id) const {
    auto it = mProducts.find(id);
    if (it == mProducts.end()) return std::nullopt;
    return it->second;
}

std::vector<Product>
InventoryRepository::findByName(const std::string& substring) const {
    std::vector<Product> out;
    if (substring.empty()) return out;

    for (const auto& entry : mProducts) {
        if (boost::algorithm::icontains(entry.second.name, substring)) {
            out.push_back(entry.second);
        }
    }
    return out;
}

std::vector<Product> InventoryRepository::listAll() const {
    std::vector<Product> out;
    out.reserve(mProducts.size());
    for (const auto& entry : mProducts) {
        out.push_back(entry.second);
    }
    return out;
}

std::vector<Product> InventoryRepository::listLowStock(int threshold) const {
    std::vector<Product> out;
    for (const auto& entry : mProducts) {
        if (entry.second.stockQuantity <= threshold) {
            out.push_back(entry.second);
        }
    }
    // Already in id order, so a stable sort on quantity keeps id as tiebreak.
    std::stable_sort(out.begin(), out.end(),
                     [](const Product& a, const Product& b) {
                         return a.stockQuantity < b.stockQuantity;
                     });
    return out;
}

std::vector<Product>
InventoryRepository::listByCategory(const std::string& category) const {
    std::vector<Product> out;
    for (const auto& entry : mProducts) {
        if (boost::algorithm::iequals(entry.second.category, category)) {
            out.push_back(entry.second);
        }
    }
    return out;
}

std::vector<std::string> InventoryRepository::categories() const {
    std::vector<std::string> out;
    for (const auto& entry : mProducts) {
        const auto& category = entry.second.category;
        const bool seen = std::any_of(out.begin(), out.end(),
            [&](const std::string& c) {
                return boost::algorithm::iequals(c, category);
            });
        if (!seen) out.push_back(category);
    }
    std::sort(out.begin(), out.end(),
              [](const std::string& a, const std::string& b) {
                  return boost::algorithm::ilexicographical_compare(a, b);
              });
    return out;
}

Money InventoryRepository::totalValue() const {
    Money total;
    for (const auto& entry : mProducts) {
        total += entry.second.price * entry.second.stockQuantity;
    }
    return total;
}

// ---------------------------------------------------------------------------
// Private
// ---------------------------------------------------------------------------

Timestamp InventoryRepository::stampAfter(Timestamp previous) const {
    return std::max(mClock(), previous);
}

} // namespace inventory_tracker
