#include "mapping.hpp"
#include "util.hpp"

#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

namespace inventory_tracker {

namespace {

const nlohmann::json& requireField(const nlohmann::json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) {
        throw std::runtime_error(std::string("Product missing '") + key + "' field");
    }
    return *it;
}

int requireInt(const nlohmann::json& node, const char* key) {
    const auto& v = requireField(node, key);
    if (!v.is_number_integer()) {
        throw std::runtime_error(std::string("Product field '") + key
                                 + "' is not an integer");
    }
    const auto wide = v.get<int64_t>();
    if (wide < std::numeric_limits<int>::min() ||
        wide > std::numeric_limits<int>::max()) {
        throw std::runtime_error(std::string("Product field '") + key
                                 + "' is out of range");
    }
    return static_cast<int>(wide);
}

std::string requireString(const nlohmann::json& node, const char* key) {
    const auto& v = requireField(node, key);
    if (!v.is_string()) {
        throw std::runtime_error(std::string("Product field '") + key
                                 + "' is not a string");
    }
    return v.get<std::string>();
}

Money requirePrice(const nlohmann::json& node) {
    const auto& v = requireField(node, "price");
    try {
        if (v.is_number_integer()) {
            return Money::fromCents(v.get<int64_t>()) * 100;
        }
        if (v.is_number()) {
            return Money::fromDouble(v.get<double>());
        }
        if (v.is_string()) {
            return Money::parse(v.get<std::string>());
        }
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Product field 'price' is invalid: ")
                                 + e.what());
    }
    throw std::runtime_error("Product field 'price' is not a number");
}

} // namespace

nlohmann::json productToJson(const Product& product) {
    nlohmann::json node;
    node["id"]            = product.id;
    node["name"]          = product.name;
    node["price"]         = product.price.toDouble();
    node["stockQuantity"] = product.stockQuantity;
    node["category"]      = product.category;
    node["lastUpdated"]   = formatTimestamp(product.lastUpdated);
    return node;
}

Product parseProductNode(const nlohmann::json& node) {
    if (!node.is_object()) {
        throw std::runtime_error("Product entry is not an object");
    }

    Product p;
    p.id            = requireInt(node, "id");
    p.name          = requireString(node, "name");
    p.price         = requirePrice(node);
    p.stockQuantity = requireInt(node, "stockQuantity");
    p.category      = requireString(node, "category");

    try {
        p.lastUpdated = parseTimestamp(requireString(node, "lastUpdated"));
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
    }

    const std::string where = " (product id " + std::to_string(p.id) + ")";
    if (p.id <= 0) {
        throw std::runtime_error("Product id must be positive" + where);
    }
    if (p.id == std::numeric_limits<int>::max()) {
        // The repository could never issue another id after it.
        throw std::runtime_error("Product id leaves no room for new ids" + where);
    }
    if (isBlank(p.name)) {
        throw std::runtime_error("Product name is blank" + where);
    }
    if (isBlank(p.category)) {
        throw std::runtime_error("Product category is blank" + where);
    }
    if (p.price.isNegative()) {
        throw std::runtime_error("Product price is negative" + where);
    }
    if (p.stockQuantity < 0) {
        throw std::runtime_error("Product stock quantity is negative" + where);
    }
    return p;
}

nlohmann::json buildInventoryDocument(const std::vector<Product>& products) {
    nlohmann::json document = nlohmann::json::array();
    for (const auto& p : products) {
        document.push_back(productToJson(p));
    }
    return document;
}

std::vector<Product> parseInventoryDocument(const nlohmann::json& document) {
    if (!document.is_array()) {
        throw std::runtime_error("Inventory document is not a JSON array");
    }

    std::vector<Product> products;
    std::set<int> seenIds;
    products.reserve(document.size());

    for (const auto& node : document) {
        Product p = parseProductNode(node);
        if (!seenIds.insert(p.id).second) {
            throw std::runtime_error("Duplicate product id "
                                     + std::to_string(p.id));
        }
        products.push_back(std::move(p));
    }
    return products;
}

} // namespace inventory_tracker
