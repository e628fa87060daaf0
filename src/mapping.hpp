#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <vector>

namespace inventory_tracker {

/// Serialize one product as a JSON object
/// (id, name, price, stockQuantity, category, lastUpdated).
nlohmann::json productToJson(const Product& product);

/// Map a single product JSON object into a Product struct.
/// Throws std::runtime_error if a field is missing, has the wrong type, or
/// holds a value the data model forbids (blank name, negative stock, ...).
Product parseProductNode(const nlohmann::json& node);

/// Build the whole inventory document: a JSON array in the given order.
nlohmann::json buildInventoryDocument(const std::vector<Product>& products);

/// Parse a whole inventory document.
/// Throws std::runtime_error if the document is not an array, any element is
/// invalid, or two elements share an id.
std::vector<Product> parseInventoryDocument(const nlohmann::json& document);

} // namespace inventory_tracker
