#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace stock_sync {

/// Result of parsing one page of products.json.
struct ProductsPage {
    std::vector<StorefrontItem> items;
    int productCount    = 0;
    int skippedVariants = 0;   // no SKU or no inventory item
};

/// Parse a products.json body into one StorefrontItem per usable variant.
/// Throws std::runtime_error if the "products" array is missing.
ProductsPage parseProductsPage(const nlohmann::json& responseBody);

/// Map a single variant node. Returns std::nullopt when the variant has no
/// SKU or no inventory_item_id, since it cannot be reconciled.
std::optional<StorefrontItem> parseVariant(const nlohmann::json& variant);

/// Return human-readable error messages from a GraphQL response (may be empty).
std::vector<std::string> extractGraphqlErrors(const nlohmann::json& responseBody);

/// Return the userErrors messages of mutation @p field (may be empty).
std::vector<std::string> extractUserErrors(const nlohmann::json& responseBody,
                                           const std::string& field);

/// "gid://shopify/<type>/<id>"; ids that already are gids pass through.
std::string toGid(const std::string& type, const std::string& id);

/// Map one POS export record. Returns std::nullopt when ID, Qua or Price is
/// missing or unusable.
std::optional<PosItem> parsePosRecord(const nlohmann::json& record);

/// Build the POS snapshot from the export body. Malformed records are
/// skipped and counted; duplicate SKUs keep the last record.
/// Throws std::runtime_error if the body is not a JSON array.
PosSnapshot parsePosInventory(const nlohmann::json& responseBody);

} // namespace stock_sync
