#pragma once

#include <string>

namespace stock_sync {
namespace queries {

/// Set absolute on-hand quantity for one inventory item at one location.
/// Variables: $input (InventorySetOnHandQuantitiesInput!).
inline const std::string kSetOnHandQuantitiesMutation = R"(
mutation inventorySetOnHandQuantities($input: InventorySetOnHandQuantitiesInput!) {
  inventorySetOnHandQuantities(input: $input) {
    userErrors {
      field
      message
    }
    inventoryAdjustmentGroup {
      createdAt
    }
  }
}
)";

/// Reason recorded by Shopify for every quantity we set.
inline const std::string kQuantityChangeReason = "correction";

} // namespace queries
} // namespace stock_sync
