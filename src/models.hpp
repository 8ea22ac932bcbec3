#pragma once

#include "money.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace stock_sync {

/// One Shopify variant as seen at listing time (subset of fields used in sync).
struct StorefrontItem {
    std::string sku;              // raw, as returned by Shopify
    std::string inventoryItemId;  // e.g. "808950810"
    std::string variantId;        // e.g. "39072856"
    std::string currentPrice;     // decimal text, e.g. "199.00"
    std::optional<std::string> compareAtPrice;
};

/// One POS record, keyed by normalized SKU.
struct PosItem {
    std::string sku;
    long long   quantity = 0;
    Money       basePrice;
};

/// Full POS catalog as loaded by one bulk export call.
struct PosSnapshot {
    std::unordered_map<std::string, PosItem> items;
    std::vector<std::string> duplicateSkus;   // overwritten keys, each listed once
    int skippedRecords = 0;                   // malformed records dropped

    const PosItem* find(const std::string& normalizedSku) const {
        auto it = items.find(normalizedSku);
        return it == items.end() ? nullptr : &it->second;
    }
};

/// Result of a single storefront mutation call.
struct MutationResult {
    bool        ok = false;
    std::string message;   // remote rejection reason or transport error
};

enum class StockStatus {
    Synced,
    Unmatched,
    Failed,
};

enum class PriceStatus {
    Updated,
    SkippedDiscount,
    SkippedAtTarget,
    ParseError,
    Failed,
    NotAttempted,
};

struct StockResult {
    StockStatus status = StockStatus::Unmatched;
    long long   quantity = 0;
    std::string message;
};

struct PriceResult {
    PriceStatus status = PriceStatus::NotAttempted;
    std::string oldPrice;      // storefront text before the update
    long long   newPrice = 0;  // whole currency units
    std::string message;
};

/// Per-item result of one reconciliation pass.
struct ReconciliationOutcome {
    std::string sku;
    StockResult stock;
    PriceResult price;
};

} // namespace stock_sync
