#include "reconciler.hpp"
#include "normalize.hpp"
#include "pricing.hpp"

#include <iostream>

namespace stock_sync {

Reconciler::Reconciler(StorefrontClient& storefront, Options options)
    : mStorefront(storefront)
    , mOptions(options)
    , mItemPacer(options.itemSpacing, "Pacer:item", options.verbose)
    , mMutationPacer(options.mutationSpacing, "Pacer:mutation", options.verbose) {}

std::vector<ReconciliationOutcome>
Reconciler::run(const std::vector<StorefrontItem>& items, const PosSnapshot& pos) {
    std::cerr << "[Reconciler] Comparing " << items.size()
              << " storefront SKUs against " << pos.items.size()
              << " POS items\n";

    std::vector<ReconciliationOutcome> outcomes;
    outcomes.reserve(items.size());

    for (const auto& item : items) {
        mItemPacer.acquire();
        outcomes.push_back(reconcileItem(item, pos));
    }
    return outcomes;
}

ReconciliationOutcome Reconciler::reconcileItem(const StorefrontItem& item,
                                                const PosSnapshot& pos) {
    ReconciliationOutcome outcome;
    outcome.sku = item.sku;

    const PosItem* match = pos.find(normalizeSku(item.sku));
    if (match == nullptr) {
        outcome.stock.status = StockStatus::Unmatched;
        outcome.price.status = PriceStatus::NotAttempted;
        if (mOptions.verbose) {
            std::cerr << "[Reconciler] No match in POS for SKU: " << item.sku << "\n";
        }
        return outcome;
    }

    outcome.stock = syncStock(item, *match);
    outcome.price = syncPrice(item, *match);
    return outcome;
}

// ---------------------------------------------------------------------------
// Stock
// ---------------------------------------------------------------------------

StockResult Reconciler::syncStock(const StorefrontItem& item, const PosItem& pos) {
    StockResult result;
    result.quantity = pos.quantity;

    try {
        mMutationPacer.acquire();
        const auto mutation = mStorefront.setOnHandQuantity(item, pos.quantity);
        if (mutation.ok) {
            result.status = StockStatus::Synced;
            if (mOptions.verbose) {
                std::cerr << "[Reconciler] Synced stock for SKU " << item.sku
                          << " -> " << pos.quantity << "\n";
            }
        } else {
            result.status  = StockStatus::Failed;
            result.message = mutation.message;
        }
    } catch (const std::exception& e) {
        result.status  = StockStatus::Failed;
        result.message = e.what();
    }

    if (result.status == StockStatus::Failed) {
        std::cerr << "[Reconciler] Stock update failed for SKU " << item.sku
                  << ": " << result.message << "\n";
    }
    return result;
}

// ---------------------------------------------------------------------------
// Price
// ---------------------------------------------------------------------------

PriceResult Reconciler::syncPrice(const StorefrontItem& item, const PosItem& pos) {
    PriceResult result;
    result.oldPrice = item.currentPrice;

    try {
        if (isDiscounted(item.currentPrice, item.compareAtPrice)) {
            result.status = PriceStatus::SkippedDiscount;
            if (mOptions.verbose) {
                std::cerr << "[Reconciler] SKU " << item.sku
                          << " has a discount (compare-at " << *item.compareAtPrice
                          << ", current " << item.currentPrice << "); keeping price\n";
            }
            return result;
        }

        const auto decision = computeTarget(pos.basePrice, item.currentPrice);
        result.newPrice = decision.newPrice;

        switch (decision.kind) {
            case PriceDecision::Kind::ParseError:
                result.status  = PriceStatus::ParseError;
                result.message = "cannot parse current price '" + item.currentPrice + "'";
                std::cerr << "[Reconciler] SKU " << item.sku << ": "
                          << result.message << "\n";
                return result;

            case PriceDecision::Kind::Skip:
                result.status = PriceStatus::SkippedAtTarget;
                return result;

            case PriceDecision::Kind::Update:
                break;
        }

        mMutationPacer.acquire();
        const auto mutation = mStorefront.updatePrice(item, decision.newPrice);
        if (mutation.ok) {
            result.status = PriceStatus::Updated;
            if (mOptions.verbose) {
                std::cerr << "[Reconciler] Updated price for SKU " << item.sku
                          << ": " << item.currentPrice << " -> " << decision.newPrice
                          << " (POS base " << pos.basePrice.toString() << ")\n";
            }
        } else {
            result.status  = PriceStatus::Failed;
            result.message = mutation.message;
        }
    } catch (const std::exception& e) {
        result.status  = PriceStatus::Failed;
        result.message = e.what();
    }

    if (result.status == PriceStatus::Failed) {
        std::cerr << "[Reconciler] Price update failed for SKU " << item.sku
                  << ": " << result.message << "\n";
    }
    return result;
}

} // namespace stock_sync
