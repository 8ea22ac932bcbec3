#pragma once

#include "models.hpp"
#include "pacer.hpp"
#include "storefront_client.hpp"

#include <chrono>
#include <vector>

namespace stock_sync {

/// Joins the storefront listing with the POS snapshot on normalized SKU and
/// pushes POS stock and price to the storefront, one item at a time.
///
/// Per item: normalize SKU -> lookup -> Unmatched, or set stock then run
/// the price policy (discount guard, target calculator, update). Every step
/// reports an outcome value; nothing thrown inside a step escapes run().
class Reconciler {
public:
    struct Options {
        std::chrono::milliseconds itemSpacing{200};
        std::chrono::milliseconds mutationSpacing{200};
        bool verbose = false;
    };

    Reconciler(StorefrontClient& storefront, Options options);

    std::vector<ReconciliationOutcome> run(const std::vector<StorefrontItem>& items,
                                           const PosSnapshot& pos);

    ReconciliationOutcome reconcileItem(const StorefrontItem& item,
                                        const PosSnapshot& pos);

    double totalPacingSeconds() const {
        return mItemPacer.totalSleepSeconds() + mMutationPacer.totalSleepSeconds();
    }

private:
    StorefrontClient& mStorefront;
    Options           mOptions;
    Pacer             mItemPacer;
    Pacer             mMutationPacer;

    StockResult syncStock(const StorefrontItem& item, const PosItem& pos);
    PriceResult syncPrice(const StorefrontItem& item, const PosItem& pos);
};

} // namespace stock_sync
