#pragma once

#include "models.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace stock_sync {

struct RunSummary {
    int total           = 0;
    int matched         = 0;
    int unmatched       = 0;
    int stockSynced     = 0;
    int stockFailed     = 0;
    int priceUpdated    = 0;
    int priceDiscounted = 0;
    int priceAtTarget   = 0;
    int priceErrors     = 0;   // ParseError + Failed

    bool hasFailures() const { return stockFailed > 0 || priceErrors > 0; }
};

const char* toString(StockStatus s);
const char* toString(PriceStatus s);

/// "synced (12)", "failed: HTTP 500", ...
std::string describe(const StockResult& r);
std::string describe(const PriceResult& r);

RunSummary summarize(const std::vector<ReconciliationOutcome>& outcomes);

/// One line per item followed by the summary block.
void printReport(std::ostream& out,
                 const std::vector<ReconciliationOutcome>& outcomes,
                 const RunSummary& summary);

} // namespace stock_sync
