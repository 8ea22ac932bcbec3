#include "report.hpp"

#include <iomanip>

namespace stock_sync {

const char* toString(StockStatus s) {
    switch (s) {
        case StockStatus::Synced:    return "synced";
        case StockStatus::Unmatched: return "unmatched";
        case StockStatus::Failed:    return "failed";
    }
    return "unknown";
}

const char* toString(PriceStatus s) {
    switch (s) {
        case PriceStatus::Updated:         return "updated";
        case PriceStatus::SkippedDiscount: return "skipped-discount";
        case PriceStatus::SkippedAtTarget: return "skipped-at-target";
        case PriceStatus::ParseError:      return "parse-error";
        case PriceStatus::Failed:          return "failed";
        case PriceStatus::NotAttempted:    return "-";
    }
    return "unknown";
}

std::string describe(const StockResult& r) {
    switch (r.status) {
        case StockStatus::Synced:
            return std::string("synced (") + std::to_string(r.quantity) + ")";
        case StockStatus::Failed:
            return std::string("failed: ") + r.message;
        case StockStatus::Unmatched:
            break;
    }
    return toString(r.status);
}

std::string describe(const PriceResult& r) {
    switch (r.status) {
        case PriceStatus::Updated:
            return "updated (" + r.oldPrice + " -> " + std::to_string(r.newPrice) + ")";
        case PriceStatus::SkippedAtTarget:
            return "at target (" + r.oldPrice + ", target "
                 + std::to_string(r.newPrice) + ")";
        case PriceStatus::ParseError:
        case PriceStatus::Failed:
            return std::string(toString(r.status)) + ": " + r.message;
        default:
            break;
    }
    return toString(r.status);
}

RunSummary summarize(const std::vector<ReconciliationOutcome>& outcomes) {
    RunSummary s;
    s.total = static_cast<int>(outcomes.size());

    for (const auto& o : outcomes) {
        switch (o.stock.status) {
            case StockStatus::Unmatched: ++s.unmatched; continue;
            case StockStatus::Synced:    ++s.stockSynced; break;
            case StockStatus::Failed:    ++s.stockFailed; break;
        }
        ++s.matched;

        switch (o.price.status) {
            case PriceStatus::Updated:         ++s.priceUpdated; break;
            case PriceStatus::SkippedDiscount: ++s.priceDiscounted; break;
            case PriceStatus::SkippedAtTarget: ++s.priceAtTarget; break;
            case PriceStatus::ParseError:
            case PriceStatus::Failed:          ++s.priceErrors; break;
            case PriceStatus::NotAttempted:    break;
        }
    }
    return s;
}

void printReport(std::ostream& out,
                 const std::vector<ReconciliationOutcome>& outcomes,
                 const RunSummary& summary) {
    out << "\n--- Reconciliation (" << outcomes.size() << " SKUs) ---\n";
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        const auto& o = outcomes[i];
        out << std::setw(5) << (i + 1) << "  "
            << std::left << std::setw(24) << o.sku << std::right
            << "  stock: " << describe(o.stock);
        if (o.price.status != PriceStatus::NotAttempted) {
            out << "  price: " << describe(o.price);
        }
        out << "\n";
    }

    out << "\n=== Summary Report ===\n"
        << "Storefront SKUs:     " << summary.total           << "\n"
        << "Matched in POS:      " << summary.matched         << "\n"
        << "Unmatched:           " << summary.unmatched       << "\n"
        << "Stock synced:        " << summary.stockSynced     << "\n"
        << "Stock failed:        " << summary.stockFailed     << "\n"
        << "Prices updated:      " << summary.priceUpdated    << "\n"
        << "Prices discounted:   " << summary.priceDiscounted << "\n"
        << "Prices at target:    " << summary.priceAtTarget   << "\n"
        << "Price errors:        " << summary.priceErrors     << "\n"
        << "======================\n";
}

} // namespace stock_sync
