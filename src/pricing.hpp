#pragma once

#include "money.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace stock_sync {

/// Storefront price = POS base price + 15%.
constexpr int64_t kMarkupBasisPoints = 11500;

/// Two prices closer than this are treated as equal.
constexpr int64_t kToleranceCents = 1;

/// Round whole currency units up to the next value ending in 5 or 0.
/// 101 -> 105, 106 -> 110, 110 -> 110, 115 -> 115.
int64_t roundUpToFiveOrTen(int64_t units);

/// Same as above after truncating the fractional part (114.99 -> 114 -> 115).
int64_t roundUpToFiveOrTen(const Money& price);

/// True when a compare-at price above the live price marks an active
/// markdown. Absent, blank, non-positive or unparseable values mean no
/// discount, as does an unparseable current price. Never throws.
bool isDiscounted(const std::string& currentPrice,
                  const std::optional<std::string>& compareAtPrice);

/// Outcome of comparing the live storefront price with the POS target.
struct PriceDecision {
    enum class Kind {
        Skip,        // already at or above target
        Update,      // storefront should be set to newPrice
        ParseError,  // current storefront price is not a decimal
    };

    Kind    kind     = Kind::Skip;
    int64_t newPrice = 0;   // whole units, valid for Update (and Skip)
};

/// Target retail price for a POS base price: markup, round to the cent,
/// then roundUpToFiveOrTen().
int64_t targetPriceFor(const Money& basePrice);

/// Decide whether the storefront price must change. A price is never
/// lowered automatically and is never rewritten when already within
/// kToleranceCents of the target.
PriceDecision computeTarget(const Money& basePrice,
                            const std::string& currentPrice);

} // namespace stock_sync
