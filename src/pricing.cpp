#include "pricing.hpp"

namespace stock_sync {

int64_t roundUpToFiveOrTen(int64_t units) {
    // Floor modulo so negative inputs also move upwards.
    const int64_t lastDigit = ((units % 10) + 10) % 10;
    if (lastDigit == 0 || lastDigit == 5) {
        return units;
    }
    if (lastDigit < 5) {
        return units - lastDigit + 5;
    }
    return units - lastDigit + 10;
}

int64_t roundUpToFiveOrTen(const Money& price) {
    return roundUpToFiveOrTen(price.truncatedUnits());
}

bool isDiscounted(const std::string& currentPrice,
                  const std::optional<std::string>& compareAtPrice) {
    if (!compareAtPrice) {
        return false;
    }

    const auto compareAt = Money::parse(*compareAtPrice);
    if (!compareAt || compareAt->cents() <= 0) {
        return false;
    }

    const auto current = Money::parse(currentPrice);
    if (!current) {
        return false;
    }

    return *compareAt > *current;
}

int64_t targetPriceFor(const Money& basePrice) {
    return roundUpToFiveOrTen(basePrice.scaledBy(kMarkupBasisPoints));
}

PriceDecision computeTarget(const Money& basePrice,
                            const std::string& currentPrice) {
    PriceDecision decision;
    decision.newPrice = targetPriceFor(basePrice);

    // Floored cents keep "current >= target - tolerance" exact for text with
    // more than two decimals.
    const auto current = Money::parse(currentPrice, Money::Rounding::Floor);
    if (!current) {
        decision.kind = PriceDecision::Kind::ParseError;
        return decision;
    }

    const int64_t targetCents = decision.newPrice * 100;
    const int64_t diff        = current->cents() - targetCents;

    if ((diff <= kToleranceCents && diff >= -kToleranceCents) || diff > 0) {
        decision.kind = PriceDecision::Kind::Skip;
        return decision;
    }

    decision.kind = PriceDecision::Kind::Update;
    return decision;
}

} // namespace stock_sync
