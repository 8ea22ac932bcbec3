#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace stock_sync {

/// Exact currency amount stored as integer cents.
/// Remote APIs hand prices over as decimal text (Shopify) or JSON numbers
/// (POS); both are converted here once so comparisons stay exact.
class Money {
public:
    Money() = default;

    static Money fromCents(int64_t cents) { return Money(cents); }
    static Money fromUnits(int64_t units) { return Money(units * 100); }

    /// How digits beyond the second decimal place are folded into cents.
    enum class Rounding {
        HalfUp,   // 114.985 -> 114.99
        Floor,    // 114.985 -> 114.98, -0.001 -> -0.01
    };

    /// Parse decimal text such as "199", "199.5", " 199.00 ", "-3.25".
    /// Returns std::nullopt for anything else (empty, "abc", "1.2.3", "1e5").
    static std::optional<Money> parse(const std::string& text,
                                      Rounding rounding = Rounding::HalfUp);

    /// Accept a JSON number or numeric string.
    static std::optional<Money> fromJson(const nlohmann::json& value);

    int64_t cents() const { return mCents; }

    /// Whole currency units, fractional part discarded.
    int64_t truncatedUnits() const { return mCents / 100; }

    /// Multiply by a percentage given in basis points (11500 = 115%),
    /// rounding half-up to the cent.
    Money scaledBy(int64_t basisPoints) const;

    /// "199.00"
    std::string toString() const;

    bool operator==(const Money& o) const { return mCents == o.mCents; }
    bool operator!=(const Money& o) const { return mCents != o.mCents; }
    bool operator< (const Money& o) const { return mCents <  o.mCents; }
    bool operator> (const Money& o) const { return mCents >  o.mCents; }
    bool operator<=(const Money& o) const { return mCents <= o.mCents; }
    bool operator>=(const Money& o) const { return mCents >= o.mCents; }

private:
    explicit Money(int64_t cents) : mCents(cents) {}

    int64_t mCents = 0;
};

} // namespace stock_sync
