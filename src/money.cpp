#include "money.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace stock_sync {

namespace {

// Keeps cents * basis points inside int64.
constexpr int     kMaxIntegerDigits = 12;
constexpr double  kMaxAbsUnits      = 1e12;

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

} // namespace

std::optional<Money> Money::parse(const std::string& text, Rounding rounding) {
    std::size_t begin = 0;
    std::size_t end   = text.size();
    while (begin < end && isSpace(text[begin])) ++begin;
    while (end > begin && isSpace(text[end - 1])) --end;
    if (begin == end) return std::nullopt;

    bool negative = false;
    if (text[begin] == '+' || text[begin] == '-') {
        negative = (text[begin] == '-');
        ++begin;
    }

    int64_t units       = 0;
    int     intDigits   = 0;
    int64_t fraction    = 0;   // first two decimals
    int     fracDigits  = 0;
    bool    halfOrMore  = false;   // third decimal >= 5
    bool    subCent     = false;   // any non-zero digit past the second
    bool    seenPoint   = false;

    for (std::size_t i = begin; i < end; ++i) {
        const char c = text[i];
        if (c == '.') {
            if (seenPoint) return std::nullopt;
            seenPoint = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        const int d = c - '0';
        if (!seenPoint) {
            if (++intDigits > kMaxIntegerDigits) return std::nullopt;
            units = units * 10 + d;
        } else {
            if (fracDigits < 2) {
                fraction = fraction * 10 + d;
            } else {
                if (fracDigits == 2) halfOrMore = (d >= 5);
                if (d != 0) subCent = true;
            }
            ++fracDigits;
        }
    }

    if (intDigits == 0 && fracDigits == 0) return std::nullopt;

    if (fracDigits == 1) fraction *= 10;

    // Magnitude adjustment: half-up rounds away from zero, floor moves
    // negative amounts away from zero and leaves positive ones truncated.
    const bool bump = (rounding == Rounding::HalfUp) ? halfOrMore
                                                      : (negative && subCent);
    int64_t cents = units * 100 + fraction + (bump ? 1 : 0);
    return Money(negative ? -cents : cents);
}

std::optional<Money> Money::fromJson(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        const auto units = value.get<int64_t>();
        if (std::llabs(units) >= static_cast<int64_t>(kMaxAbsUnits)) {
            return std::nullopt;
        }
        return fromUnits(units);
    }
    if (value.is_number_float()) {
        const double d = value.get<double>();
        if (!std::isfinite(d) || std::fabs(d) >= kMaxAbsUnits) {
            return std::nullopt;
        }
        return Money(static_cast<int64_t>(std::llround(d * 100.0)));
    }
    if (value.is_string()) {
        return parse(value.get<std::string>());
    }
    return std::nullopt;
}

Money Money::scaledBy(int64_t basisPoints) const {
    const int64_t product = mCents * basisPoints;
    const int64_t half    = 5000;
    if (product >= 0) {
        return Money((product + half) / 10000);
    }
    return Money(-((-product + half) / 10000));
}

std::string Money::toString() const {
    const int64_t absCents = mCents < 0 ? -mCents : mCents;
    std::string out = (mCents < 0) ? "-" : "";
    out += std::to_string(absCents / 100);
    out += '.';
    const int64_t frac = absCents % 100;
    if (frac < 10) out += '0';
    out += std::to_string(frac);
    return out;
}

} // namespace stock_sync
