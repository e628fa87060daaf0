#include "money.hpp"

#include <boost/algorithm/string/trim.hpp>

#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace inventory_tracker {

namespace {

constexpr int64_t kMaxCents = std::numeric_limits<int64_t>::max();
constexpr int64_t kMinCents = std::numeric_limits<int64_t>::min();
constexpr int64_t kMaxWhole = (kMaxCents - 99) / 100;

} // namespace

Money Money::fromCents(int64_t cents) {
    return Money(cents);
}

Money Money::fromDouble(double amount) {
    if (!std::isfinite(amount)) {
        throw std::invalid_argument("Amount is not a finite number");
    }
    const double scaled = std::round(amount * 100.0);
    // 2^63 is exactly representable; anything at or past it would overflow.
    if (scaled >= 9223372036854775808.0 || scaled < -9223372036854775808.0) {
        throw std::invalid_argument("Amount out of range");
    }
    return Money(static_cast<int64_t>(scaled));
}

Money Money::parse(const std::string& text) {
    const std::string s = boost::algorithm::trim_copy(text);
    if (s.empty()) {
        throw std::invalid_argument("Empty amount");
    }

    std::size_t pos = 0;
    bool negative = false;
    if (s[pos] == '+' || s[pos] == '-') {
        negative = (s[pos] == '-');
        ++pos;
    }

    // --- whole part ---
    int64_t whole = 0;
    std::size_t wholeDigits = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        const int digit = s[pos] - '0';
        if (whole > (kMaxWhole - digit) / 10) {
            throw std::invalid_argument("Amount out of range: " + text);
        }
        whole = whole * 10 + digit;
        ++wholeDigits;
        ++pos;
    }

    // --- fractional part ---
    int64_t frac = 0;
    std::size_t fracDigits = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (fracDigits == 2) {
                throw std::invalid_argument(
                    "Amount has more than two decimal places: " + text);
            }
            frac = frac * 10 + (s[pos] - '0');
            ++fracDigits;
            ++pos;
        }
        if (fracDigits == 1) frac *= 10;
    }

    if (pos != s.size() || (wholeDigits == 0 && fracDigits == 0)) {
        throw std::invalid_argument("Invalid amount: " + text);
    }

    const int64_t cents = whole * 100 + frac;
    return Money(negative ? -cents : cents);
}

double Money::toDouble() const {
    return static_cast<double>(mCents) / 100.0;
}

std::string Money::toString() const {
    // Work in unsigned so that INT64_MIN does not overflow on negation.
    const bool negative = mCents < 0;
    const uint64_t magnitude = negative
        ? uint64_t{0} - static_cast<uint64_t>(mCents)
        : static_cast<uint64_t>(mCents);

    std::string frac = std::to_string(magnitude % 100);
    if (frac.size() < 2) frac.insert(0, "0");

    return (negative ? "-" : "") + std::to_string(magnitude / 100) + "." + frac;
}

Money Money::operator+(const Money& other) const {
    if ((other.mCents > 0 && mCents > kMaxCents - other.mCents) ||
        (other.mCents < 0 && mCents < kMinCents - other.mCents)) {
        throw std::overflow_error("Money addition overflow");
    }
    return Money(mCents + other.mCents);
}

Money& Money::operator+=(const Money& other) {
    *this = *this + other;
    return *this;
}

Money Money::operator*(int64_t factor) const {
    if (mCents != 0 && factor != 0) {
        const bool sameSign = (mCents > 0) == (factor > 0);
        const bool overflow = sameSign
            ? (mCents > 0 ? mCents > kMaxCents / factor
                          : mCents < kMaxCents / factor)
            : (mCents > 0 ? factor < kMinCents / mCents
                          : mCents < kMinCents / factor);
        if (overflow) {
            throw std::overflow_error("Money multiplication overflow");
        }
    }
    return Money(mCents * factor);
}

} // namespace inventory_tracker
