#pragma once

#include <cstdint>
#include <string>

namespace inventory_tracker {

/// Fixed-point amount stored as a whole number of cents.
/// Sums and products stay exact; doubles only appear at the JSON boundary.
class Money {
public:
    Money() = default;

    static Money fromCents(int64_t cents);

    /// Round a double to the nearest cent (half away from zero).
    /// Throws std::invalid_argument for NaN / infinity / out of range.
    static Money fromDouble(double amount);

    /// Parse a plain decimal such as "29.99", "-3", or "0.5".
    /// At most two fractional digits are accepted.
    /// Throws std::invalid_argument on malformed input.
    static Money parse(const std::string& text);

    int64_t cents()    const { return mCents; }
    double  toDouble() const;
    bool    isNegative() const { return mCents < 0; }

    /// "14498.35", "-0.50", "0.00"
    std::string toString() const;

    Money  operator+(const Money& other) const;
    Money& operator+=(const Money& other);
    Money  operator*(int64_t factor) const;

    bool operator==(const Money& other) const { return mCents == other.mCents; }
    bool operator!=(const Money& other) const { return mCents != other.mCents; }
    bool operator<(const Money& other)  const { return mCents <  other.mCents; }

private:
    explicit Money(int64_t cents) : mCents(cents) {}

    int64_t mCents = 0;
};

} // namespace inventory_tracker
