#include "util.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace inventory_tracker {

namespace {

// Read exactly @p width digits starting at @p pos.
int readDigits(const std::string& s, std::size_t pos, std::size_t width,
               const std::string& original) {
    if (pos + width > s.size()) {
        throw std::invalid_argument("Truncated timestamp: " + original);
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + width; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            throw std::invalid_argument("Invalid timestamp: " + original);
        }
        value = value * 10 + (s[i] - '0');
    }
    return value;
}

void expectChar(const std::string& s, std::size_t pos, char c,
                const std::string& original) {
    if (pos >= s.size() || s[pos] != c) {
        throw std::invalid_argument("Invalid timestamp: " + original);
    }
}

} // namespace

Timestamp nowTimestamp() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

std::string formatTimestamp(Timestamp ts) {
    const auto sinceEpoch = ts.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);
    auto ms   = (sinceEpoch - secs).count();
    if (ms < 0) {   // pre-1970: keep the millisecond field non-negative
        secs -= std::chrono::seconds(1);
        ms   += 1000;
    }

    const std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return out.str();
}

Timestamp parseTimestamp(const std::string& text) {
    const std::string& s = text;

    // --- date/time: YYYY-MM-DDTHH:MM:SS ---
    std::tm tm{};
    tm.tm_year = readDigits(s, 0, 4, text) - 1900;
    expectChar(s, 4, '-', text);
    tm.tm_mon  = readDigits(s, 5, 2, text) - 1;
    expectChar(s, 7, '-', text);
    tm.tm_mday = readDigits(s, 8, 2, text);
    if (s.size() <= 10 || (s[10] != 'T' && s[10] != 't' && s[10] != ' ')) {
        throw std::invalid_argument("Invalid timestamp: " + text);
    }
    tm.tm_hour = readDigits(s, 11, 2, text);
    expectChar(s, 13, ':', text);
    tm.tm_min  = readDigits(s, 14, 2, text);
    expectChar(s, 16, ':', text);
    tm.tm_sec  = readDigits(s, 17, 2, text);

    std::size_t pos = 19;

    // --- fraction ---
    int millis = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits < 3) millis = millis * 10 + (s[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            throw std::invalid_argument("Invalid timestamp fraction: " + text);
        }
        for (std::size_t i = digits; i < 3; ++i) millis *= 10;
    }

    // --- offset ---
    int offsetMinutes = 0;
    if (pos < s.size()) {
        if (s[pos] == 'Z' || s[pos] == 'z') {
            ++pos;
        } else if (s[pos] == '+' || s[pos] == '-') {
            const int sign = (s[pos] == '-') ? -1 : 1;
            const int hh = readDigits(s, pos + 1, 2, text);
            expectChar(s, pos + 3, ':', text);
            const int mm = readDigits(s, pos + 4, 2, text);
            if (hh > 23 || mm > 59) {
                throw std::invalid_argument("Invalid timestamp offset: " + text);
            }
            offsetMinutes = sign * (hh * 60 + mm);
            pos += 6;
        }
    }
    if (pos != s.size()) {
        throw std::invalid_argument("Trailing characters in timestamp: " + text);
    }

    // timegm normalizes out-of-range fields; a round trip catches them.
    // (-1 is not an error marker here: it is 1969-12-31T23:59:59Z.)
    const std::tm requested = tm;
    const std::time_t t = timegm(&tm);
    if (tm.tm_year != requested.tm_year || tm.tm_mon  != requested.tm_mon ||
        tm.tm_mday != requested.tm_mday || tm.tm_hour != requested.tm_hour ||
        tm.tm_min  != requested.tm_min  || tm.tm_sec  != requested.tm_sec) {
        throw std::invalid_argument("Timestamp out of range: " + text);
    }

    return Timestamp(std::chrono::seconds(t)
                     - std::chrono::minutes(offsetMinutes)
                     + std::chrono::milliseconds(millis));
}

bool isBlank(const std::string& s) {
    return boost::algorithm::all(s, boost::algorithm::is_space());
}

} // namespace inventory_tracker
