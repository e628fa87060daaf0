#pragma once

#include "models.hpp"

#include <string>

namespace inventory_tracker {

/// Current system time truncated to milliseconds.
Timestamp nowTimestamp();

/// Format as ISO-8601 UTC with milliseconds, e.g. "2024-01-15T10:30:00.000Z".
std::string formatTimestamp(Timestamp ts);

/// Parse an ISO-8601 date-time.  Accepts an optional fractional second
/// (extra digits beyond milliseconds are truncated) and an optional "Z" or
/// "+HH:MM" / "-HH:MM" offset; no suffix means UTC.
/// Throws std::invalid_argument on malformed input.
Timestamp parseTimestamp(const std::string& text);

/// True if @p s is empty or only whitespace.
bool isBlank(const std::string& s);

} // namespace inventory_tracker
