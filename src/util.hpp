#pragma once

#include "models.hpp"

#include <string>

namespace stock_control {

/// Current UTC instant truncated to whole microseconds, so that it survives a
/// round trip through formatTimestamp / parseTimestamp unchanged.
Timestamp nowUtc();

/// Render a timestamp as "YYYY-MM-DDTHH:MM:SS.ffffffZ".
/// Fixed width, so the text sorts the same way as the instants do.
std::string formatTimestamp(Timestamp ts);

/// Render a timestamp as "YYYY-MM-DD HH:MM:SS" for display.
std::string formatDisplayTimestamp(Timestamp ts);

/// Parse "YYYY-MM-DDTHH:MM:SS[.f{1,9}](Z|+00:00)", truncated to microseconds.
/// Throws std::invalid_argument on malformed input or an instant the clock
/// cannot represent.
Timestamp parseTimestamp(const std::string& text);

/// Parse a command-line date-time "YYYY-MM-DDTHH:MM:SS" as UTC.
/// Throws std::invalid_argument on malformed or unrepresentable input.
Timestamp parseDateTime(const std::string& text);

/// Fresh random (version 4) UUID string.
std::string generateId();

/// True if @p s is empty or contains only whitespace.
bool isBlank(const std::string& s);

} // namespace stock_control
