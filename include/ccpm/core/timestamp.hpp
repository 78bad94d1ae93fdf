#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace ccpm {

using TimePoint = std::chrono::system_clock::time_point;

/// UTC timestamp with millisecond precision: 2024-05-01T12:30:45.123Z
std::string FormatIso8601(TimePoint tp);

/// FormatIso8601(now).
std::string Iso8601Now();

/// Parse the forms FormatIso8601 produces, with or without milliseconds, and
/// with either a 'Z' or a "+00:00" suffix. Returns nullopt on anything else.
std::optional<TimePoint> ParseIso8601(std::string_view text);

/// Timestamp safe for file names: ':' and '.' replaced with '-'.
std::string FileSafeTimestamp(TimePoint tp);

} // namespace ccpm
