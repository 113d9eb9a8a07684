#pragma once

#include <mediafetch/core/types.h>

#include <optional>
#include <string>
#include <string_view>

namespace mediafetch {

// UTC ISO-8601 with microseconds and explicit offset: 2026-01-01T10:00:00.000000+00:00
std::string formatIso8601(TimePoint tp);

// Accepts YYYY-MM-DDTHH:MM:SS[.fraction][Z|+HH:MM|-HH:MM]; a missing offset is read as UTC.
std::optional<TimePoint> parseIso8601(std::string_view text);

} // namespace mediafetch
