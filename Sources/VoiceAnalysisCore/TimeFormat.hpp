#pragma once

#include "Types.hpp"

#include <optional>
#include <string>

namespace va {

/// Format as ISO-8601 UTC with millisecond precision,
/// e.g. "2025-03-01T10:20:30.123Z".  Lexicographic order of the output
/// matches chronological order, which ORDER BY CREATION_DATE relies on.
std::string to_iso8601(TimePoint tp);

/// Parse "YYYY-MM-DDTHH:MM:SS", with an optional fractional part and an
/// optional "Z" or "+HH:MM"/"-HH:MM" suffix.  A missing suffix is read as
/// UTC.  Returns nullopt on anything else.
std::optional<TimePoint> from_iso8601(const std::string& text);

} // namespace va
