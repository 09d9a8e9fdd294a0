#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace TimeUtils {

// 2024-01-02T03:04:05.006Z for the given milliseconds since the epoch.
std::string formatIso8601(int64_t millis);

// Accepts YYYY-MM-DDTHH:MM:SS with optional fractional seconds and a Z or
// +hh:mm / -hh:mm offset. Returns milliseconds since the epoch, UTC.
std::optional<int64_t> parseIso8601(std::string_view text);

// True when the date lies in the range relaxed extended JSON renders as an
// ISO string (years 1970 through 9999).
bool isRelaxedDateRange(int64_t millis);

} // namespace TimeUtils

#endif
