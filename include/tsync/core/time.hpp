#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

namespace tsync {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// Which calendar a wall-clock computation is carried out in.
enum class TimeZone { Local, Utc };

const char* to_string(TimeZone zone) noexcept;
std::optional<TimeZone> parse_time_zone(const std::string& name);

/// Broken-down calendar fields of `tp` in `zone`.
std::tm to_calendar(TimePoint tp, TimeZone zone);

/// Inverse of to_calendar. Out-of-range fields are normalised (e.g. minute 60
/// rolls into the next hour). Returns nullopt when the C library rejects the
/// value.
std::optional<TimePoint> from_calendar(std::tm fields, TimeZone zone);

/// strftime wrapper.
std::string format_time(TimePoint tp, const char* format, TimeZone zone = TimeZone::Local);

/// "2024-05-01T12:30:00Z" or "2024-05-01T12:30:00+02:00"
std::string to_iso8601(TimePoint tp, TimeZone zone = TimeZone::Utc);

/// Seconds since the epoch, truncating sub-second precision.
inline std::int64_t to_unix_seconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

inline TimePoint from_unix_seconds(std::int64_t seconds) {
    return TimePoint(std::chrono::seconds(seconds));
}

} // namespace tsync
