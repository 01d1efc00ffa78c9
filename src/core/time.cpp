#include "tsync/core/time.hpp"

#include <array>

namespace tsync {

const char* to_string(TimeZone zone) noexcept {
    return zone == TimeZone::Utc ? "utc" : "local";
}

std::optional<TimeZone> parse_time_zone(const std::string& name) {
    if (name == "local" || name.empty()) {
        return TimeZone::Local;
    }
    if (name == "utc" || name == "UTC") {
        return TimeZone::Utc;
    }
    return std::nullopt;
}

std::tm to_calendar(TimePoint tp, TimeZone zone) {
    const std::time_t raw = Clock::to_time_t(tp);
    std::tm fields{};
    if (zone == TimeZone::Utc) {
        gmtime_r(&raw, &fields);
    } else {
        localtime_r(&raw, &fields);
    }
    return fields;
}

std::optional<TimePoint> from_calendar(std::tm fields, TimeZone zone) {
    std::time_t raw;
    if (zone == TimeZone::Utc) {
        raw = timegm(&fields);
    } else {
        fields.tm_isdst = -1;
        raw = mktime(&fields);
    }
    if (raw == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return Clock::from_time_t(raw);
}

std::string format_time(TimePoint tp, const char* format, TimeZone zone) {
    const std::tm fields = to_calendar(tp, zone);
    std::array<char, 128> buffer{};
    const auto written = std::strftime(buffer.data(), buffer.size(), format, &fields);
    return std::string(buffer.data(), written);
}

std::string to_iso8601(TimePoint tp, TimeZone zone) {
    if (zone == TimeZone::Utc) {
        return format_time(tp, "%Y-%m-%dT%H:%M:%SZ", zone);
    }
    std::string offset = format_time(tp, "%z", zone);  // +0200
    if (offset.size() == 5) {
        offset.insert(3, ":");
    }
    return format_time(tp, "%Y-%m-%dT%H:%M:%S", zone) + offset;
}

} // namespace tsync
