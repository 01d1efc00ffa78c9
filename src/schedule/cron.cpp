#include "tsync/schedule/cron.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <vector>

namespace tsync::schedule {

namespace {

struct FieldSpec {
    const char* name;
    int min;
    int max;
    const char* const* names;   ///< Optional aliases indexed from `min`
    std::size_t name_count;
};

constexpr std::array<const char*, 12> kMonthNames = {
    "JAN", "FEB", "MAR", "APR", "MAY", "JUN", "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};
constexpr std::array<const char*, 8> kWeekdayNames = {"SUN", "MON", "TUE", "WED", "THU", "FRI", "SAT", "SUN"};

const FieldSpec kSecond{"second", 0, 59, nullptr, 0};
const FieldSpec kMinute{"minute", 0, 59, nullptr, 0};
const FieldSpec kHour{"hour", 0, 23, nullptr, 0};
const FieldSpec kDay{"day-of-month", 1, 31, nullptr, 0};
const FieldSpec kMonth{"month", 1, 12, kMonthNames.data(), kMonthNames.size()};
const FieldSpec kWeekday{"day-of-week", 0, 7, kWeekdayNames.data(), kWeekdayNames.size()};

std::vector<std::string> split(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream stream(text);
    while (std::getline(stream, current, separator)) {
        parts.push_back(current);
    }
    if (!text.empty() && text.back() == separator) {
        parts.emplace_back();
    }
    return parts;
}

std::optional<int> parse_value(const std::string& token, const FieldSpec& spec) {
    if (token.empty()) {
        return std::nullopt;
    }
    if (std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        if (token.size() > 4) {
            return std::nullopt;
        }
        const int value = std::stoi(token);
        if (value < spec.min || value > spec.max) {
            return std::nullopt;
        }
        return value;
    }
    std::string upper = token;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (std::size_t i = 0; i < spec.name_count; ++i) {
        if (upper == spec.names[i]) {
            return spec.min + static_cast<int>(i);
        }
    }
    return std::nullopt;
}

Error field_error(const FieldSpec& spec, const std::string& text, const std::string& why) {
    return Error{ErrorKind::Scheduling, std::string("invalid ") + spec.name + " field '" + text + "': " + why};
}

/// Sets every allowed value of one field; values are offsets from 0.
template<std::size_t N>
Result<void> parse_field(const std::string& text, const FieldSpec& spec, std::bitset<N>& bits) {
    if (text.empty()) {
        return Err<void, Error>(field_error(spec, text, "empty"));
    }
    for (const auto& item : split(text, ',')) {
        if (item.empty()) {
            return Err<void, Error>(field_error(spec, text, "empty list item"));
        }

        std::string range = item;
        int step = 1;
        if (const auto slash = item.find('/'); slash != std::string::npos) {
            range = item.substr(0, slash);
            const std::string step_text = item.substr(slash + 1);
            if (step_text.empty() || step_text.size() > 4 ||
                !std::all_of(step_text.begin(), step_text.end(),
                             [](unsigned char c) { return std::isdigit(c) != 0; })) {
                return Err<void, Error>(field_error(spec, text, "bad step '" + step_text + "'"));
            }
            step = std::stoi(step_text);
            if (step == 0) {
                return Err<void, Error>(field_error(spec, text, "step must be positive"));
            }
        }

        int first = spec.min;
        int last = spec.max;
        if (range == "*" || range == "?") {
            // whole range
        } else if (const auto dash = range.find('-'); dash != std::string::npos) {
            auto lo = parse_value(range.substr(0, dash), spec);
            auto hi = parse_value(range.substr(dash + 1), spec);
            if (!lo || !hi) {
                return Err<void, Error>(field_error(spec, text, "bad range '" + range + "'"));
            }
            if (*lo > *hi) {
                return Err<void, Error>(field_error(spec, text, "range '" + range + "' is reversed"));
            }
            first = *lo;
            last = *hi;
        } else {
            auto value = parse_value(range, spec);
            if (!value) {
                return Err<void, Error>(field_error(spec, text, "bad value '" + range + "'"));
            }
            first = *value;
            last = item.find('/') != std::string::npos ? spec.max : *value;
        }

        for (int value = first; value <= last; value += step) {
            // weekday 7 folds onto Sunday
            const auto bit = static_cast<std::size_t>(value) % N;
            bits.set(bit);
        }
    }
    return Ok();
}

bool restricted(const std::string& field) {
    return !field.empty() && field.front() != '*' && field.front() != '?';
}

template<std::size_t N>
int next_set(const std::bitset<N>& bits, int from, int max) {
    for (int value = from; value <= max; ++value) {
        if (bits.test(static_cast<std::size_t>(value))) {
            return value;
        }
    }
    return -1;
}

} // namespace

Result<CronExpression> CronExpression::parse(const std::string& text) {
    std::istringstream stream(text);
    std::vector<std::string> fields;
    for (std::string field; stream >> field;) {
        fields.push_back(field);
    }
    if (fields.size() == 5) {
        fields.insert(fields.begin(), "0");
    } else if (fields.size() != 6) {
        return Err<CronExpression>(ErrorKind::Scheduling,
                                   "cron expression '" + text + "' must have 5 or 6 fields, got " +
                                       std::to_string(fields.size()));
    }

    CronExpression cron;
    cron.text_ = text;
    const std::array<Result<void>, 6> parsed = {
        parse_field(fields[0], kSecond, cron.seconds_),
        parse_field(fields[1], kMinute, cron.minutes_),
        parse_field(fields[2], kHour, cron.hours_),
        parse_field(fields[3], kDay, cron.days_),
        parse_field(fields[4], kMonth, cron.months_),
        parse_field(fields[5], kWeekday, cron.weekdays_),
    };
    for (const auto& result : parsed) {
        if (result.is_error()) {
            return Err<CronExpression>(ErrorKind::Scheduling,
                                       "cron expression '" + text + "': " + result.error().message);
        }
    }
    cron.days_restricted_ = restricted(fields[3]);
    cron.weekdays_restricted_ = restricted(fields[5]);
    return Ok(std::move(cron));
}

bool CronExpression::day_matches(const std::tm& fields) const {
    const bool day = days_.test(static_cast<std::size_t>(fields.tm_mday));
    const bool weekday = weekdays_.test(static_cast<std::size_t>(fields.tm_wday));
    if (days_restricted_ && weekdays_restricted_) {
        return day || weekday;
    }
    return day && weekday;
}

bool CronExpression::matches(TimePoint tp, TimeZone zone) const {
    const std::tm fields = to_calendar(tp, zone);
    return seconds_.test(static_cast<std::size_t>(fields.tm_sec)) &&
           minutes_.test(static_cast<std::size_t>(fields.tm_min)) &&
           hours_.test(static_cast<std::size_t>(fields.tm_hour)) &&
           months_.test(static_cast<std::size_t>(fields.tm_mon + 1)) &&
           day_matches(fields);
}

std::optional<TimePoint> CronExpression::next_after(TimePoint reference, TimeZone zone) const {
    auto candidate = std::chrono::time_point_cast<std::chrono::seconds>(reference) + std::chrono::seconds(1);
    const TimePoint limit = reference + std::chrono::hours(24 * 366 * 10);

    TimePoint current = candidate;
    while (current <= limit) {
        std::tm fields = to_calendar(current, zone);

        // Each branch moves to the first instant of the next candidate unit
        // and lets the calendar normalise overflowing fields.
        if (!months_.test(static_cast<std::size_t>(fields.tm_mon + 1))) {
            fields.tm_mon += 1;
            fields.tm_mday = 1;
            fields.tm_hour = fields.tm_min = fields.tm_sec = 0;
        } else if (!day_matches(fields)) {
            fields.tm_mday += 1;
            fields.tm_hour = fields.tm_min = fields.tm_sec = 0;
        } else if (!hours_.test(static_cast<std::size_t>(fields.tm_hour))) {
            const int next = next_set(hours_, fields.tm_hour, 23);
            if (next < 0) {
                fields.tm_mday += 1;
                fields.tm_hour = 0;
            } else {
                fields.tm_hour = next;
            }
            fields.tm_min = fields.tm_sec = 0;
        } else if (!minutes_.test(static_cast<std::size_t>(fields.tm_min))) {
            const int next = next_set(minutes_, fields.tm_min, 59);
            if (next < 0) {
                fields.tm_hour += 1;
                fields.tm_min = 0;
            } else {
                fields.tm_min = next;
            }
            fields.tm_sec = 0;
        } else if (!seconds_.test(static_cast<std::size_t>(fields.tm_sec))) {
            const int next = next_set(seconds_, fields.tm_sec, 59);
            if (next < 0) {
                fields.tm_min += 1;
                fields.tm_sec = 0;
            } else {
                fields.tm_sec = next;
            }
        } else {
            return current;
        }

        auto advanced = from_calendar(fields, zone);
        if (!advanced) {
            return std::nullopt;
        }
        // A DST transition can map the normalised fields back onto or before
        // the current instant; step forward instead of looping.
        current = *advanced > current ? *advanced : current + std::chrono::seconds(1);
    }
    return std::nullopt;
}

Result<std::optional<TimePoint>> next_fire_time(const std::string& expression, TimePoint reference, TimeZone zone) {
    auto cron = CronExpression::parse(expression);
    if (cron.is_error()) {
        return Err<std::optional<TimePoint>>(cron.error());
    }
    return Ok(cron.value().next_after(reference, zone));
}

} // namespace tsync::schedule
