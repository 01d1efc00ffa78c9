#pragma once

#include "tsync/core/result.hpp"
#include "tsync/core/time.hpp"

#include <bitset>
#include <optional>
#include <string>

namespace tsync::schedule {

/**
 * @brief A parsed cron trigger
 *
 * Accepts five fields (`min hour dom month dow`, seconds fixed at 0) or six
 * (`sec min hour dom month dow`). Each field is a comma list of `*`, `?`,
 * `a`, `a-b`, with an optional `/step`; `a/step` runs from a to the field
 * maximum. Months and weekdays also take three-letter names, and weekday 7
 * is Sunday like 0.
 *
 * When day-of-month and day-of-week are both restricted, a day matches if
 * either does.
 *
 * Every allowed value of a field is one bit, so matching a calendar time is
 * a handful of bit tests and the object never changes after parse().
 */
class CronExpression {
public:
    /// Scheduling error naming the offending field when the text is malformed.
    static Result<CronExpression> parse(const std::string& text);

    /**
     * Earliest matching time strictly after `reference`, evaluated on the
     * calendar of `zone`. nullopt when nothing matches within ten years
     * (for example "0 0 30 2 *").
     */
    [[nodiscard]] std::optional<TimePoint> next_after(TimePoint reference, TimeZone zone = TimeZone::Local) const;

    [[nodiscard]] bool matches(TimePoint tp, TimeZone zone = TimeZone::Local) const;

    [[nodiscard]] const std::string& text() const noexcept { return text_; }

private:
    CronExpression() = default;

    bool day_matches(const std::tm& fields) const;

    std::string text_;
    std::bitset<60> seconds_;
    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> days_;       // 1..31
    std::bitset<13> months_;     // 1..12
    std::bitset<7> weekdays_;    // 0 = Sunday
    bool days_restricted_ = false;
    bool weekdays_restricted_ = false;
};

/// parse() followed by next_after(); the trigger evaluation used by the scheduler.
Result<std::optional<TimePoint>> next_fire_time(const std::string& expression,
                                                TimePoint reference,
                                                TimeZone zone = TimeZone::Local);

} // namespace tsync::schedule
