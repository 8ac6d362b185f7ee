#pragma once

#include "worklog/types.hpp"
#include <expected>
#include <optional>
#include <string>

namespace worklog {

struct ClockTime {
    int hour = 0;
    int minute = 0;
};

// Local calendar date of an instant, using the process timezone.
Date local_date(TimePoint tp);

// Converts a local wall-clock time on `date` to an instant. Fails when the
// time does not exist on that date or maps to two instants (DST changes).
std::expected<TimePoint, std::string> local_to_utc(const Date& date, ClockTime time);

// First instant of `date` in local time: local midnight, or the first wall
// clock time that exists when a DST change skips midnight. When midnight
// repeats, the earlier instant.
std::expected<TimePoint, std::string> start_of_local_day(const Date& date);

std::optional<ClockTime> parse_clock_time(const std::string& s);

bool is_weekday(const Date& date);
Date next_day(const Date& date);
Date previous_day(const Date& date);

std::string format_date(const Date& date);
std::optional<Date> parse_date(const std::string& s);

// ISO-8601 / RFC 3339: "2026-02-03T17:36:56.625Z" or with a +HH:MM offset.
std::optional<TimePoint> parse_timestamp(const std::string& s);

// UTC, second resolution: "2026-02-03T17:36:56Z".
std::string format_timestamp(TimePoint tp);

std::string format_local_time(TimePoint tp); // HH:MM

} // namespace worklog
