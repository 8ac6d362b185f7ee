#include "worklog/calendar.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <vector>

namespace worklog {

namespace {

bool same_wall_clock(const std::tm& a, const std::tm& b) {
    return a.tm_year == b.tm_year && a.tm_mon == b.tm_mon &&
           a.tm_mday == b.tm_mday && a.tm_hour == b.tm_hour &&
           a.tm_min == b.tm_min;
}

std::optional<int> parse_digits(const std::string& s, size_t pos, size_t count) {
    if (pos + count > s.size()) return std::nullopt;
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
        value = value * 10 + (s[i] - '0');
    }
    return value;
}

// Try the wall-clock time as standard time and as daylight time; keep
// the interpretations that round-trip to the same wall clock.
std::vector<std::time_t> local_candidates(const Date& date, ClockTime time) {
    std::tm wanted{};
    wanted.tm_year = static_cast<int>(date.year()) - 1900;
    wanted.tm_mon = static_cast<int>(static_cast<unsigned>(date.month())) - 1;
    wanted.tm_mday = static_cast<int>(static_cast<unsigned>(date.day()));
    wanted.tm_hour = time.hour;
    wanted.tm_min = time.minute;

    std::vector<std::time_t> candidates;
    for (int isdst : {0, 1}) {
        std::tm tm = wanted;
        tm.tm_isdst = isdst;
        auto t = std::mktime(&tm);
        if (t == static_cast<std::time_t>(-1)) continue;

        std::tm check{};
        localtime_r(&t, &check);
        if (!same_wall_clock(check, wanted)) continue;
        if (candidates.empty() || candidates.front() != t) candidates.push_back(t);
    }
    return candidates;
}

} // namespace

Date local_date(TimePoint tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);
    return Date{std::chrono::year{tm.tm_year + 1900},
                std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
                std::chrono::day{static_cast<unsigned>(tm.tm_mday)}};
}

std::expected<TimePoint, std::string> local_to_utc(const Date& date, ClockTime time) {
    if (!date.ok()) return std::unexpected("invalid date");

    auto candidates = local_candidates(date, time);
    if (candidates.empty()) {
        return std::unexpected("local time " + format_date(date) + " " +
                               std::to_string(time.hour) + ":" +
                               std::to_string(time.minute) + " does not exist");
    }
    if (candidates.size() > 1) {
        return std::unexpected("local time on " + format_date(date) + " is ambiguous");
    }
    return std::chrono::system_clock::from_time_t(candidates.front());
}

std::expected<TimePoint, std::string> start_of_local_day(const Date& date) {
    if (!date.ok()) return std::unexpected("invalid date");

    for (int minute = 0; minute < 24 * 60; ++minute) {
        auto candidates = local_candidates(date, {.hour = minute / 60, .minute = minute % 60});
        if (!candidates.empty()) {
            return std::chrono::system_clock::from_time_t(std::ranges::min(candidates));
        }
    }
    return std::unexpected("no local time exists on " + format_date(date));
}

std::optional<ClockTime> parse_clock_time(const std::string& s) {
    auto colon = s.find(':');
    if (colon == std::string::npos || colon == 0 || colon > 2) return std::nullopt;
    if (s.size() != colon + 3) return std::nullopt;

    auto hour = parse_digits(s, 0, colon);
    auto minute = parse_digits(s, colon + 1, 2);
    if (!hour || !minute) return std::nullopt;
    if (*hour > 23 || *minute > 59) return std::nullopt;
    return ClockTime{.hour = *hour, .minute = *minute};
}

bool is_weekday(const Date& date) {
    std::chrono::weekday wd{std::chrono::sys_days{date}};
    return wd != std::chrono::Saturday && wd != std::chrono::Sunday;
}

Date next_day(const Date& date) {
    return Date{std::chrono::sys_days{date} + std::chrono::days{1}};
}

Date previous_day(const Date& date) {
    return Date{std::chrono::sys_days{date} - std::chrono::days{1}};
}

std::string format_date(const Date& date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()));
    return buf;
}

std::optional<Date> parse_date(const std::string& s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    auto y = parse_digits(s, 0, 4);
    auto m = parse_digits(s, 5, 2);
    auto d = parse_digits(s, 8, 2);
    if (!y || !m || !d) return std::nullopt;

    Date date{std::chrono::year{*y},
              std::chrono::month{static_cast<unsigned>(*m)},
              std::chrono::day{static_cast<unsigned>(*d)}};
    if (!date.ok()) return std::nullopt;
    return date;
}

std::optional<TimePoint> parse_timestamp(const std::string& s) {
    if (s.size() < 20 || s[4] != '-' || s[7] != '-' || s[10] != 'T' ||
        s[13] != ':' || s[16] != ':') {
        return std::nullopt;
    }

    auto year = parse_digits(s, 0, 4);
    auto mon = parse_digits(s, 5, 2);
    auto mday = parse_digits(s, 8, 2);
    auto hour = parse_digits(s, 11, 2);
    auto min = parse_digits(s, 14, 2);
    auto sec = parse_digits(s, 17, 2);
    if (!year || !mon || !mday || !hour || !min || !sec) return std::nullopt;
    if (*hour > 23 || *min > 59 || *sec > 59) return std::nullopt;

    Date date{std::chrono::year{*year},
              std::chrono::month{static_cast<unsigned>(*mon)},
              std::chrono::day{static_cast<unsigned>(*mday)}};
    if (!date.ok()) return std::nullopt;

    size_t pos = 19;
    std::chrono::nanoseconds fraction{0};
    if (s[pos] == '.') {
        ++pos;
        size_t digits = 0;
        int64_t nanos = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (s[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (size_t i = digits; i < 9; ++i) nanos *= 10;
        fraction = std::chrono::nanoseconds(nanos);
    }

    std::chrono::minutes offset{0};
    if (pos >= s.size()) return std::nullopt;
    if (s[pos] == 'Z' || s[pos] == 'z') {
        ++pos;
    } else if (s[pos] == '+' || s[pos] == '-') {
        int sign = s[pos] == '-' ? -1 : 1;
        auto off_h = parse_digits(s, pos + 1, 2);
        auto off_m = parse_digits(s, pos + 4, 2);
        if (!off_h || !off_m || pos + 3 >= s.size() || s[pos + 3] != ':') {
            return std::nullopt;
        }
        offset = std::chrono::minutes(sign * (*off_h * 60 + *off_m));
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != s.size()) return std::nullopt;

    std::tm tm{};
    tm.tm_year = *year - 1900;
    tm.tm_mon = *mon - 1;
    tm.tm_mday = *mday;
    tm.tm_hour = *hour;
    tm.tm_min = *min;
    tm.tm_sec = *sec;

    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
    return tp - offset +
           std::chrono::duration_cast<std::chrono::system_clock::duration>(fraction);
}

std::string format_timestamp(TimePoint tp) {
    auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    auto tt = static_cast<std::time_t>(secs.time_since_epoch().count());
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string format_local_time(TimePoint tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);
    char buf[8];
    std::strftime(buf, sizeof(buf), "%H:%M", &tm);
    return buf;
}

} // namespace worklog
