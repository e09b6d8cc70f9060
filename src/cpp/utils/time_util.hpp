#pragma once
// UTC wall-clock helpers. Every persisted timestamp is ISO-8601 with
// microsecond precision and a 'Z' suffix: 2024-03-01T10:15:30.123456Z
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <optional>
#include <string>

namespace harvest {

using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::microseconds>;

inline TimePoint now_utc() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(Clock::now());
}

inline std::string format_iso(TimePoint tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    if (secs > tp) secs -= std::chrono::seconds(1);
    auto micros = (tp - secs).count();
    std::time_t t = Clock::to_time_t(secs);
    struct tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &t);
#else
    gmtime_r(&t, &tm_buf);
#endif
    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%06lldZ", buf, static_cast<long long>(micros));
    return out;
}

// "20240301_101530" -- used inside session and checkpoint ids
inline std::string compact_stamp(TimePoint tp) {
    std::time_t t = Clock::to_time_t(std::chrono::time_point_cast<std::chrono::seconds>(tp));
    struct tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &t);
#else
    gmtime_r(&t, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm_buf);
    return buf;
}

// Accepts "YYYY-MM-DDTHH:MM:SS[.ffffff][Z]". Fractions longer than six
// digits are truncated; anything else malformed yields nullopt.
inline std::optional<TimePoint> parse_iso(const std::string& text) {
    int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &mon, &day, &hour, &min, &sec, &consumed) != 6) {
        return std::nullopt;
    }
    if (mon < 1 || mon > 12 || day < 1 || day > 31 || hour > 23 || min > 59 || sec > 60) {
        return std::nullopt;
    }

    long long micros = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        while (digits < 6) { micros *= 10; ++digits; }
    }
    if (pos < text.size() && text[pos] == 'Z') ++pos;
    if (pos != text.size()) return std::nullopt;

    struct tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = mon - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = min;
    tm_buf.tm_sec = sec;
#ifdef _WIN32
    std::time_t t = _mkgmtime(&tm_buf);
#else
    std::time_t t = timegm(&tm_buf);
#endif
    auto base = std::chrono::time_point_cast<std::chrono::microseconds>(Clock::from_time_t(t));
    return base + std::chrono::microseconds(micros);
}

inline double seconds_between(TimePoint earlier, TimePoint later) {
    return std::chrono::duration<double>(later - earlier).count();
}

} // namespace harvest
