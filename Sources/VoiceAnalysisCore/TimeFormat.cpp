#include "TimeFormat.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace va {

std::string to_iso8601(TimePoint tp) {
    using namespace std::chrono;

    auto ms_total = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    auto secs     = ms_total / 1000;
    auto ms       = ms_total % 1000;
    if (ms < 0) {
        ms += 1000;
        secs -= 1;
    }

    std::time_t t = static_cast<std::time_t>(secs);
    std::tm utc{};
    gmtime_r(&t, &utc);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(ms));
    return buf;
}

std::optional<TimePoint> from_iso8601(const std::string& text) {
    using namespace std::chrono;

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second,
                    &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);

    // Fractional seconds: keep up to microseconds, ignore the rest.
    int64_t micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        while (digits < 6) {
            micros *= 10;
            ++digits;
        }
    }

    int offset_sec = 0;
    if (pos < text.size()) {
        char c = text[pos];
        if (c == 'Z' || c == 'z') {
            ++pos;
        } else if (c == '+' || c == '-') {
            int oh = 0, om = 0;
            if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
                return std::nullopt;
            }
            offset_sec = (oh * 3600 + om * 60) * (c == '-' ? -1 : 1);
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) return std::nullopt;

    std::tm utc{};
    utc.tm_year = year - 1900;
    utc.tm_mon  = month - 1;
    utc.tm_mday = day;
    utc.tm_hour = hour;
    utc.tm_min  = minute;
    utc.tm_sec  = second;
    std::time_t t = timegm(&utc);

    return Clock::from_time_t(t - offset_sec) +
           duration_cast<Clock::duration>(microseconds(micros));
}

} // namespace va
