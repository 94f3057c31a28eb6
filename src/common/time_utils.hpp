#pragma once

#include <chrono>
#include <ctime>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace nudge {

// Injectable wall clock. Components never call system_clock::now() directly.
using Clock = std::function<std::chrono::system_clock::time_point()>;

inline Clock systemClock()
{
    return [] { return std::chrono::system_clock::now(); };
}

inline std::tm toLocalTm(std::chrono::system_clock::time_point t)
{
    std::time_t raw = std::chrono::system_clock::to_time_t(t);
    std::tm localTime{};
#if defined(_WIN32)
    localtime_s(&localTime, &raw);
#else
    localtime_r(&raw, &localTime);
#endif
    return localTime;
}

inline std::chrono::system_clock::time_point fromLocalTm(std::tm tm)
{
    tm.tm_isdst = -1;
    const std::time_t raw = std::mktime(&tm);
    return std::chrono::system_clock::from_time_t(raw);
}

inline int localHour(std::chrono::system_clock::time_point t)
{
    return toLocalTm(t).tm_hour;
}

// Same local calendar day as `t`, at hour:minute:00.
inline std::chrono::system_clock::time_point atLocalTime(
    std::chrono::system_clock::time_point t, int hour, int minute)
{
    std::tm tm = toLocalTm(t);
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = 0;
    return fromLocalTm(tm);
}

// Calendar-day arithmetic in local time; keeps the wall-clock time of day.
inline std::chrono::system_clock::time_point addLocalDays(
    std::chrono::system_clock::time_point t, int days)
{
    if (days == 0) {
        return t;
    }
    const auto subSecond = t - std::chrono::system_clock::from_time_t(
                                   std::chrono::system_clock::to_time_t(t));
    std::tm tm = toLocalTm(t);
    tm.tm_mday += days;
    return fromLocalTm(tm) + subSecond;
}

// Parses "HH:MM". Returns nullopt for anything else, including out-of-range values.
inline std::optional<std::pair<int, int>> parseTimeOfDay(const std::string &value)
{
    const auto colon = value.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= value.size()) {
        return std::nullopt;
    }
    if (value.find(':', colon + 1) != std::string::npos) {
        return std::nullopt;
    }

    int hours = 0;
    int minutes = 0;
    try {
        std::size_t consumed = 0;
        const std::string hourPart = value.substr(0, colon);
        hours = std::stoi(hourPart, &consumed);
        if (consumed != hourPart.size()) {
            return std::nullopt;
        }
        const std::string minutePart = value.substr(colon + 1);
        minutes = std::stoi(minutePart, &consumed);
        if (consumed != minutePart.size()) {
            return std::nullopt;
        }
    } catch (const std::exception &) {
        return std::nullopt;
    }
    if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
        return std::nullopt;
    }
    return std::make_pair(hours, minutes);
}

} // namespace nudge
