#include "engine/delivery_time_optimizer.hpp"

#include <cctype>
#include <utility>

namespace nudge {

namespace {

constexpr int kDefaultReminderHour = 9;

// First two characters of the preferred reminder time ("09:30" -> 9).
int reminderHour(const std::optional<PersonalizationProfile> &profile)
{
    if (!profile.has_value()) {
        return kDefaultReminderHour;
    }
    const std::string &value = profile->preferredReminderTime;
    if (value.size() < 2
        || !std::isdigit(static_cast<unsigned char>(value[0]))
        || !std::isdigit(static_cast<unsigned char>(value[1]))) {
        return kDefaultReminderHour;
    }
    const int hour = (value[0] - '0') * 10 + (value[1] - '0');
    if (hour > 23) {
        return kDefaultReminderHour;
    }
    return hour;
}

} // namespace

DeliveryTimeOptimizer::DeliveryTimeOptimizer(Clock clock)
    : m_clock(std::move(clock))
{
}

int DeliveryTimeOptimizer::preferredHour(
    NotificationType type,
    const std::optional<PersonalizationProfile> &profile) const
{
    if (m_hourOverride) {
        const auto hour = m_hourOverride(type);
        if (hour.has_value() && *hour >= 0 && *hour <= 23) {
            return *hour;
        }
    }

    switch (type) {
    case NotificationType::Welcome:
        return 10;
    case NotificationType::Reminder:
        return reminderHour(profile);
    case NotificationType::Achievement:
        return 12;
    case NotificationType::Motivation:
        return 8;
    case NotificationType::Educational:
        return 15;
    case NotificationType::Social:
        return 18;
    case NotificationType::System:
        return 11;
    }
    return 11;
}

TimePoint DeliveryTimeOptimizer::optimalTime(
    NotificationType type,
    const std::optional<PersonalizationProfile> &profile) const
{
    const auto now = m_clock();
    const int hour = preferredHour(type, profile);

    TimePoint candidate = atLocalTime(now, hour, 0);
    if (candidate <= now) {
        candidate = addLocalDays(candidate, 1);
    }
    return candidate;
}

void DeliveryTimeOptimizer::setHourOverride(HourOverride hook)
{
    m_hourOverride = std::move(hook);
}

} // namespace nudge
