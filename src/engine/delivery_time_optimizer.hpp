#pragma once

#include <functional>
#include <optional>

#include "common/models.hpp"
#include "common/time_utils.hpp"

namespace nudge {

// DeliveryTimeOptimizer picks the next local wall-clock instant at the
// preferred hour for a notification type.
class DeliveryTimeOptimizer {
public:
    // Optional hook returning an hour (0-23) that replaces the static table
    // for a type, e.g. the measured best-performing hour. nullopt or an
    // out-of-range hour falls back to the table.
    using HourOverride = std::function<std::optional<int>(NotificationType)>;

    explicit DeliveryTimeOptimizer(Clock clock = systemClock());

    // Always strictly after the clock's current instant.
    TimePoint optimalTime(NotificationType type,
                          const std::optional<PersonalizationProfile> &profile) const;

    int preferredHour(NotificationType type,
                      const std::optional<PersonalizationProfile> &profile) const;

    void setHourOverride(HourOverride hook);

private:
    Clock m_clock;
    HourOverride m_hourOverride;
};

} // namespace nudge
