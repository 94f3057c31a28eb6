#pragma once

#include <vector>

#include "common/models.hpp"

namespace nudge {

// Pure aggregation over the tracked collections. Nothing here reads the
// clock; callers pass the computation instant.

DeliveryStatistics computeDeliveryStatistics(const std::vector<DeliveryRecord> &records,
                                             TimePoint now);

// Nearest-rank percentile of an unsorted sample: index floor(n * p) of the
// sorted sample, clamped to the last element. 0 for an empty sample.
double nearestRankPercentile(std::vector<double> samples, double percentile);

EngagementMetrics computeEngagementMetrics(const std::vector<DeliveryRecord> &deliveryRecords,
                                           const std::vector<EngagementRecord> &engagementRecords,
                                           const std::vector<NotificationEvent> &events,
                                           TimePoint now);

// Heuristic findings, in a fixed order: low delivery rate, slow delivery,
// low engagement, high dismissal, best performing category.
std::vector<PerformanceInsight> generatePerformanceInsights(const DeliveryStatistics &stats,
                                                            const EngagementMetrics &metrics);

NotificationAnalytics computeSummary(const std::vector<DeliveryRecord> &deliveryRecords,
                                     const std::vector<EngagementRecord> &engagementRecords,
                                     TimePoint now);

} // namespace nudge
