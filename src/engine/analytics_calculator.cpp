#include "engine/analytics_calculator.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <utility>

#include "common/id_utils.hpp"
#include "common/time_utils.hpp"

namespace nudge {

namespace {

constexpr double kLowDeliveryRateThreshold = 0.8;
constexpr double kSlowDeliverySeconds = 30.0;
constexpr double kLowOpenRateThreshold = 0.1;
constexpr double kHighDismissalThreshold = 0.7;

const char *const kUnknownCategory = "unknown";

double ratio(int numerator, int denominator)
{
    return denominator > 0 ? static_cast<double>(numerator) / denominator : 0.0;
}

int percentOf(double rate)
{
    return static_cast<int>(rate * 100.0);
}

int countStatus(const std::vector<DeliveryRecord> &records, DeliveryStatus status)
{
    return static_cast<int>(std::count_if(
        records.begin(), records.end(),
        [status](const DeliveryRecord &record) { return record.deliveryStatus == status; }));
}

int countAction(const std::vector<EngagementRecord> &records, UserAction action)
{
    return static_cast<int>(std::count_if(
        records.begin(), records.end(),
        [action](const EngagementRecord &record) { return record.actionTaken == action; }));
}

double averageDeliveryTime(const std::vector<DeliveryRecord> &records)
{
    double total = 0.0;
    int count = 0;
    for (const auto &record : records) {
        if (record.deliveryStatus == DeliveryStatus::Delivered && record.deliveryTime.has_value()) {
            total += *record.deliveryTime;
            ++count;
        }
    }
    return count > 0 ? total / count : 0.0;
}

double openRate(const std::vector<DeliveryRecord> &deliveryRecords,
                const std::vector<EngagementRecord> &engagementRecords)
{
    return ratio(countAction(engagementRecords, UserAction::Opened),
                 countStatus(deliveryRecords, DeliveryStatus::Delivered));
}

// Shared counters for the category and hour-of-day breakdowns.
struct EventTally {
    int sent = 0;
    int delivered = 0;
    int opened = 0;
    int dismissed = 0;
    int actions = 0;

    void add(NotificationEventType type)
    {
        switch (type) {
        case NotificationEventType::Sent:
            ++sent;
            break;
        case NotificationEventType::Delivered:
            ++delivered;
            break;
        case NotificationEventType::Opened:
            ++opened;
            break;
        case NotificationEventType::Dismissed:
            ++dismissed;
            break;
        case NotificationEventType::ActionTaken:
            ++actions;
            break;
        case NotificationEventType::Failed:
            break;
        }
    }

    template <typename Engagement>
    void fill(Engagement &out) const
    {
        out.totalSent = sent;
        out.totalDelivered = delivered;
        out.totalOpened = opened;
        out.totalDismissed = dismissed;
        out.totalActionsTaken = actions;
        out.deliveryRate = ratio(delivered, sent);
        out.openRate = ratio(opened, delivered);
        out.dismissalRate = ratio(dismissed, delivered);
        out.actionRate = ratio(actions, delivered);
    }
};

} // namespace

double nearestRankPercentile(std::vector<double> samples, double percentile)
{
    if (samples.empty()) {
        return 0.0;
    }
    std::sort(samples.begin(), samples.end());
    const auto raw = static_cast<std::size_t>(
        std::floor(static_cast<double>(samples.size()) * percentile));
    const std::size_t index = std::min(raw, samples.size() - 1);
    return samples[index];
}

DeliveryStatistics computeDeliveryStatistics(const std::vector<DeliveryRecord> &records,
                                             TimePoint now)
{
    DeliveryStatistics stats;
    stats.totalSent = static_cast<int>(records.size());
    stats.totalDelivered = countStatus(records, DeliveryStatus::Delivered);
    stats.totalFailed = countStatus(records, DeliveryStatus::Failed);
    stats.totalPending = stats.totalSent - stats.totalDelivered - stats.totalFailed;
    stats.deliveryRate = ratio(stats.totalDelivered, stats.totalSent);
    stats.failureRate = ratio(stats.totalFailed, stats.totalSent);
    stats.averageDeliveryTime = averageDeliveryTime(records);

    std::vector<double> latencies;
    for (const auto &record : records) {
        if (record.deliveryTime.has_value()) {
            latencies.push_back(*record.deliveryTime);
        }
    }
    stats.p95DeliveryTime = nearestRankPercentile(std::move(latencies), 0.95);
    stats.lastUpdated = now;
    return stats;
}

EngagementMetrics computeEngagementMetrics(const std::vector<DeliveryRecord> &deliveryRecords,
                                           const std::vector<EngagementRecord> &engagementRecords,
                                           const std::vector<NotificationEvent> &events,
                                           TimePoint now)
{
    EngagementMetrics metrics;

    const int delivered = countStatus(deliveryRecords, DeliveryStatus::Delivered);
    metrics.openRate = ratio(countAction(engagementRecords, UserAction::Opened), delivered);
    metrics.dismissalRate = ratio(countAction(engagementRecords, UserAction::Dismissed), delivered);
    metrics.actionRate = ratio(countAction(engagementRecords, UserAction::ActionTaken), delivered);

    double openTotal = 0.0;
    int openCount = 0;
    double dismissTotal = 0.0;
    int dismissCount = 0;
    for (const auto &record : engagementRecords) {
        if (record.actionTaken == UserAction::Opened && record.timeToOpen.has_value()) {
            openTotal += *record.timeToOpen;
            ++openCount;
        } else if (record.actionTaken == UserAction::Dismissed && record.timeToDismiss.has_value()) {
            dismissTotal += *record.timeToDismiss;
            ++dismissCount;
        }
    }
    metrics.averageTimeToOpen = openCount > 0 ? openTotal / openCount : 0.0;
    metrics.averageTimeToDismiss = dismissCount > 0 ? dismissTotal / dismissCount : 0.0;

    std::map<std::string, EventTally> byCategory;
    EventTally byHour[24];
    for (const auto &event : events) {
        byCategory[event.category.value_or(kUnknownCategory)].add(event.type);
        const int hour = localHour(event.timestamp);
        if (hour >= 0 && hour < 24) {
            byHour[hour].add(event.type);
        }
    }

    for (const auto &entry : byCategory) {
        CategoryEngagement engagement;
        entry.second.fill(engagement);
        metrics.engagementByCategory[entry.first] = engagement;
    }
    for (int hour = 0; hour < 24; ++hour) {
        TimeOfDayEngagement engagement;
        engagement.hour = hour;
        byHour[hour].fill(engagement);
        metrics.engagementByTimeOfDay[hour] = engagement;
    }

    metrics.lastUpdated = now;
    return metrics;
}

std::vector<PerformanceInsight> generatePerformanceInsights(const DeliveryStatistics &stats,
                                                            const EngagementMetrics &metrics)
{
    std::vector<PerformanceInsight> insights;

    auto add = [&insights](InsightType type,
                           InsightSeverity severity,
                           std::string title,
                           std::string description,
                           std::string recommendation,
                           InsightImpact impact) {
        PerformanceInsight insight;
        insight.id = generateUuid();
        insight.type = type;
        insight.severity = severity;
        insight.title = std::move(title);
        insight.description = std::move(description);
        insight.recommendation = std::move(recommendation);
        insight.impact = impact;
        insights.push_back(std::move(insight));
    };

    if (stats.deliveryRate < kLowDeliveryRateThreshold) {
        add(InsightType::LowDeliveryRate,
            InsightSeverity::High,
            "Low Delivery Rate",
            "Delivery rate is " + std::to_string(percentOf(stats.deliveryRate))
                + "%. Consider checking notification permissions and timing.",
            "Review notification settings and consider optimizing send times.",
            InsightImpact::DeliveryOptimization);
    }

    if (stats.averageDeliveryTime > kSlowDeliverySeconds) {
        add(InsightType::SlowDelivery,
            InsightSeverity::Medium,
            "Slow Delivery",
            "Average delivery time is "
                + std::to_string(static_cast<int>(stats.averageDeliveryTime)) + "s.",
            "Optimize notification payload size and delivery timing.",
            InsightImpact::DeliveryOptimization);
    }

    if (metrics.openRate < kLowOpenRateThreshold) {
        add(InsightType::LowEngagement,
            InsightSeverity::High,
            "Low Open Rate",
            "Open rate is " + std::to_string(percentOf(metrics.openRate)) + "%.",
            "Improve notification content and personalization.",
            InsightImpact::EngagementOptimization);
    }

    if (metrics.dismissalRate > kHighDismissalThreshold) {
        add(InsightType::HighDismissal,
            InsightSeverity::Medium,
            "High Dismissal Rate",
            "Dismissal rate is " + std::to_string(percentOf(metrics.dismissalRate)) + "%.",
            "Review notification frequency and relevance.",
            InsightImpact::ContentOptimization);
    }

    if (!metrics.engagementByCategory.empty()) {
        auto best = metrics.engagementByCategory.begin();
        for (auto it = metrics.engagementByCategory.begin();
             it != metrics.engagementByCategory.end(); ++it) {
            if (it->second.openRate > best->second.openRate) {
                best = it;
            }
        }
        add(InsightType::BestPerformingCategory,
            InsightSeverity::Info,
            "Best Performing Category",
            best->first + " notifications have the highest open rate at "
                + std::to_string(percentOf(best->second.openRate)) + "%.",
            "Consider increasing frequency of " + best->first + " notifications.",
            InsightImpact::ContentOptimization);
    }

    return insights;
}

NotificationAnalytics computeSummary(const std::vector<DeliveryRecord> &deliveryRecords,
                                     const std::vector<EngagementRecord> &engagementRecords,
                                     TimePoint now)
{
    NotificationAnalytics summary;
    summary.totalNotificationsSent = static_cast<int>(deliveryRecords.size());
    summary.totalDelivered = countStatus(deliveryRecords, DeliveryStatus::Delivered);
    summary.totalOpened = countAction(engagementRecords, UserAction::Opened);
    summary.totalFailed = countStatus(deliveryRecords, DeliveryStatus::Failed);
    summary.averageDeliveryTime = averageDeliveryTime(deliveryRecords);
    summary.averageOpenRate = openRate(deliveryRecords, engagementRecords);
    summary.lastUpdated = now;
    summary.timeRange = AnalyticsTimeRange::Last30Days;
    return summary;
}

} // namespace nudge
