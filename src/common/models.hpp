#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace nudge {

using TimePoint = std::chrono::system_clock::time_point;

struct NotificationTemplate {
    std::string id;
    NotificationType type = NotificationType::System;
    std::string title;
    std::string body;
    // Delivery-side category identifier (GENERAL, REMINDER, ...).
    std::string category;
    NotificationPriority priority = NotificationPriority::Medium;
    std::vector<std::string> tags;
    std::vector<std::string> personalizationFields;

    std::optional<std::string> subtitle;
    std::optional<std::string> soundName;
    std::optional<int> badgeCount;
};

struct ScheduleItem {
    std::string templateId;
    int offsetDays = 0;
    std::optional<std::string> preferredTime;
    std::map<std::string, std::string> personalizationData;
};

struct Campaign {
    std::string id;
    std::string name;
    std::string description;
    TimePoint startDate;
    TimePoint endDate;
    std::vector<ScheduleItem> schedule;

    CampaignStatus status = CampaignStatus::Draft;
    std::vector<std::string> scheduledNotificationIds;
    std::vector<std::string> targetAudience;
};

struct PersonalizationProfile {
    std::optional<std::string> userName;
    std::string preferredReminderTime = "09:00";
    int preferredSessionDuration = 10;
    std::vector<std::string> interests;
    int completedSessions = 0;
    int currentStreak = 0;
    std::string timezone;
    TimePoint lastActiveDate;
};

struct RenderedContent {
    std::string title;
    std::string body;
    std::optional<std::string> subtitle;
};

// Request handed to the delivery subsystem.
struct NotificationRequest {
    std::string id;
    std::string title;
    std::string body;
    std::optional<std::string> subtitle;
    std::string category;
    TimePoint deliverAt;
};

struct PendingNotification {
    std::string id;
    std::string title;
    std::string body;
    TimePoint scheduledAt;
    std::string category;
};

struct DeliveredNotification {
    std::string id;
    std::string title;
    std::string body;
    TimePoint deliveredAt;
    std::string category;
};

struct DeliveryMetrics {
    int totalSent = 0;
    int totalDelivered = 0;
    int totalPending = 0;
    double deliveryRate = 0.0;
    TimePoint lastUpdated;
};

struct NotificationEvent {
    std::string id;
    std::string notificationId;
    NotificationEventType type = NotificationEventType::Sent;
    std::optional<std::string> category;
    std::optional<NotificationType> notificationType;
    TimePoint timestamp;

    std::optional<double> deliveryTime;
    std::optional<double> timeToOpen;
    std::optional<double> timeToDismiss;
    std::optional<std::string> actionId;
    std::optional<NotificationActionType> actionType;
    std::optional<std::string> errorMessage;
    std::optional<bool> isPersonalized;
};

// Current-state projection of one notification. Upserted, one per id.
struct DeliveryRecord {
    std::string notificationId;
    TimePoint sentAt;
    std::optional<TimePoint> deliveredAt;
    DeliveryStatus deliveryStatus = DeliveryStatus::Sent;
    int attemptCount = 1;
    std::optional<double> deliveryTime;
    std::optional<std::string> errorMessage;
};

struct EngagementRecord {
    std::string notificationId;
    std::optional<TimePoint> openedAt;
    std::optional<TimePoint> dismissedAt;
    std::optional<TimePoint> actionTakenAt;
    std::optional<double> timeToOpen;
    std::optional<double> timeToDismiss;
    std::optional<std::string> actionId;
    std::optional<NotificationActionType> actionType;
    UserAction actionTaken = UserAction::Opened;
};

struct NotificationAnalytics {
    int totalNotificationsSent = 0;
    int totalDelivered = 0;
    int totalOpened = 0;
    int totalFailed = 0;
    double averageDeliveryTime = 0.0;
    double averageOpenRate = 0.0;
    TimePoint lastUpdated;
    AnalyticsTimeRange timeRange = AnalyticsTimeRange::Last30Days;
};

struct DeliveryStatistics {
    int totalSent = 0;
    int totalDelivered = 0;
    int totalFailed = 0;
    int totalPending = 0;
    double deliveryRate = 0.0;
    double failureRate = 0.0;
    double averageDeliveryTime = 0.0;
    double p95DeliveryTime = 0.0;
    TimePoint lastUpdated;
};

struct CategoryEngagement {
    int totalSent = 0;
    int totalDelivered = 0;
    int totalOpened = 0;
    int totalDismissed = 0;
    int totalActionsTaken = 0;
    double deliveryRate = 0.0;
    double openRate = 0.0;
    double dismissalRate = 0.0;
    double actionRate = 0.0;
};

struct TimeOfDayEngagement {
    int hour = 0;
    int totalSent = 0;
    int totalDelivered = 0;
    int totalOpened = 0;
    int totalDismissed = 0;
    int totalActionsTaken = 0;
    double deliveryRate = 0.0;
    double openRate = 0.0;
    double dismissalRate = 0.0;
    double actionRate = 0.0;
};

struct EngagementMetrics {
    double openRate = 0.0;
    double dismissalRate = 0.0;
    double actionRate = 0.0;
    double averageTimeToOpen = 0.0;
    double averageTimeToDismiss = 0.0;
    std::map<std::string, CategoryEngagement> engagementByCategory;
    std::map<int, TimeOfDayEngagement> engagementByTimeOfDay;
    TimePoint lastUpdated;
};

struct PerformanceInsight {
    std::string id;
    InsightType type = InsightType::LowDeliveryRate;
    InsightSeverity severity = InsightSeverity::Info;
    std::string title;
    std::string description;
    std::string recommendation;
    InsightImpact impact = InsightImpact::DeliveryOptimization;
};

struct AnalyticsExport {
    NotificationAnalytics analytics;
    DeliveryStatistics deliveryStats;
    EngagementMetrics engagementMetrics;
    std::vector<PerformanceInsight> performanceInsights;
    std::vector<NotificationEvent> events;
    std::vector<DeliveryRecord> deliveryRecords;
    std::vector<EngagementRecord> engagementRecords;
    TimePoint exportDate;
};

} // namespace nudge
