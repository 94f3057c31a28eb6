#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace nudge {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

// Serializes without throwing on invalid UTF-8; bad bytes become U+FFFD.
inline std::string dumpJson(const nlohmann::json &doc, int indent = -1)
{
    return doc.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Enum <-> wire string. Unknown strings fall back to the first listed value.

inline std::string toNotificationTypeString(NotificationType type)
{
    switch (type) {
    case NotificationType::Welcome:
        return "welcome";
    case NotificationType::Reminder:
        return "reminder";
    case NotificationType::Achievement:
        return "achievement";
    case NotificationType::Motivation:
        return "motivation";
    case NotificationType::Educational:
        return "educational";
    case NotificationType::Social:
        return "social";
    case NotificationType::System:
        return "system";
    }
    return "system";
}

inline std::optional<NotificationType> parseNotificationTypeString(const std::string &value)
{
    if (value == "welcome") {
        return NotificationType::Welcome;
    }
    if (value == "reminder") {
        return NotificationType::Reminder;
    }
    if (value == "achievement") {
        return NotificationType::Achievement;
    }
    if (value == "motivation") {
        return NotificationType::Motivation;
    }
    if (value == "educational") {
        return NotificationType::Educational;
    }
    if (value == "social") {
        return NotificationType::Social;
    }
    if (value == "system") {
        return NotificationType::System;
    }
    return std::nullopt;
}

inline std::string toPriorityString(NotificationPriority priority)
{
    switch (priority) {
    case NotificationPriority::Low:
        return "low";
    case NotificationPriority::Medium:
        return "medium";
    case NotificationPriority::High:
        return "high";
    case NotificationPriority::Critical:
        return "critical";
    }
    return "medium";
}

inline NotificationPriority parsePriorityString(const std::string &value)
{
    if (value == "low") {
        return NotificationPriority::Low;
    }
    if (value == "high") {
        return NotificationPriority::High;
    }
    if (value == "critical") {
        return NotificationPriority::Critical;
    }
    return NotificationPriority::Medium;
}

inline std::string toCampaignStatusString(CampaignStatus status)
{
    switch (status) {
    case CampaignStatus::Draft:
        return "draft";
    case CampaignStatus::Active:
        return "active";
    case CampaignStatus::Paused:
        return "paused";
    case CampaignStatus::Completed:
        return "completed";
    case CampaignStatus::Cancelled:
        return "cancelled";
    }
    return "draft";
}

inline CampaignStatus parseCampaignStatusString(const std::string &value)
{
    if (value == "active") {
        return CampaignStatus::Active;
    }
    if (value == "paused") {
        return CampaignStatus::Paused;
    }
    if (value == "completed") {
        return CampaignStatus::Completed;
    }
    if (value == "cancelled") {
        return CampaignStatus::Cancelled;
    }
    return CampaignStatus::Draft;
}

inline std::string toEventTypeString(NotificationEventType type)
{
    switch (type) {
    case NotificationEventType::Sent:
        return "sent";
    case NotificationEventType::Delivered:
        return "delivered";
    case NotificationEventType::Opened:
        return "opened";
    case NotificationEventType::Dismissed:
        return "dismissed";
    case NotificationEventType::ActionTaken:
        return "actionTaken";
    case NotificationEventType::Failed:
        return "failed";
    }
    return "sent";
}

inline NotificationEventType parseEventTypeString(const std::string &value)
{
    if (value == "delivered") {
        return NotificationEventType::Delivered;
    }
    if (value == "opened") {
        return NotificationEventType::Opened;
    }
    if (value == "dismissed") {
        return NotificationEventType::Dismissed;
    }
    if (value == "actionTaken") {
        return NotificationEventType::ActionTaken;
    }
    if (value == "failed") {
        return NotificationEventType::Failed;
    }
    return NotificationEventType::Sent;
}

inline std::string toDeliveryStatusString(DeliveryStatus status)
{
    switch (status) {
    case DeliveryStatus::Sent:
        return "sent";
    case DeliveryStatus::Delivered:
        return "delivered";
    case DeliveryStatus::Failed:
        return "failed";
    case DeliveryStatus::Pending:
        return "pending";
    }
    return "sent";
}

inline DeliveryStatus parseDeliveryStatusString(const std::string &value)
{
    if (value == "delivered") {
        return DeliveryStatus::Delivered;
    }
    if (value == "failed") {
        return DeliveryStatus::Failed;
    }
    if (value == "pending") {
        return DeliveryStatus::Pending;
    }
    return DeliveryStatus::Sent;
}

inline std::string toUserActionString(UserAction action)
{
    switch (action) {
    case UserAction::Opened:
        return "opened";
    case UserAction::Dismissed:
        return "dismissed";
    case UserAction::ActionTaken:
        return "actionTaken";
    }
    return "opened";
}

inline UserAction parseUserActionString(const std::string &value)
{
    if (value == "dismissed") {
        return UserAction::Dismissed;
    }
    if (value == "actionTaken") {
        return UserAction::ActionTaken;
    }
    return UserAction::Opened;
}

inline std::string toActionTypeString(NotificationActionType type)
{
    switch (type) {
    case NotificationActionType::View:
        return "view";
    case NotificationActionType::Dismiss:
        return "dismiss";
    case NotificationActionType::Snooze:
        return "snooze";
    case NotificationActionType::Reply:
        return "reply";
    case NotificationActionType::Custom:
        return "custom";
    }
    return "custom";
}

inline NotificationActionType parseActionTypeString(const std::string &value)
{
    if (value == "view") {
        return NotificationActionType::View;
    }
    if (value == "dismiss") {
        return NotificationActionType::Dismiss;
    }
    if (value == "snooze") {
        return NotificationActionType::Snooze;
    }
    if (value == "reply") {
        return NotificationActionType::Reply;
    }
    return NotificationActionType::Custom;
}

inline std::string toTimeRangeString(AnalyticsTimeRange range)
{
    switch (range) {
    case AnalyticsTimeRange::Last24Hours:
        return "last24Hours";
    case AnalyticsTimeRange::Last7Days:
        return "last7Days";
    case AnalyticsTimeRange::Last30Days:
        return "last30Days";
    case AnalyticsTimeRange::Last90Days:
        return "last90Days";
    }
    return "last30Days";
}

inline AnalyticsTimeRange parseTimeRangeString(const std::string &value)
{
    if (value == "last24Hours") {
        return AnalyticsTimeRange::Last24Hours;
    }
    if (value == "last7Days") {
        return AnalyticsTimeRange::Last7Days;
    }
    if (value == "last90Days") {
        return AnalyticsTimeRange::Last90Days;
    }
    return AnalyticsTimeRange::Last30Days;
}

inline std::string toInsightTypeString(InsightType type)
{
    switch (type) {
    case InsightType::LowDeliveryRate:
        return "lowDeliveryRate";
    case InsightType::SlowDelivery:
        return "slowDelivery";
    case InsightType::LowEngagement:
        return "lowEngagement";
    case InsightType::HighDismissal:
        return "highDismissal";
    case InsightType::BestPerformingCategory:
        return "bestPerformingCategory";
    case InsightType::OptimalSendTime:
        return "optimalSendTime";
    }
    return "lowDeliveryRate";
}

inline InsightType parseInsightTypeString(const std::string &value)
{
    if (value == "slowDelivery") {
        return InsightType::SlowDelivery;
    }
    if (value == "lowEngagement") {
        return InsightType::LowEngagement;
    }
    if (value == "highDismissal") {
        return InsightType::HighDismissal;
    }
    if (value == "bestPerformingCategory") {
        return InsightType::BestPerformingCategory;
    }
    if (value == "optimalSendTime") {
        return InsightType::OptimalSendTime;
    }
    return InsightType::LowDeliveryRate;
}

inline std::string toInsightSeverityString(InsightSeverity severity)
{
    switch (severity) {
    case InsightSeverity::Info:
        return "info";
    case InsightSeverity::Low:
        return "low";
    case InsightSeverity::Medium:
        return "medium";
    case InsightSeverity::High:
        return "high";
    case InsightSeverity::Critical:
        return "critical";
    }
    return "info";
}

inline InsightSeverity parseInsightSeverityString(const std::string &value)
{
    if (value == "low") {
        return InsightSeverity::Low;
    }
    if (value == "medium") {
        return InsightSeverity::Medium;
    }
    if (value == "high") {
        return InsightSeverity::High;
    }
    if (value == "critical") {
        return InsightSeverity::Critical;
    }
    return InsightSeverity::Info;
}

inline std::string toInsightImpactString(InsightImpact impact)
{
    switch (impact) {
    case InsightImpact::DeliveryOptimization:
        return "deliveryOptimization";
    case InsightImpact::EngagementOptimization:
        return "engagementOptimization";
    case InsightImpact::ContentOptimization:
        return "contentOptimization";
    case InsightImpact::TimingOptimization:
        return "timingOptimization";
    }
    return "deliveryOptimization";
}

inline InsightImpact parseInsightImpactString(const std::string &value)
{
    if (value == "engagementOptimization") {
        return InsightImpact::EngagementOptimization;
    }
    if (value == "contentOptimization") {
        return InsightImpact::ContentOptimization;
    }
    if (value == "timingOptimization") {
        return InsightImpact::TimingOptimization;
    }
    return InsightImpact::DeliveryOptimization;
}

// Optional fields are omitted when empty and decode to nullopt when missing
// or null.

inline void putOptional(nlohmann::json &j, const char *key,
                        const std::optional<std::string> &value)
{
    if (value.has_value()) {
        j[key] = *value;
    }
}

inline void putOptional(nlohmann::json &j, const char *key,
                        const std::optional<double> &value)
{
    if (value.has_value()) {
        j[key] = *value;
    }
}

inline void putOptional(nlohmann::json &j, const char *key,
                        const std::optional<TimePoint> &value)
{
    if (value.has_value()) {
        j[key] = toIso8601Utc(*value);
    }
}

inline std::optional<std::string> optionalString(const nlohmann::json &j, const char *key)
{
    if (j.contains(key) && j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    return std::nullopt;
}

inline std::optional<double> optionalDouble(const nlohmann::json &j, const char *key)
{
    if (j.contains(key) && j.at(key).is_number()) {
        return j.at(key).get<double>();
    }
    return std::nullopt;
}

inline std::optional<TimePoint> optionalTimePoint(const nlohmann::json &j, const char *key)
{
    if (j.contains(key) && j.at(key).is_string()) {
        return fromIso8601Utc(j.at(key).get<std::string>());
    }
    return std::nullopt;
}

inline std::vector<std::string> stringList(const nlohmann::json &j, const char *key)
{
    if (j.contains(key) && j.at(key).is_array()) {
        std::vector<std::string> values;
        for (const auto &item : j.at(key)) {
            if (item.is_string()) {
                values.push_back(item.get<std::string>());
            }
        }
        return values;
    }
    return {};
}

inline void to_json(nlohmann::json &j, const NotificationType &type)
{
    j = toNotificationTypeString(type);
}

inline void from_json(const nlohmann::json &j, NotificationType &type)
{
    type = NotificationType::System;
    if (j.is_string()) {
        if (const auto parsed = parseNotificationTypeString(j.get<std::string>())) {
            type = *parsed;
        }
    }
}

inline void to_json(nlohmann::json &j, const NotificationTemplate &tmpl)
{
    j = nlohmann::json{
        {"id", tmpl.id},
        {"type", tmpl.type},
        {"title", tmpl.title},
        {"body", tmpl.body},
        {"category", tmpl.category},
        {"priority", toPriorityString(tmpl.priority)},
        {"tags", tmpl.tags},
        {"personalizationFields", tmpl.personalizationFields}
    };
    putOptional(j, "subtitle", tmpl.subtitle);
    putOptional(j, "soundName", tmpl.soundName);
    if (tmpl.badgeCount.has_value()) {
        j["badgeCount"] = *tmpl.badgeCount;
    }
}

inline void from_json(const nlohmann::json &j, NotificationTemplate &tmpl)
{
    tmpl.id = j.value("id", "");
    if (j.contains("type")) {
        tmpl.type = j.at("type").get<NotificationType>();
    } else {
        tmpl.type = NotificationType::System;
    }
    tmpl.title = j.value("title", "");
    tmpl.body = j.value("body", "");
    tmpl.category = j.value("category", "GENERAL");
    tmpl.priority = parsePriorityString(j.value("priority", "medium"));
    tmpl.tags = stringList(j, "tags");
    tmpl.personalizationFields = stringList(j, "personalizationFields");
    tmpl.subtitle = optionalString(j, "subtitle");
    tmpl.soundName = optionalString(j, "soundName");
    if (j.contains("badgeCount") && j.at("badgeCount").is_number_integer()) {
        tmpl.badgeCount = j.at("badgeCount").get<int>();
    } else {
        tmpl.badgeCount.reset();
    }
}

inline void to_json(nlohmann::json &j, const ScheduleItem &item)
{
    j = nlohmann::json{
        {"templateId", item.templateId},
        {"offsetDays", item.offsetDays},
        {"personalizationData", item.personalizationData}
    };
    putOptional(j, "preferredTime", item.preferredTime);
}

inline void from_json(const nlohmann::json &j, ScheduleItem &item)
{
    item.templateId = j.value("templateId", "");
    item.offsetDays = j.value("offsetDays", 0);
    item.preferredTime = optionalString(j, "preferredTime");
    item.personalizationData.clear();
    if (j.contains("personalizationData") && j.at("personalizationData").is_object()) {
        for (const auto &entry : j.at("personalizationData").items()) {
            if (entry.value().is_string()) {
                item.personalizationData[entry.key()] = entry.value().get<std::string>();
            }
        }
    }
}

inline void to_json(nlohmann::json &j, const Campaign &campaign)
{
    j = nlohmann::json{
        {"id", campaign.id},
        {"name", campaign.name},
        {"description", campaign.description},
        {"startDate", toIso8601Utc(campaign.startDate)},
        {"endDate", toIso8601Utc(campaign.endDate)},
        {"schedule", campaign.schedule},
        {"status", toCampaignStatusString(campaign.status)},
        {"scheduledNotificationIds", campaign.scheduledNotificationIds},
        {"targetAudience", campaign.targetAudience}
    };
}

inline void from_json(const nlohmann::json &j, Campaign &campaign)
{
    campaign.id = j.value("id", "");
    campaign.name = j.value("name", "");
    campaign.description = j.value("description", "");
    campaign.startDate = fromIso8601Utc(j.value("startDate", ""));
    campaign.endDate = fromIso8601Utc(j.value("endDate", ""));
    if (j.contains("schedule") && j.at("schedule").is_array()) {
        campaign.schedule = j.at("schedule").get<std::vector<ScheduleItem>>();
    } else {
        campaign.schedule.clear();
    }
    campaign.status = parseCampaignStatusString(j.value("status", "draft"));
    campaign.scheduledNotificationIds = stringList(j, "scheduledNotificationIds");
    campaign.targetAudience = stringList(j, "targetAudience");
}

inline void to_json(nlohmann::json &j, const PersonalizationProfile &profile)
{
    j = nlohmann::json{
        {"preferredReminderTime", profile.preferredReminderTime},
        {"preferredSessionDuration", profile.preferredSessionDuration},
        {"interests", profile.interests},
        {"completedSessions", profile.completedSessions},
        {"currentStreak", profile.currentStreak},
        {"timezone", profile.timezone},
        {"lastActiveDate", toIso8601Utc(profile.lastActiveDate)}
    };
    putOptional(j, "userName", profile.userName);
}

inline void from_json(const nlohmann::json &j, PersonalizationProfile &profile)
{
    profile.userName = optionalString(j, "userName");
    profile.preferredReminderTime = j.value("preferredReminderTime", "09:00");
    profile.preferredSessionDuration = j.value("preferredSessionDuration", 10);
    profile.interests = stringList(j, "interests");
    profile.completedSessions = j.value("completedSessions", 0);
    profile.currentStreak = j.value("currentStreak", 0);
    profile.timezone = j.value("timezone", "");
    profile.lastActiveDate = fromIso8601Utc(j.value("lastActiveDate", ""));
}

inline void to_json(nlohmann::json &j, const NotificationRequest &request)
{
    j = nlohmann::json{
        {"id", request.id},
        {"title", request.title},
        {"body", request.body},
        {"category", request.category},
        {"deliverAt", toIso8601Utc(request.deliverAt)}
    };
    putOptional(j, "subtitle", request.subtitle);
}

inline void from_json(const nlohmann::json &j, NotificationRequest &request)
{
    request.id = j.value("id", "");
    request.title = j.value("title", "");
    request.body = j.value("body", "");
    request.subtitle = optionalString(j, "subtitle");
    request.category = j.value("category", "");
    request.deliverAt = fromIso8601Utc(j.value("deliverAt", ""));
}

inline void to_json(nlohmann::json &j, const DeliveryMetrics &metrics)
{
    j = nlohmann::json{
        {"totalSent", metrics.totalSent},
        {"totalDelivered", metrics.totalDelivered},
        {"totalPending", metrics.totalPending},
        {"deliveryRate", metrics.deliveryRate},
        {"lastUpdated", toIso8601Utc(metrics.lastUpdated)}
    };
}

inline void from_json(const nlohmann::json &j, DeliveryMetrics &metrics)
{
    metrics.totalSent = j.value("totalSent", 0);
    metrics.totalDelivered = j.value("totalDelivered", 0);
    metrics.totalPending = j.value("totalPending", 0);
    metrics.deliveryRate = j.value("deliveryRate", 0.0);
    metrics.lastUpdated = fromIso8601Utc(j.value("lastUpdated", ""));
}

inline void to_json(nlohmann::json &j, const NotificationEvent &event)
{
    j = nlohmann::json{
        {"id", event.id},
        {"notificationId", event.notificationId},
        {"type", toEventTypeString(event.type)},
        {"timestamp", toIso8601Utc(event.timestamp)}
    };
    putOptional(j, "category", event.category);
    if (event.notificationType.has_value()) {
        j["notificationType"] = *event.notificationType;
    }
    putOptional(j, "deliveryTime", event.deliveryTime);
    putOptional(j, "timeToOpen", event.timeToOpen);
    putOptional(j, "timeToDismiss", event.timeToDismiss);
    putOptional(j, "actionId", event.actionId);
    if (event.actionType.has_value()) {
        j["actionType"] = toActionTypeString(*event.actionType);
    }
    putOptional(j, "errorMessage", event.errorMessage);
    if (event.isPersonalized.has_value()) {
        j["isPersonalized"] = *event.isPersonalized;
    }
}

inline void from_json(const nlohmann::json &j, NotificationEvent &event)
{
    event.id = j.value("id", "");
    event.notificationId = j.value("notificationId", "");
    event.type = parseEventTypeString(j.value("type", "sent"));
    event.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    event.category = optionalString(j, "category");
    event.notificationType.reset();
    if (const auto typeName = optionalString(j, "notificationType")) {
        event.notificationType = parseNotificationTypeString(*typeName);
    }
    event.deliveryTime = optionalDouble(j, "deliveryTime");
    event.timeToOpen = optionalDouble(j, "timeToOpen");
    event.timeToDismiss = optionalDouble(j, "timeToDismiss");
    event.actionId = optionalString(j, "actionId");
    event.actionType.reset();
    if (const auto actionType = optionalString(j, "actionType")) {
        event.actionType = parseActionTypeString(*actionType);
    }
    event.errorMessage = optionalString(j, "errorMessage");
    if (j.contains("isPersonalized") && j.at("isPersonalized").is_boolean()) {
        event.isPersonalized = j.at("isPersonalized").get<bool>();
    } else {
        event.isPersonalized.reset();
    }
}

inline void to_json(nlohmann::json &j, const DeliveryRecord &record)
{
    j = nlohmann::json{
        {"notificationId", record.notificationId},
        {"sentAt", toIso8601Utc(record.sentAt)},
        {"deliveryStatus", toDeliveryStatusString(record.deliveryStatus)},
        {"attemptCount", record.attemptCount}
    };
    putOptional(j, "deliveredAt", record.deliveredAt);
    putOptional(j, "deliveryTime", record.deliveryTime);
    putOptional(j, "errorMessage", record.errorMessage);
}

inline void from_json(const nlohmann::json &j, DeliveryRecord &record)
{
    record.notificationId = j.value("notificationId", "");
    record.sentAt = fromIso8601Utc(j.value("sentAt", ""));
    record.deliveredAt = optionalTimePoint(j, "deliveredAt");
    record.deliveryStatus = parseDeliveryStatusString(j.value("deliveryStatus", "sent"));
    record.attemptCount = j.value("attemptCount", 1);
    record.deliveryTime = optionalDouble(j, "deliveryTime");
    record.errorMessage = optionalString(j, "errorMessage");
}

inline void to_json(nlohmann::json &j, const EngagementRecord &record)
{
    j = nlohmann::json{
        {"notificationId", record.notificationId},
        {"actionTaken", toUserActionString(record.actionTaken)}
    };
    putOptional(j, "openedAt", record.openedAt);
    putOptional(j, "dismissedAt", record.dismissedAt);
    putOptional(j, "actionTakenAt", record.actionTakenAt);
    putOptional(j, "timeToOpen", record.timeToOpen);
    putOptional(j, "timeToDismiss", record.timeToDismiss);
    putOptional(j, "actionId", record.actionId);
    if (record.actionType.has_value()) {
        j["actionType"] = toActionTypeString(*record.actionType);
    }
}

inline void from_json(const nlohmann::json &j, EngagementRecord &record)
{
    record.notificationId = j.value("notificationId", "");
    record.actionTaken = parseUserActionString(j.value("actionTaken", "opened"));
    record.openedAt = optionalTimePoint(j, "openedAt");
    record.dismissedAt = optionalTimePoint(j, "dismissedAt");
    record.actionTakenAt = optionalTimePoint(j, "actionTakenAt");
    record.timeToOpen = optionalDouble(j, "timeToOpen");
    record.timeToDismiss = optionalDouble(j, "timeToDismiss");
    record.actionId = optionalString(j, "actionId");
    record.actionType.reset();
    if (const auto actionType = optionalString(j, "actionType")) {
        record.actionType = parseActionTypeString(*actionType);
    }
}

inline void to_json(nlohmann::json &j, const NotificationAnalytics &analytics)
{
    j = nlohmann::json{
        {"totalNotificationsSent", analytics.totalNotificationsSent},
        {"totalDelivered", analytics.totalDelivered},
        {"totalOpened", analytics.totalOpened},
        {"totalFailed", analytics.totalFailed},
        {"averageDeliveryTime", analytics.averageDeliveryTime},
        {"averageOpenRate", analytics.averageOpenRate},
        {"lastUpdated", toIso8601Utc(analytics.lastUpdated)},
        {"timeRange", toTimeRangeString(analytics.timeRange)}
    };
}

inline void from_json(const nlohmann::json &j, NotificationAnalytics &analytics)
{
    analytics.totalNotificationsSent = j.value("totalNotificationsSent", 0);
    analytics.totalDelivered = j.value("totalDelivered", 0);
    analytics.totalOpened = j.value("totalOpened", 0);
    analytics.totalFailed = j.value("totalFailed", 0);
    analytics.averageDeliveryTime = j.value("averageDeliveryTime", 0.0);
    analytics.averageOpenRate = j.value("averageOpenRate", 0.0);
    analytics.lastUpdated = fromIso8601Utc(j.value("lastUpdated", ""));
    analytics.timeRange = parseTimeRangeString(j.value("timeRange", "last30Days"));
}

inline void to_json(nlohmann::json &j, const DeliveryStatistics &stats)
{
    j = nlohmann::json{
        {"totalSent", stats.totalSent},
        {"totalDelivered", stats.totalDelivered},
        {"totalFailed", stats.totalFailed},
        {"totalPending", stats.totalPending},
        {"deliveryRate", stats.deliveryRate},
        {"failureRate", stats.failureRate},
        {"averageDeliveryTime", stats.averageDeliveryTime},
        {"p95DeliveryTime", stats.p95DeliveryTime},
        {"lastUpdated", toIso8601Utc(stats.lastUpdated)}
    };
}

inline void from_json(const nlohmann::json &j, DeliveryStatistics &stats)
{
    stats.totalSent = j.value("totalSent", 0);
    stats.totalDelivered = j.value("totalDelivered", 0);
    stats.totalFailed = j.value("totalFailed", 0);
    stats.totalPending = j.value("totalPending", 0);
    stats.deliveryRate = j.value("deliveryRate", 0.0);
    stats.failureRate = j.value("failureRate", 0.0);
    stats.averageDeliveryTime = j.value("averageDeliveryTime", 0.0);
    stats.p95DeliveryTime = j.value("p95DeliveryTime", 0.0);
    stats.lastUpdated = fromIso8601Utc(j.value("lastUpdated", ""));
}

inline void to_json(nlohmann::json &j, const CategoryEngagement &engagement)
{
    j = nlohmann::json{
        {"totalSent", engagement.totalSent},
        {"totalDelivered", engagement.totalDelivered},
        {"totalOpened", engagement.totalOpened},
        {"totalDismissed", engagement.totalDismissed},
        {"totalActionsTaken", engagement.totalActionsTaken},
        {"deliveryRate", engagement.deliveryRate},
        {"openRate", engagement.openRate},
        {"dismissalRate", engagement.dismissalRate},
        {"actionRate", engagement.actionRate}
    };
}

inline void from_json(const nlohmann::json &j, CategoryEngagement &engagement)
{
    engagement.totalSent = j.value("totalSent", 0);
    engagement.totalDelivered = j.value("totalDelivered", 0);
    engagement.totalOpened = j.value("totalOpened", 0);
    engagement.totalDismissed = j.value("totalDismissed", 0);
    engagement.totalActionsTaken = j.value("totalActionsTaken", 0);
    engagement.deliveryRate = j.value("deliveryRate", 0.0);
    engagement.openRate = j.value("openRate", 0.0);
    engagement.dismissalRate = j.value("dismissalRate", 0.0);
    engagement.actionRate = j.value("actionRate", 0.0);
}

inline void to_json(nlohmann::json &j, const TimeOfDayEngagement &engagement)
{
    j = nlohmann::json{
        {"hour", engagement.hour},
        {"totalSent", engagement.totalSent},
        {"totalDelivered", engagement.totalDelivered},
        {"totalOpened", engagement.totalOpened},
        {"totalDismissed", engagement.totalDismissed},
        {"totalActionsTaken", engagement.totalActionsTaken},
        {"deliveryRate", engagement.deliveryRate},
        {"openRate", engagement.openRate},
        {"dismissalRate", engagement.dismissalRate},
        {"actionRate", engagement.actionRate}
    };
}

inline void from_json(const nlohmann::json &j, TimeOfDayEngagement &engagement)
{
    engagement.hour = j.value("hour", 0);
    engagement.totalSent = j.value("totalSent", 0);
    engagement.totalDelivered = j.value("totalDelivered", 0);
    engagement.totalOpened = j.value("totalOpened", 0);
    engagement.totalDismissed = j.value("totalDismissed", 0);
    engagement.totalActionsTaken = j.value("totalActionsTaken", 0);
    engagement.deliveryRate = j.value("deliveryRate", 0.0);
    engagement.openRate = j.value("openRate", 0.0);
    engagement.dismissalRate = j.value("dismissalRate", 0.0);
    engagement.actionRate = j.value("actionRate", 0.0);
}

inline void to_json(nlohmann::json &j, const EngagementMetrics &metrics)
{
    nlohmann::json byHour = nlohmann::json::object();
    for (const auto &entry : metrics.engagementByTimeOfDay) {
        byHour[std::to_string(entry.first)] = entry.second;
    }
    j = nlohmann::json{
        {"openRate", metrics.openRate},
        {"dismissalRate", metrics.dismissalRate},
        {"actionRate", metrics.actionRate},
        {"averageTimeToOpen", metrics.averageTimeToOpen},
        {"averageTimeToDismiss", metrics.averageTimeToDismiss},
        {"engagementByCategory", metrics.engagementByCategory},
        {"engagementByTimeOfDay", byHour},
        {"lastUpdated", toIso8601Utc(metrics.lastUpdated)}
    };
}

inline void from_json(const nlohmann::json &j, EngagementMetrics &metrics)
{
    metrics.openRate = j.value("openRate", 0.0);
    metrics.dismissalRate = j.value("dismissalRate", 0.0);
    metrics.actionRate = j.value("actionRate", 0.0);
    metrics.averageTimeToOpen = j.value("averageTimeToOpen", 0.0);
    metrics.averageTimeToDismiss = j.value("averageTimeToDismiss", 0.0);
    metrics.engagementByCategory.clear();
    if (j.contains("engagementByCategory") && j.at("engagementByCategory").is_object()) {
        for (const auto &entry : j.at("engagementByCategory").items()) {
            metrics.engagementByCategory[entry.key()] = entry.value().get<CategoryEngagement>();
        }
    }
    metrics.engagementByTimeOfDay.clear();
    if (j.contains("engagementByTimeOfDay") && j.at("engagementByTimeOfDay").is_object()) {
        for (const auto &entry : j.at("engagementByTimeOfDay").items()) {
            const auto hourly = entry.value().get<TimeOfDayEngagement>();
            metrics.engagementByTimeOfDay[hourly.hour] = hourly;
        }
    }
    metrics.lastUpdated = fromIso8601Utc(j.value("lastUpdated", ""));
}

inline void to_json(nlohmann::json &j, const PerformanceInsight &insight)
{
    j = nlohmann::json{
        {"id", insight.id},
        {"type", toInsightTypeString(insight.type)},
        {"severity", toInsightSeverityString(insight.severity)},
        {"title", insight.title},
        {"description", insight.description},
        {"recommendation", insight.recommendation},
        {"impact", toInsightImpactString(insight.impact)}
    };
}

inline void from_json(const nlohmann::json &j, PerformanceInsight &insight)
{
    insight.id = j.value("id", "");
    insight.type = parseInsightTypeString(j.value("type", "lowDeliveryRate"));
    insight.severity = parseInsightSeverityString(j.value("severity", "info"));
    insight.title = j.value("title", "");
    insight.description = j.value("description", "");
    insight.recommendation = j.value("recommendation", "");
    insight.impact = parseInsightImpactString(j.value("impact", "deliveryOptimization"));
}

inline void to_json(nlohmann::json &j, const AnalyticsExport &data)
{
    j = nlohmann::json{
        {"analytics", data.analytics},
        {"deliveryStats", data.deliveryStats},
        {"engagementMetrics", data.engagementMetrics},
        {"performanceInsights", data.performanceInsights},
        {"events", data.events},
        {"deliveryRecords", data.deliveryRecords},
        {"engagementRecords", data.engagementRecords},
        {"exportDate", toIso8601Utc(data.exportDate)}
    };
}

} // namespace nudge
