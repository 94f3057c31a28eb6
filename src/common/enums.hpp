#pragma once

namespace nudge {

enum class NotificationType {
    Welcome,
    Reminder,
    Achievement,
    Motivation,
    Educational,
    Social,
    System
};

enum class NotificationPriority {
    Low,
    Medium,
    High,
    Critical
};

enum class CampaignStatus {
    Draft,
    Active,
    Paused,
    Completed,
    Cancelled
};

enum class NotificationEventType {
    Sent,
    Delivered,
    Opened,
    Dismissed,
    ActionTaken,
    Failed
};

enum class DeliveryStatus {
    Sent,
    Delivered,
    Failed,
    Pending
};

enum class UserAction {
    Opened,
    Dismissed,
    ActionTaken
};

enum class NotificationActionType {
    View,
    Dismiss,
    Snooze,
    Reply,
    Custom
};

enum class AnalyticsTimeRange {
    Last24Hours,
    Last7Days,
    Last30Days,
    Last90Days
};

enum class InsightType {
    LowDeliveryRate,
    SlowDelivery,
    LowEngagement,
    HighDismissal,
    BestPerformingCategory,
    OptimalSendTime
};

enum class InsightSeverity {
    Info,
    Low,
    Medium,
    High,
    Critical
};

enum class InsightImpact {
    DeliveryOptimization,
    EngagementOptimization,
    ContentOptimization,
    TimingOptimization
};

} // namespace nudge
