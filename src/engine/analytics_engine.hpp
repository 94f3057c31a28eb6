#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <QObject>

#include "common/models.hpp"
#include "common/time_utils.hpp"
#include "engine/engine_config.hpp"
#include "engine/nudge_store.hpp"

class QTimer;

namespace nudge {

/**
 * AnalyticsEngine ingests notification lifecycle events and keeps three
 * collections:
 * - the event log, capped at EngineConfig::maxEventsHistory (oldest dropped)
 * - one DeliveryRecord per notification id, upserted
 * - engagement records, append-only
 *
 * recomputeAnalytics() derives the summary, delivery statistics, engagement
 * metrics and insights from those collections. Ingestion and recompute are
 * serialized by one mutex so the periodic timer never races a track call.
 */
class AnalyticsEngine : public QObject
{
    Q_OBJECT
public:
    AnalyticsEngine(NudgeStore &store,
                    const EngineConfig &config,
                    Clock clock = systemClock(),
                    QObject *parent = nullptr);
    ~AnalyticsEngine() override;

    void trackSent(const std::string &notificationId,
                   NotificationType type,
                   const std::string &category,
                   bool isPersonalized);
    // No-op on the record if trackSent was never seen for the id.
    void trackDelivered(const std::string &notificationId, double deliveryTime);
    void trackOpened(const std::string &notificationId, double timeToOpen);
    void trackDismissed(const std::string &notificationId, double timeToDismiss);
    void trackActionTaken(const std::string &notificationId,
                          const std::string &actionId,
                          NotificationActionType actionType);
    void trackFailed(const std::string &notificationId, const std::string &error);

    AnalyticsExport exportAnalyticsData();

    std::vector<NotificationEvent> events() const;
    std::vector<DeliveryRecord> deliveryRecords() const;
    std::vector<EngagementRecord> engagementRecords() const;
    std::optional<NotificationAnalytics> analytics() const;
    std::optional<DeliveryStatistics> deliveryStatistics() const;
    std::optional<EngagementMetrics> engagementMetrics() const;
    std::vector<PerformanceInsight> performanceInsights() const;

    // Starts the periodic recompute timer; stop() halts it.
    void start();
    void stop();
    bool isRunning() const;

public slots:
    void recomputeAnalytics();

signals:
    void recordsChanged();
    void analyticsUpdated();

private:
    struct Attribution {
        std::optional<std::string> category;
        std::optional<NotificationType> notificationType;
    };

    Attribution attributionFor(const std::string &notificationId) const;
    NotificationEvent makeEvent(const std::string &notificationId,
                                NotificationEventType type,
                                TimePoint now) const;

    void recordEvent(NotificationEvent event);
    void recordEngagement(EngagementRecord record);
    void recomputeLocked();

    void loadStoredData();
    void saveEvents();
    void saveDeliveryRecords();
    void saveEngagementRecords();
    void saveDerived();

    NudgeStore &m_store;
    EngineConfig m_config;
    Clock m_clock;
    QTimer *m_timer = nullptr;

    mutable std::mutex m_mutex;
    std::vector<NotificationEvent> m_events;
    std::vector<DeliveryRecord> m_deliveryRecords;
    std::vector<EngagementRecord> m_engagementRecords;

    std::optional<NotificationAnalytics> m_analytics;
    std::optional<DeliveryStatistics> m_deliveryStats;
    std::optional<EngagementMetrics> m_engagementMetrics;
    std::vector<PerformanceInsight> m_insights;
};

} // namespace nudge
