#include "engine/analytics_engine.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

#include <QTimer>

#include "common/id_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/analytics_calculator.hpp"

#include <nlohmann/json.hpp>

namespace nudge {

namespace {

const QString kComponent = QStringLiteral("AnalyticsEngine");

} // namespace

AnalyticsEngine::AnalyticsEngine(NudgeStore &store,
                                 const EngineConfig &config,
                                 Clock clock,
                                 QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_config(config)
    , m_clock(std::move(clock))
{
    loadStoredData();
}

AnalyticsEngine::~AnalyticsEngine() = default;

void AnalyticsEngine::start()
{
    if (!m_timer) {
        m_timer = new QTimer(this);
        connect(m_timer, &QTimer::timeout, this, &AnalyticsEngine::recomputeAnalytics);
    }
    m_timer->setInterval(m_config.analyticsIntervalMs);
    m_timer->start();

    NLOG_INFO(kComponent,
              QStringLiteral("start"),
              QStringLiteral("analytics_timer_started"),
              QStringLiteral("start_call"),
              QStringLiteral("qtimer"),
              nudge::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"intervalMs", m_config.analyticsIntervalMs}}));

    recomputeAnalytics();
}

void AnalyticsEngine::stop()
{
    if (m_timer) {
        m_timer->stop();
    }
}

bool AnalyticsEngine::isRunning() const
{
    return m_timer && m_timer->isActive();
}

AnalyticsEngine::Attribution AnalyticsEngine::attributionFor(
    const std::string &notificationId) const
{
    for (auto it = m_events.rbegin(); it != m_events.rend(); ++it) {
        if (it->notificationId == notificationId && it->type == NotificationEventType::Sent) {
            return Attribution{it->category, it->notificationType};
        }
    }
    return Attribution{};
}

NotificationEvent AnalyticsEngine::makeEvent(const std::string &notificationId,
                                             NotificationEventType type,
                                             TimePoint now) const
{
    const Attribution attribution = attributionFor(notificationId);

    NotificationEvent event;
    event.id = generateUuid();
    event.notificationId = notificationId;
    event.type = type;
    event.category = attribution.category;
    event.notificationType = attribution.notificationType;
    event.timestamp = now;
    return event;
}

void AnalyticsEngine::recordEvent(NotificationEvent event)
{
    m_events.push_back(std::move(event));
    if (m_events.size() > m_config.maxEventsHistory) {
        const auto excess = m_events.size() - m_config.maxEventsHistory;
        m_events.erase(m_events.begin(), m_events.begin() + static_cast<std::ptrdiff_t>(excess));
    }
    saveEvents();
}

void AnalyticsEngine::recordEngagement(EngagementRecord record)
{
    m_engagementRecords.push_back(std::move(record));
    saveEngagementRecords();
}

void AnalyticsEngine::trackSent(const std::string &notificationId,
                                NotificationType type,
                                const std::string &category,
                                bool isPersonalized)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto now = m_clock();

        NotificationEvent event;
        event.id = generateUuid();
        event.notificationId = notificationId;
        event.type = NotificationEventType::Sent;
        event.category = category;
        event.notificationType = type;
        event.timestamp = now;
        event.isPersonalized = isPersonalized;
        recordEvent(std::move(event));

        DeliveryRecord record;
        record.notificationId = notificationId;
        record.sentAt = now;
        record.deliveryStatus = DeliveryStatus::Sent;
        record.attemptCount = 1;

        auto existing = std::find_if(m_deliveryRecords.begin(), m_deliveryRecords.end(),
                                     [&notificationId](const DeliveryRecord &r) {
                                         return r.notificationId == notificationId;
                                     });
        if (existing != m_deliveryRecords.end()) {
            *existing = record;
        } else {
            m_deliveryRecords.push_back(record);
        }
        saveDeliveryRecords();
    }

    NLOG_DEBUG(kComponent,
               QStringLiteral("trackSent"),
               QStringLiteral("notification_sent_tracked"),
               QStringLiteral("track_call"),
               QStringLiteral("append_event"),
               nudge::logging::defaultWho(),
               nudge::logging::currentCorrelationId(),
               (nlohmann::json{{"notificationId", notificationId},
                               {"category", category},
                               {"type", toNotificationTypeString(type)}}));
    emit recordsChanged();
}

void AnalyticsEngine::trackDelivered(const std::string &notificationId, double deliveryTime)
{
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto now = m_clock();

        NotificationEvent event = makeEvent(notificationId, NotificationEventType::Delivered, now);
        event.deliveryTime = deliveryTime;
        recordEvent(std::move(event));

        for (auto &record : m_deliveryRecords) {
            if (record.notificationId == notificationId) {
                record.deliveryStatus = DeliveryStatus::Delivered;
                record.deliveredAt = now;
                record.deliveryTime = deliveryTime;
                found = true;
                break;
            }
        }
        if (found) {
            saveDeliveryRecords();
        }
    }

    if (!found) {
        NLOG_DEBUG(kComponent,
                   QStringLiteral("trackDelivered"),
                   QStringLiteral("delivery_record_missing"),
                   QStringLiteral("unknown_notification_id"),
                   QStringLiteral("event_only"),
                   nudge::logging::defaultWho(),
                   nudge::logging::currentCorrelationId(),
                   (nlohmann::json{{"notificationId", notificationId}}));
    }
    emit recordsChanged();
}

void AnalyticsEngine::trackOpened(const std::string &notificationId, double timeToOpen)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto now = m_clock();

        NotificationEvent event = makeEvent(notificationId, NotificationEventType::Opened, now);
        event.timeToOpen = timeToOpen;
        recordEvent(std::move(event));

        EngagementRecord record;
        record.notificationId = notificationId;
        record.openedAt = now;
        record.timeToOpen = timeToOpen;
        record.actionTaken = UserAction::Opened;
        recordEngagement(std::move(record));
    }
    emit recordsChanged();
}

void AnalyticsEngine::trackDismissed(const std::string &notificationId, double timeToDismiss)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto now = m_clock();

        NotificationEvent event = makeEvent(notificationId, NotificationEventType::Dismissed, now);
        event.timeToDismiss = timeToDismiss;
        recordEvent(std::move(event));

        EngagementRecord record;
        record.notificationId = notificationId;
        record.dismissedAt = now;
        record.timeToDismiss = timeToDismiss;
        record.actionTaken = UserAction::Dismissed;
        recordEngagement(std::move(record));
    }
    emit recordsChanged();
}

void AnalyticsEngine::trackActionTaken(const std::string &notificationId,
                                       const std::string &actionId,
                                       NotificationActionType actionType)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto now = m_clock();

        NotificationEvent event = makeEvent(notificationId, NotificationEventType::ActionTaken, now);
        event.actionId = actionId;
        event.actionType = actionType;
        recordEvent(std::move(event));

        EngagementRecord record;
        record.notificationId = notificationId;
        record.actionTakenAt = now;
        record.actionId = actionId;
        record.actionType = actionType;
        record.actionTaken = UserAction::ActionTaken;
        recordEngagement(std::move(record));
    }
    emit recordsChanged();
}

void AnalyticsEngine::trackFailed(const std::string &notificationId, const std::string &error)
{
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto now = m_clock();

        NotificationEvent event = makeEvent(notificationId, NotificationEventType::Failed, now);
        event.errorMessage = error;
        recordEvent(std::move(event));

        for (auto &record : m_deliveryRecords) {
            if (record.notificationId == notificationId) {
                record.deliveryStatus = DeliveryStatus::Failed;
                record.attemptCount += 1;
                record.errorMessage = error;
                record.deliveredAt.reset();
                record.deliveryTime.reset();
                found = true;
                break;
            }
        }
        if (found) {
            saveDeliveryRecords();
        }
    }

    NLOG_WARN(kComponent,
              QStringLiteral("trackFailed"),
              QStringLiteral("notification_failed"),
              QStringLiteral("delivery_error"),
              found ? QStringLiteral("record_updated") : QStringLiteral("event_only"),
              nudge::logging::defaultWho(),
              nudge::logging::currentCorrelationId(),
              (nlohmann::json{{"notificationId", notificationId}, {"error", error}}));
    emit recordsChanged();
}

void AnalyticsEngine::recomputeLocked()
{
    const auto now = m_clock();

    DeliveryStatistics stats = computeDeliveryStatistics(m_deliveryRecords, now);
    EngagementMetrics metrics =
        computeEngagementMetrics(m_deliveryRecords, m_engagementRecords, m_events, now);
    m_insights = generatePerformanceInsights(stats, metrics);
    m_analytics = computeSummary(m_deliveryRecords, m_engagementRecords, now);
    m_deliveryStats = std::move(stats);
    m_engagementMetrics = std::move(metrics);

    saveDerived();
}

void AnalyticsEngine::recomputeAnalytics()
{
    nudge::logging::CorrelationScope scope(QStringLiteral("analytics-") +
                                           QString::fromStdString(generateUuid()));
    std::size_t insightCount = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        recomputeLocked();
        insightCount = m_insights.size();
    }

    NLOG_INFO(kComponent,
              QStringLiteral("recomputeAnalytics"),
              QStringLiteral("analytics_recomputed"),
              QStringLiteral("recompute_call"),
              QStringLiteral("aggregate_records"),
              nudge::logging::defaultWho(),
              nudge::logging::currentCorrelationId(),
              (nlohmann::json{{"insights", insightCount}}));
    emit analyticsUpdated();
}

AnalyticsExport AnalyticsEngine::exportAnalyticsData()
{
    AnalyticsExport data;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        recomputeLocked();

        data.analytics = m_analytics.value_or(NotificationAnalytics{});
        data.deliveryStats = m_deliveryStats.value_or(DeliveryStatistics{});
        data.engagementMetrics = m_engagementMetrics.value_or(EngagementMetrics{});
        data.performanceInsights = m_insights;

        const std::size_t limit = std::min(m_config.exportEventLimit, m_events.size());
        data.events.assign(m_events.end() - static_cast<std::ptrdiff_t>(limit), m_events.end());
        data.deliveryRecords = m_deliveryRecords;
        data.engagementRecords = m_engagementRecords;
        data.exportDate = m_clock();
    }

    NLOG_INFO(kComponent,
              QStringLiteral("exportAnalyticsData"),
              QStringLiteral("analytics_exported"),
              QStringLiteral("export_call"),
              QStringLiteral("snapshot"),
              nudge::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"events", data.events.size()},
                              {"deliveryRecords", data.deliveryRecords.size()},
                              {"engagementRecords", data.engagementRecords.size()}}));
    emit analyticsUpdated();
    return data;
}

std::vector<NotificationEvent> AnalyticsEngine::events() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events;
}

std::vector<DeliveryRecord> AnalyticsEngine::deliveryRecords() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_deliveryRecords;
}

std::vector<EngagementRecord> AnalyticsEngine::engagementRecords() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_engagementRecords;
}

std::optional<NotificationAnalytics> AnalyticsEngine::analytics() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_analytics;
}

std::optional<DeliveryStatistics> AnalyticsEngine::deliveryStatistics() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_deliveryStats;
}

std::optional<EngagementMetrics> AnalyticsEngine::engagementMetrics() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_engagementMetrics;
}

std::vector<PerformanceInsight> AnalyticsEngine::performanceInsights() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_insights;
}

void AnalyticsEngine::loadStoredData()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    loadJsonBlob(m_store, store_keys::kEvents, m_events);
    loadJsonBlob(m_store, store_keys::kDeliveryRecords, m_deliveryRecords);
    loadJsonBlob(m_store, store_keys::kEngagementRecords, m_engagementRecords);

    NotificationAnalytics summary;
    if (loadJsonBlob(m_store, store_keys::kAnalyticsSummary, summary)) {
        m_analytics = summary;
    }
    DeliveryStatistics stats;
    if (loadJsonBlob(m_store, store_keys::kDeliveryStatistics, stats)) {
        m_deliveryStats = stats;
    }
    EngagementMetrics metrics;
    if (loadJsonBlob(m_store, store_keys::kEngagementMetrics, metrics)) {
        m_engagementMetrics = metrics;
    }

    // A lowered cap applies to history loaded from an older run.
    if (m_events.size() > m_config.maxEventsHistory) {
        const auto excess = m_events.size() - m_config.maxEventsHistory;
        m_events.erase(m_events.begin(), m_events.begin() + static_cast<std::ptrdiff_t>(excess));
    }
}

void AnalyticsEngine::saveEvents()
{
    saveJsonBlob(m_store, store_keys::kEvents, m_events);
}

void AnalyticsEngine::saveDeliveryRecords()
{
    saveJsonBlob(m_store, store_keys::kDeliveryRecords, m_deliveryRecords);
}

void AnalyticsEngine::saveEngagementRecords()
{
    saveJsonBlob(m_store, store_keys::kEngagementRecords, m_engagementRecords);
}

void AnalyticsEngine::saveDerived()
{
    if (m_analytics.has_value()) {
        saveJsonBlob(m_store, store_keys::kAnalyticsSummary, *m_analytics);
    }
    if (m_deliveryStats.has_value()) {
        saveJsonBlob(m_store, store_keys::kDeliveryStatistics, *m_deliveryStats);
    }
    if (m_engagementMetrics.has_value()) {
        saveJsonBlob(m_store, store_keys::kEngagementMetrics, *m_engagementMetrics);
    }
}

} // namespace nudge
