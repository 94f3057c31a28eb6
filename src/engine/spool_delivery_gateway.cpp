#include "engine/spool_delivery_gateway.hpp"

#include <algorithm>
#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace nudge {

SpoolDeliveryGateway::SpoolDeliveryGateway(NudgeStore &store, Clock clock)
    : m_store(store)
    , m_clock(std::move(clock))
{
    loadJsonBlob(m_store, store_keys::kDeliverySpool, m_spool);
}

bool SpoolDeliveryGateway::schedule(const NotificationRequest &request)
{
    const bool duplicate = std::any_of(
        m_spool.begin(), m_spool.end(),
        [&request](const NotificationRequest &queued) { return queued.id == request.id; });
    if (request.id.empty() || duplicate) {
        NLOG_WARN(QStringLiteral("SpoolDeliveryGateway"),
                  QStringLiteral("schedule"),
                  QStringLiteral("request_rejected"),
                  duplicate ? QStringLiteral("duplicate_id") : QStringLiteral("missing_id"),
                  QStringLiteral("reject"),
                  nudge::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"notificationId", request.id}}));
        return false;
    }

    pruneDelivered();
    m_spool.push_back(request);
    persist();

    NLOG_DEBUG(QStringLiteral("SpoolDeliveryGateway"),
               QStringLiteral("schedule"),
               QStringLiteral("request_spooled"),
               QStringLiteral("schedule_call"),
               QStringLiteral("store_blob"),
               nudge::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"notificationId", request.id},
                               {"deliverAt", toIso8601Utc(request.deliverAt)}}));
    return true;
}

void SpoolDeliveryGateway::cancel(const std::string &notificationId)
{
    const auto before = m_spool.size();
    m_spool.erase(std::remove_if(m_spool.begin(), m_spool.end(),
                                 [&notificationId](const NotificationRequest &queued) {
                                     return queued.id == notificationId;
                                 }),
                  m_spool.end());
    if (m_spool.size() != before) {
        persist();
    }
}

std::vector<DeliveredNotification> SpoolDeliveryGateway::listDelivered()
{
    const auto now = m_clock();
    std::vector<DeliveredNotification> delivered;
    for (const auto &request : m_spool) {
        if (request.deliverAt > now) {
            continue;
        }
        delivered.push_back(DeliveredNotification{
            request.id, request.title, request.body, request.deliverAt, request.category});
    }
    return delivered;
}

std::vector<PendingNotification> SpoolDeliveryGateway::listPending()
{
    const auto now = m_clock();
    std::vector<PendingNotification> pending;
    for (const auto &request : m_spool) {
        if (request.deliverAt <= now) {
            continue;
        }
        pending.push_back(PendingNotification{
            request.id, request.title, request.body, request.deliverAt, request.category});
    }
    return pending;
}

void SpoolDeliveryGateway::pruneDelivered()
{
    const auto cutoff = m_clock() - kDeliveredRetention;
    const auto before = m_spool.size();
    m_spool.erase(std::remove_if(m_spool.begin(), m_spool.end(),
                                 [cutoff](const NotificationRequest &queued) {
                                     return queued.deliverAt < cutoff;
                                 }),
                  m_spool.end());
    if (m_spool.size() != before) {
        NLOG_DEBUG(QStringLiteral("SpoolDeliveryGateway"),
                   QStringLiteral("pruneDelivered"),
                   QStringLiteral("spool_pruned"),
                   QStringLiteral("retention_elapsed"),
                   QStringLiteral("erase"),
                   nudge::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"removed", before - m_spool.size()},
                                   {"cutoff", toIso8601Utc(cutoff)}}));
    }
}

void SpoolDeliveryGateway::persist()
{
    saveJsonBlob(m_store, store_keys::kDeliverySpool, m_spool);
}

} // namespace nudge
