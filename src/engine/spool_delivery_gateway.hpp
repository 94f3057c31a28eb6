#pragma once

#include <chrono>
#include <vector>

#include "common/time_utils.hpp"
#include "engine/delivery_gateway.hpp"
#include "engine/nudge_store.hpp"

namespace nudge {

// Local delivery gateway that spools requests into the store. A request is
// pending until its instant passes and delivered afterwards. Used by the CLI
// where no platform notification center exists. Delivered entries older
// than kDeliveredRetention are dropped on the next schedule().
class SpoolDeliveryGateway : public DeliveryGateway {
public:
    static constexpr std::chrono::hours kDeliveredRetention{24 * 30};

    explicit SpoolDeliveryGateway(NudgeStore &store, Clock clock = systemClock());

    bool schedule(const NotificationRequest &request) override;
    void cancel(const std::string &notificationId) override;
    std::vector<DeliveredNotification> listDelivered() override;
    std::vector<PendingNotification> listPending() override;

private:
    void pruneDelivered();
    void persist();

    NudgeStore &m_store;
    Clock m_clock;
    std::vector<NotificationRequest> m_spool;
};

} // namespace nudge
