#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace nudge {

// Boundary to the platform notification-delivery subsystem. Implementations
// arm, cancel and enumerate device notifications; the engine only decides
// content and timing.
class DeliveryGateway {
public:
    virtual ~DeliveryGateway() = default;

    // Returns true if the subsystem accepted the request.
    virtual bool schedule(const NotificationRequest &request) = 0;

    // Best effort. Unknown ids are ignored.
    virtual void cancel(const std::string &notificationId) = 0;

    virtual std::vector<DeliveredNotification> listDelivered() = 0;
    virtual std::vector<PendingNotification> listPending() = 0;
};

} // namespace nudge
