#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <QObject>

#include "common/models.hpp"
#include "common/time_utils.hpp"
#include "engine/delivery_gateway.hpp"
#include "engine/delivery_time_optimizer.hpp"
#include "engine/nudge_store.hpp"
#include "engine/personalization_engine.hpp"

namespace nudge {

/**
 * CampaignScheduler owns the template catalog, the campaign list and the
 * personalization profile. It:
 * - validates campaign definitions against the catalog
 * - expands schedule items into rendered, timed notification requests
 * - hands each request to the delivery gateway and tracks accepted ids
 * - drives the campaign lifecycle (active, paused, completed, cancelled)
 *
 * All state is persisted through NudgeStore after each mutation. Callers get
 * copies; the collections are never exposed by mutable reference.
 */
class CampaignScheduler : public QObject
{
    Q_OBJECT
public:
    CampaignScheduler(NudgeStore &store,
                      DeliveryGateway &gateway,
                      PersonalizationEngine &personalizer,
                      const DeliveryTimeOptimizer &optimizer,
                      Clock clock = systemClock(),
                      QObject *parent = nullptr);
    ~CampaignScheduler() override;

    std::vector<NotificationTemplate> templates() const;
    std::optional<NotificationTemplate> findTemplate(const std::string &id) const;
    // Replaces the whole catalog. Existing campaigns are not revalidated.
    void replaceTemplates(std::vector<NotificationTemplate> templates);

    std::vector<Campaign> campaigns() const;
    std::optional<Campaign> findCampaign(const std::string &id) const;

    std::optional<PersonalizationProfile> profile() const;
    void updatePersonalizationProfile(const PersonalizationProfile &profile);

    std::optional<DeliveryMetrics> deliveryMetrics() const;

    bool validateCampaign(const Campaign &campaign) const;

    // Validates, schedules every future item, marks the campaign active and
    // persists it. Returns false (and persists nothing) on validation failure.
    bool createCampaign(const Campaign &campaign);

    // Unknown ids are a logged no-op.
    void cancelCampaign(const std::string &campaignId);
    bool pauseCampaign(const std::string &campaignId);
    bool resumeCampaign(const std::string &campaignId);

    // Moves active campaigns whose end date has passed to completed.
    // Returns the number of campaigns completed.
    int completeExpiredCampaigns();

    // Ad-hoc rendering outside any campaign. Does not schedule anything.
    std::optional<NotificationRequest> generatePersonalizedNotification(
        const std::string &templateId,
        const std::map<std::string, std::string> &personalizationData = {});

    bool createWelcomeCampaign();
    bool createDailyReminderCampaign(int days);

    // Counts delivered and pending notifications reported by the gateway.
    DeliveryMetrics refreshDeliveryMetrics();

    // Instant for one schedule item: start + offset days, then the item's
    // "HH:MM" if it parses.
    static TimePoint computeDeliveryTime(TimePoint startDate,
                                         int offsetDays,
                                         const std::optional<std::string> &preferredTime);

signals:
    void templatesChanged();
    void campaignsChanged();
    void profileChanged();
    void deliveryMetricsChanged();
    void notificationScheduled(const nudge::NotificationRequest &request,
                               nudge::NotificationType type,
                               bool personalized);

private:
    std::vector<std::string> scheduleItems(const Campaign &campaign,
                                           const std::vector<ScheduleItem> &items);

    void loadStoredData();
    void saveTemplates();
    void saveCampaigns();
    void saveProfile();

    NudgeStore &m_store;
    DeliveryGateway &m_gateway;
    PersonalizationEngine &m_personalizer;
    const DeliveryTimeOptimizer &m_optimizer;
    Clock m_clock;

    std::vector<NotificationTemplate> m_templates;
    std::vector<Campaign> m_campaigns;
    std::optional<PersonalizationProfile> m_profile;
    std::optional<DeliveryMetrics> m_deliveryMetrics;
};

} // namespace nudge
