#include "engine/campaign_scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "common/id_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/template_catalog.hpp"

#include <nlohmann/json.hpp>

namespace nudge {

namespace {

constexpr int kWelcomeWindowDays = 7;

const QString kComponent = QStringLiteral("CampaignScheduler");

ScheduleItem makeItem(std::string templateId,
                      int offsetDays,
                      std::string preferredTime,
                      std::map<std::string, std::string> data = {})
{
    ScheduleItem item;
    item.templateId = std::move(templateId);
    item.offsetDays = offsetDays;
    item.preferredTime = std::move(preferredTime);
    item.personalizationData = std::move(data);
    return item;
}

QString campaignCorrelation(const std::string &campaignId)
{
    return QStringLiteral("campaign-") + QString::fromStdString(campaignId);
}

} // namespace

CampaignScheduler::CampaignScheduler(NudgeStore &store,
                                     DeliveryGateway &gateway,
                                     PersonalizationEngine &personalizer,
                                     const DeliveryTimeOptimizer &optimizer,
                                     Clock clock,
                                     QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_gateway(gateway)
    , m_personalizer(personalizer)
    , m_optimizer(optimizer)
    , m_clock(std::move(clock))
{
    loadStoredData();
}

CampaignScheduler::~CampaignScheduler() = default;

std::vector<NotificationTemplate> CampaignScheduler::templates() const
{
    return m_templates;
}

std::optional<NotificationTemplate> CampaignScheduler::findTemplate(const std::string &id) const
{
    for (const auto &tmpl : m_templates) {
        if (tmpl.id == id) {
            return tmpl;
        }
    }
    return std::nullopt;
}

void CampaignScheduler::replaceTemplates(std::vector<NotificationTemplate> templates)
{
    m_templates = std::move(templates);
    saveTemplates();
    emit templatesChanged();
}

std::vector<Campaign> CampaignScheduler::campaigns() const
{
    return m_campaigns;
}

std::optional<Campaign> CampaignScheduler::findCampaign(const std::string &id) const
{
    for (const auto &campaign : m_campaigns) {
        if (campaign.id == id) {
            return campaign;
        }
    }
    return std::nullopt;
}

std::optional<PersonalizationProfile> CampaignScheduler::profile() const
{
    return m_profile;
}

void CampaignScheduler::updatePersonalizationProfile(const PersonalizationProfile &profile)
{
    m_profile = profile;
    saveProfile();
    emit profileChanged();
}

std::optional<DeliveryMetrics> CampaignScheduler::deliveryMetrics() const
{
    return m_deliveryMetrics;
}

bool CampaignScheduler::validateCampaign(const Campaign &campaign) const
{
    // Ids name the armed notifications of a campaign; a second campaign
    // under the same id would orphan them.
    if (findCampaign(campaign.id).has_value()) {
        NLOG_WARN(kComponent,
                  QStringLiteral("validateCampaign"),
                  QStringLiteral("campaign_invalid"),
                  QStringLiteral("duplicate_campaign_id"),
                  QStringLiteral("reject"),
                  nudge::logging::defaultWho(),
                  nudge::logging::currentCorrelationId(),
                  (nlohmann::json{{"campaignId", campaign.id}}));
        return false;
    }

    if (campaign.startDate > campaign.endDate) {
        NLOG_WARN(kComponent,
                  QStringLiteral("validateCampaign"),
                  QStringLiteral("campaign_invalid"),
                  QStringLiteral("start_after_end"),
                  QStringLiteral("reject"),
                  nudge::logging::defaultWho(),
                  nudge::logging::currentCorrelationId(),
                  (nlohmann::json{{"campaignId", campaign.id},
                                  {"startDate", toIso8601Utc(campaign.startDate)},
                                  {"endDate", toIso8601Utc(campaign.endDate)}}));
        return false;
    }

    for (const auto &item : campaign.schedule) {
        if (!findTemplate(item.templateId).has_value()) {
            NLOG_WARN(kComponent,
                      QStringLiteral("validateCampaign"),
                      QStringLiteral("campaign_invalid"),
                      QStringLiteral("unknown_template"),
                      QStringLiteral("reject"),
                      nudge::logging::defaultWho(),
                      nudge::logging::currentCorrelationId(),
                      (nlohmann::json{{"campaignId", campaign.id},
                                      {"templateId", item.templateId}}));
            return false;
        }
    }
    return true;
}

TimePoint CampaignScheduler::computeDeliveryTime(TimePoint startDate,
                                                 int offsetDays,
                                                 const std::optional<std::string> &preferredTime)
{
    TimePoint deliverAt = addLocalDays(startDate, offsetDays);
    if (preferredTime.has_value()) {
        if (const auto parsed = parseTimeOfDay(*preferredTime)) {
            deliverAt = atLocalTime(deliverAt, parsed->first, parsed->second);
        }
    }
    return deliverAt;
}

std::vector<std::string> CampaignScheduler::scheduleItems(const Campaign &campaign,
                                                          const std::vector<ScheduleItem> &items)
{
    std::vector<std::string> accepted;
    const auto now = m_clock();

    for (const auto &item : items) {
        const auto tmpl = findTemplate(item.templateId);
        if (!tmpl.has_value()) {
            continue;
        }

        const TimePoint deliverAt =
            computeDeliveryTime(campaign.startDate, item.offsetDays, item.preferredTime);
        if (deliverAt <= now) {
            NLOG_DEBUG(kComponent,
                       QStringLiteral("scheduleItems"),
                       QStringLiteral("schedule_item_skipped"),
                       QStringLiteral("instant_not_in_future"),
                       QStringLiteral("skip"),
                       nudge::logging::defaultWho(),
                       nudge::logging::currentCorrelationId(),
                       (nlohmann::json{{"campaignId", campaign.id},
                                       {"templateId", item.templateId},
                                       {"deliverAt", toIso8601Utc(deliverAt)}}));
            continue;
        }

        const RenderedContent content =
            m_personalizer.render(*tmpl, item.personalizationData, m_profile);

        NotificationRequest request;
        request.id = "campaign_" + campaign.id + "_" + item.templateId + "_" + generateUuid();
        request.title = content.title;
        request.body = content.body;
        request.subtitle = content.subtitle;
        request.category = tmpl->category;
        request.deliverAt = deliverAt;

        if (!m_gateway.schedule(request)) {
            NLOG_WARN(kComponent,
                      QStringLiteral("scheduleItems"),
                      QStringLiteral("delivery_rejected"),
                      QStringLiteral("upstream_rejection"),
                      QStringLiteral("drop_item"),
                      nudge::logging::defaultWho(),
                      nudge::logging::currentCorrelationId(),
                      (nlohmann::json{{"campaignId", campaign.id},
                                      {"notificationId", request.id}}));
            continue;
        }

        accepted.push_back(request.id);
        const bool personalized = m_profile.has_value() || !item.personalizationData.empty();
        emit notificationScheduled(request, tmpl->type, personalized);
    }
    return accepted;
}

bool CampaignScheduler::createCampaign(const Campaign &campaign)
{
    nudge::logging::CorrelationScope scope(campaignCorrelation(campaign.id));

    if (!validateCampaign(campaign)) {
        return false;
    }

    Campaign created = campaign;
    created.scheduledNotificationIds = scheduleItems(created, created.schedule);
    created.status = CampaignStatus::Active;

    m_campaigns.push_back(created);
    saveCampaigns();

    NLOG_INFO(kComponent,
              QStringLiteral("createCampaign"),
              QStringLiteral("campaign_created"),
              QStringLiteral("create_call"),
              QStringLiteral("schedule_items"),
              nudge::logging::defaultWho(),
              nudge::logging::currentCorrelationId(),
              (nlohmann::json{{"campaignId", created.id},
                              {"name", created.name},
                              {"items", created.schedule.size()},
                              {"scheduled", created.scheduledNotificationIds.size()}}));

    emit campaignsChanged();
    return true;
}

void CampaignScheduler::cancelCampaign(const std::string &campaignId)
{
    nudge::logging::CorrelationScope scope(campaignCorrelation(campaignId));

    auto it = std::find_if(m_campaigns.begin(), m_campaigns.end(),
                           [&campaignId](const Campaign &c) { return c.id == campaignId; });
    if (it == m_campaigns.end()) {
        NLOG_WARN(kComponent,
                  QStringLiteral("cancelCampaign"),
                  QStringLiteral("campaign_not_found"),
                  QStringLiteral("unknown_campaign_id"),
                  QStringLiteral("noop"),
                  nudge::logging::defaultWho(),
                  nudge::logging::currentCorrelationId(),
                  (nlohmann::json{{"campaignId", campaignId}}));
        return;
    }
    if (it->status == CampaignStatus::Completed || it->status == CampaignStatus::Cancelled) {
        NLOG_WARN(kComponent,
                  QStringLiteral("cancelCampaign"),
                  QStringLiteral("campaign_not_cancellable"),
                  QStringLiteral("terminal_status"),
                  QStringLiteral("noop"),
                  nudge::logging::defaultWho(),
                  nudge::logging::currentCorrelationId(),
                  (nlohmann::json{{"campaignId", campaignId},
                                  {"status", toCampaignStatusString(it->status)}}));
        return;
    }

    for (const auto &notificationId : it->scheduledNotificationIds) {
        m_gateway.cancel(notificationId);
    }
    it->status = CampaignStatus::Cancelled;
    saveCampaigns();

    NLOG_INFO(kComponent,
              QStringLiteral("cancelCampaign"),
              QStringLiteral("campaign_cancelled"),
              QStringLiteral("cancel_call"),
              QStringLiteral("cancel_notifications"),
              nudge::logging::defaultWho(),
              nudge::logging::currentCorrelationId(),
              (nlohmann::json{{"campaignId", campaignId},
                              {"cancelled", it->scheduledNotificationIds.size()}}));

    emit campaignsChanged();
}

bool CampaignScheduler::pauseCampaign(const std::string &campaignId)
{
    nudge::logging::CorrelationScope scope(campaignCorrelation(campaignId));

    auto it = std::find_if(m_campaigns.begin(), m_campaigns.end(),
                           [&campaignId](const Campaign &c) { return c.id == campaignId; });
    if (it == m_campaigns.end() || it->status != CampaignStatus::Active) {
        NLOG_WARN(kComponent,
                  QStringLiteral("pauseCampaign"),
                  QStringLiteral("campaign_not_pausable"),
                  it == m_campaigns.end() ? QStringLiteral("unknown_campaign_id")
                                          : QStringLiteral("not_active"),
                  QStringLiteral("noop"),
                  nudge::logging::defaultWho(),
                  nudge::logging::currentCorrelationId(),
                  (nlohmann::json{{"campaignId", campaignId}}));
        return false;
    }

    for (const auto &notificationId : it->scheduledNotificationIds) {
        m_gateway.cancel(notificationId);
    }
    it->scheduledNotificationIds.clear();
    it->status = CampaignStatus::Paused;
    saveCampaigns();

    NLOG_INFO(kComponent,
              QStringLiteral("pauseCampaign"),
              QStringLiteral("campaign_paused"),
              QStringLiteral("pause_call"),
              QStringLiteral("cancel_notifications"),
              nudge::logging::defaultWho(),
              nudge::logging::currentCorrelationId(),
              (nlohmann::json{{"campaignId", campaignId}}));

    emit campaignsChanged();
    return true;
}

bool CampaignScheduler::resumeCampaign(const std::string &campaignId)
{
    nudge::logging::CorrelationScope scope(campaignCorrelation(campaignId));

    auto it = std::find_if(m_campaigns.begin(), m_campaigns.end(),
                           [&campaignId](const Campaign &c) { return c.id == campaignId; });
    if (it == m_campaigns.end() || it->status != CampaignStatus::Paused) {
        NLOG_WARN(kComponent,
                  QStringLiteral("resumeCampaign"),
                  QStringLiteral("campaign_not_resumable"),
                  it == m_campaigns.end() ? QStringLiteral("unknown_campaign_id")
                                          : QStringLiteral("not_paused"),
                  QStringLiteral("noop"),
                  nudge::logging::defaultWho(),
                  nudge::logging::currentCorrelationId(),
                  (nlohmann::json{{"campaignId", campaignId}}));
        return false;
    }

    // scheduleItems emits; work on a copy so no iterator is held across it.
    // Items whose template was removed while paused are skipped there.
    Campaign resumed = *it;
    resumed.scheduledNotificationIds = scheduleItems(resumed, resumed.schedule);
    resumed.status = CampaignStatus::Active;

    for (auto &campaign : m_campaigns) {
        if (campaign.id == campaignId) {
            campaign = resumed;
            break;
        }
    }
    saveCampaigns();

    NLOG_INFO(kComponent,
              QStringLiteral("resumeCampaign"),
              QStringLiteral("campaign_resumed"),
              QStringLiteral("resume_call"),
              QStringLiteral("schedule_items"),
              nudge::logging::defaultWho(),
              nudge::logging::currentCorrelationId(),
              (nlohmann::json{{"campaignId", campaignId},
                              {"scheduled", resumed.scheduledNotificationIds.size()}}));

    emit campaignsChanged();
    return true;
}

int CampaignScheduler::completeExpiredCampaigns()
{
    const auto now = m_clock();
    int completed = 0;
    for (auto &campaign : m_campaigns) {
        if (campaign.status == CampaignStatus::Active && campaign.endDate < now) {
            campaign.status = CampaignStatus::Completed;
            ++completed;
        }
    }

    if (completed > 0) {
        saveCampaigns();
        NLOG_INFO(kComponent,
                  QStringLiteral("completeExpiredCampaigns"),
                  QStringLiteral("campaigns_completed"),
                  QStringLiteral("end_date_passed"),
                  QStringLiteral("mark_completed"),
                  nudge::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"count", completed}}));
        emit campaignsChanged();
    }
    return completed;
}

std::optional<NotificationRequest> CampaignScheduler::generatePersonalizedNotification(
    const std::string &templateId,
    const std::map<std::string, std::string> &personalizationData)
{
    const auto tmpl = findTemplate(templateId);
    if (!tmpl.has_value()) {
        NLOG_WARN(kComponent,
                  QStringLiteral("generatePersonalizedNotification"),
                  QStringLiteral("template_not_found"),
                  QStringLiteral("unknown_template_id"),
                  QStringLiteral("return_empty"),
                  nudge::logging::defaultWho(),
                  nudge::logging::currentCorrelationId(),
                  (nlohmann::json{{"templateId", templateId}}));
        return std::nullopt;
    }

    const RenderedContent content = m_personalizer.render(*tmpl, personalizationData, m_profile);

    NotificationRequest request;
    request.id = "generated_" + templateId + "_" + generateUuid();
    request.title = content.title;
    request.body = content.body;
    request.subtitle = content.subtitle;
    request.category = tmpl->category;
    request.deliverAt = m_optimizer.optimalTime(tmpl->type, m_profile);
    return request;
}

bool CampaignScheduler::createWelcomeCampaign()
{
    const auto now = m_clock();

    Campaign campaign;
    campaign.id = "welcome_series_" + generateUuid();
    campaign.name = "Welcome Series";
    campaign.description = "Onboarding sequence for new users";
    campaign.startDate = now;
    campaign.endDate = addLocalDays(now, kWelcomeWindowDays);
    campaign.schedule = {
        makeItem("welcome_day1", 0, "10:00"),
        makeItem("welcome_day3", 2, "14:00"),
        makeItem("daily_meditation", 3, "09:00", {{"duration", "5"}}),
    };
    return createCampaign(campaign);
}

bool CampaignScheduler::createDailyReminderCampaign(int days)
{
    if (days <= 0) {
        NLOG_WARN(kComponent,
                  QStringLiteral("createDailyReminderCampaign"),
                  QStringLiteral("campaign_invalid"),
                  QStringLiteral("non_positive_days"),
                  QStringLiteral("reject"),
                  nudge::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"days", days}}));
        return false;
    }

    const auto now = m_clock();
    const std::string reminderTime =
        m_profile.has_value() ? m_profile->preferredReminderTime : std::string("09:00");
    const int duration = m_profile.has_value() ? m_profile->preferredSessionDuration : 10;

    Campaign campaign;
    campaign.id = "daily_reminders_" + generateUuid();
    campaign.name = "Daily Meditation Reminders";
    campaign.description = "Daily reminders for meditation practice";
    campaign.startDate = now;
    campaign.endDate = addLocalDays(now, days);
    for (int day = 0; day < days; ++day) {
        campaign.schedule.push_back(makeItem("daily_meditation",
                                             day,
                                             reminderTime,
                                             {{"duration", std::to_string(duration)}}));
    }
    return createCampaign(campaign);
}

DeliveryMetrics CampaignScheduler::refreshDeliveryMetrics()
{
    const auto delivered = m_gateway.listDelivered();
    const auto pending = m_gateway.listPending();

    DeliveryMetrics metrics;
    metrics.totalDelivered = static_cast<int>(delivered.size());
    metrics.totalPending = static_cast<int>(pending.size());
    metrics.totalSent = metrics.totalDelivered + metrics.totalPending;
    metrics.deliveryRate = metrics.totalSent > 0
        ? static_cast<double>(metrics.totalDelivered) / metrics.totalSent
        : 0.0;
    metrics.lastUpdated = m_clock();

    m_deliveryMetrics = metrics;
    saveJsonBlob(m_store, store_keys::kDeliveryMetrics, metrics);
    emit deliveryMetricsChanged();
    return metrics;
}

void CampaignScheduler::loadStoredData()
{
    loadJsonBlob(m_store, store_keys::kTemplates, m_templates);
    if (m_templates.empty()) {
        m_templates = defaultTemplates();
        saveTemplates();
        NLOG_INFO(kComponent,
                  QStringLiteral("loadStoredData"),
                  QStringLiteral("default_templates_installed"),
                  QStringLiteral("empty_catalog"),
                  QStringLiteral("install_defaults"),
                  nudge::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"count", m_templates.size()}}));
    }

    loadJsonBlob(m_store, store_keys::kCampaigns, m_campaigns);

    PersonalizationProfile storedProfile;
    if (loadJsonBlob(m_store, store_keys::kProfile, storedProfile)) {
        m_profile = storedProfile;
    }

    DeliveryMetrics storedMetrics;
    if (loadJsonBlob(m_store, store_keys::kDeliveryMetrics, storedMetrics)) {
        m_deliveryMetrics = storedMetrics;
    }
}

void CampaignScheduler::saveTemplates()
{
    saveJsonBlob(m_store, store_keys::kTemplates, m_templates);
}

void CampaignScheduler::saveCampaigns()
{
    saveJsonBlob(m_store, store_keys::kCampaigns, m_campaigns);
}

void CampaignScheduler::saveProfile()
{
    if (m_profile.has_value()) {
        saveJsonBlob(m_store, store_keys::kProfile, *m_profile);
    }
}

} // namespace nudge
