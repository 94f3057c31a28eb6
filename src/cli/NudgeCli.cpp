#include "cli/NudgeCli.hpp"

#include <exception>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include <QFile>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "engine/analytics_engine.hpp"
#include "engine/campaign_scheduler.hpp"
#include "engine/delivery_time_optimizer.hpp"
#include "engine/nudge_store.hpp"
#include "engine/personalization_engine.hpp"
#include "engine/spool_delivery_gateway.hpp"

#include <nlohmann/json.hpp>

namespace nudge {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  nudge-cli [--db PATH] [--trace] COMMAND [options]\n"
        "\n"
        "Commands:\n"
        "  templates\n"
        "  campaigns\n"
        "  welcome\n"
        "  reminders --days N\n"
        "  cancel --id CAMPAIGN_ID\n"
        "  pause --id CAMPAIGN_ID\n"
        "  resume --id CAMPAIGN_ID\n"
        "  render --template ID [--set key=value ...]\n"
        "  profile [--name NAME] [--time HH:MM] [--duration MINUTES]\n"
        "  track sent --id ID --type TYPE --category CATEGORY [--personalized]\n"
        "  track delivered --id ID --latency SECONDS\n"
        "  track opened --id ID --seconds SECONDS\n"
        "  track dismissed --id ID --seconds SECONDS\n"
        "  track action --id ID --action-id ACTION [--action-type view|dismiss|snooze|reply|custom]\n"
        "  track failed --id ID --error TEXT\n"
        "  analytics [--format markdown|json]\n"
        "  export --out PATH\n"
        "  metrics\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

std::optional<double> getDoubleArg(const QStringList &args, const QString &key)
{
    const QString value = getArgValue(args, key);
    if (value.isEmpty()) {
        return std::nullopt;
    }
    bool ok = false;
    const double parsed = value.toDouble(&ok);
    if (!ok || parsed < 0.0) {
        return std::nullopt;
    }
    return parsed;
}

int usageError()
{
    std::cerr << usageText().toStdString();
    return 1;
}

bool writeJsonFile(const QString &path, const nlohmann::json &payload)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray data = QByteArray::fromStdString(dumpJson(payload, 2));
    return file.write(data) == data.size();
}

std::string percent(double rate)
{
    return std::to_string(static_cast<int>(rate * 100.0)) + "%";
}

void renderAnalyticsMarkdown(const AnalyticsExport &data)
{
    const auto &summary = data.analytics;
    const auto &stats = data.deliveryStats;
    const auto &engagement = data.engagementMetrics;

    std::cout << "# Notification Analytics\n\n";
    std::cout << "Computed: " << toIso8601Utc(summary.lastUpdated) << " ("
              << toTimeRangeString(summary.timeRange) << ")\n\n";

    std::cout << "## Delivery\n\n";
    std::cout << "- Sent: " << stats.totalSent << "\n";
    std::cout << "- Delivered: " << stats.totalDelivered << "\n";
    std::cout << "- Failed: " << stats.totalFailed << "\n";
    std::cout << "- Pending: " << stats.totalPending << "\n";
    std::cout << "- Delivery rate: " << percent(stats.deliveryRate) << "\n";
    std::cout << "- Average delivery time: " << stats.averageDeliveryTime << "s\n";
    std::cout << "- p95 delivery time: " << stats.p95DeliveryTime << "s\n\n";

    std::cout << "## Engagement\n\n";
    std::cout << "- Opened: " << summary.totalOpened << "\n";
    std::cout << "- Open rate: " << percent(engagement.openRate) << "\n";
    std::cout << "- Dismissal rate: " << percent(engagement.dismissalRate) << "\n";
    std::cout << "- Action rate: " << percent(engagement.actionRate) << "\n\n";

    if (!engagement.engagementByCategory.empty()) {
        std::cout << "### By category\n\n";
        for (const auto &entry : engagement.engagementByCategory) {
            std::cout << "- " << entry.first << ": sent " << entry.second.totalSent
                      << ", delivered " << entry.second.totalDelivered
                      << ", opened " << entry.second.totalOpened
                      << " (open rate " << percent(entry.second.openRate) << ")\n";
        }
        std::cout << "\n";
    }

    std::cout << "## Insights\n\n";
    if (data.performanceInsights.empty()) {
        std::cout << "No insights.\n";
        return;
    }
    for (const auto &insight : data.performanceInsights) {
        std::cout << "- [" << toInsightSeverityString(insight.severity) << "] "
                  << insight.title << ": " << insight.description << "\n";
        std::cout << "  - " << insight.recommendation << "\n";
    }
}

} // namespace

NudgeCli::NudgeCli(Clock clock)
    : m_clock(std::move(clock))
{
}

NudgeCli::~NudgeCli() = default;

int NudgeCli::run(int argc, char *argv[])
{
    // CLI entry: apply configuration, open the engine, dispatch the subcommand.
    QStringList rawArgs;
    rawArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        rawArgs.push_back(QString::fromLocal8Bit(argv[i]));
    }

    m_config = loadEngineConfig();
    const QStringList args = applyCommandLine(m_config, rawArgs);

    if (args.size() < 2) {
        return usageError();
    }

    const QString command = args.at(1);
    NLOG_INFO(QStringLiteral("NudgeCli"),
              QStringLiteral("run"),
              QStringLiteral("cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              nudge::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"command", command.toStdString()}}));

    using Handler = int (NudgeCli::*)(const QStringList &);
    const std::map<QString, Handler> handlers = {
        {QStringLiteral("templates"), &NudgeCli::runTemplates},
        {QStringLiteral("campaigns"), &NudgeCli::runCampaigns},
        {QStringLiteral("welcome"), &NudgeCli::runWelcome},
        {QStringLiteral("reminders"), &NudgeCli::runReminders},
        {QStringLiteral("cancel"), &NudgeCli::runCancel},
        {QStringLiteral("pause"), &NudgeCli::runPause},
        {QStringLiteral("resume"), &NudgeCli::runResume},
        {QStringLiteral("render"), &NudgeCli::runRender},
        {QStringLiteral("profile"), &NudgeCli::runProfile},
        {QStringLiteral("track"), &NudgeCli::runTrack},
        {QStringLiteral("analytics"), &NudgeCli::runAnalytics},
        {QStringLiteral("export"), &NudgeCli::runExport},
        {QStringLiteral("metrics"), &NudgeCli::runMetrics},
    };

    const auto handler = handlers.find(command);
    if (handler == handlers.end()) {
        return usageError();
    }
    if (!openEngine()) {
        return 1;
    }
    return (this->*(handler->second))(args);
}

bool NudgeCli::openEngine()
{
    try {
        m_store = std::make_unique<NudgeStore>(m_config.databasePath);
    } catch (const std::exception &ex) {
        NLOG_ERROR(QStringLiteral("NudgeCli"),
                   QStringLiteral("openEngine"),
                   QStringLiteral("store_open_failed"),
                   QStringLiteral("persistence_failure"),
                   QStringLiteral("abort_command"),
                   nudge::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", m_config.databasePath}, {"error", ex.what()}}));
        std::cerr << "Failed to open database " << m_config.databasePath << ": " << ex.what()
                  << "\n";
        return false;
    }

    std::string integrityMessage;
    if (!m_store->integrityCheck(&integrityMessage)) {
        NLOG_WARN(QStringLiteral("NudgeCli"),
                  QStringLiteral("openEngine"),
                  QStringLiteral("integrity_check_failed"),
                  QStringLiteral("sqlite_integrity"),
                  QStringLiteral("continue_degraded"),
                  nudge::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"message", integrityMessage}}));
    }

    m_gateway = std::make_unique<SpoolDeliveryGateway>(*m_store, m_clock);
    m_personalizer = m_config.randomSeed.has_value()
        ? std::make_unique<PersonalizationEngine>(*m_config.randomSeed)
        : std::make_unique<PersonalizationEngine>();
    m_optimizer = std::make_unique<DeliveryTimeOptimizer>(m_clock);
    m_analytics = std::make_unique<AnalyticsEngine>(*m_store, m_config, m_clock);
    m_scheduler = std::make_unique<CampaignScheduler>(
        *m_store, *m_gateway, *m_personalizer, *m_optimizer, m_clock);

    AnalyticsEngine *analytics = m_analytics.get();
    QObject::connect(m_scheduler.get(), &CampaignScheduler::notificationScheduled,
                     analytics,
                     [analytics](const NotificationRequest &request,
                                 NotificationType type,
                                 bool personalized) {
                         analytics->trackSent(request.id, type, request.category, personalized);
                     });
    return true;
}

int NudgeCli::runTemplates(const QStringList &args)
{
    Q_UNUSED(args);
    const nlohmann::json payload = m_scheduler->templates();
    std::cout << dumpJson(payload, 2) << std::endl;
    return 0;
}

int NudgeCli::runCampaigns(const QStringList &args)
{
    Q_UNUSED(args);
    m_scheduler->completeExpiredCampaigns();
    const nlohmann::json payload = m_scheduler->campaigns();
    std::cout << dumpJson(payload, 2) << std::endl;
    return 0;
}

int NudgeCli::runWelcome(const QStringList &args)
{
    Q_UNUSED(args);
    const auto before = m_scheduler->campaigns().size();
    if (!m_scheduler->createWelcomeCampaign()) {
        std::cerr << "Failed to create welcome campaign\n";
        return 1;
    }
    const auto campaigns = m_scheduler->campaigns();
    if (campaigns.size() > before) {
        const nlohmann::json payload = campaigns.back();
        std::cout << dumpJson(payload, 2) << std::endl;
    }
    return 0;
}

int NudgeCli::runReminders(const QStringList &args)
{
    bool ok = false;
    const int days = getArgValue(args, QStringLiteral("--days")).toInt(&ok);
    if (!ok || days <= 0) {
        return usageError();
    }
    if (!m_scheduler->createDailyReminderCampaign(days)) {
        std::cerr << "Failed to create reminder campaign\n";
        return 1;
    }
    const nlohmann::json payload = m_scheduler->campaigns().back();
    std::cout << dumpJson(payload, 2) << std::endl;
    return 0;
}

int NudgeCli::runCancel(const QStringList &args)
{
    const QString id = getArgValue(args, QStringLiteral("--id"));
    if (id.isEmpty()) {
        return usageError();
    }
    const std::string campaignId = id.toStdString();
    if (!m_scheduler->findCampaign(campaignId).has_value()) {
        std::cerr << "Unknown campaign: " << campaignId << "\n";
    }
    m_scheduler->cancelCampaign(campaignId);
    return 0;
}

int NudgeCli::runPause(const QStringList &args)
{
    const QString id = getArgValue(args, QStringLiteral("--id"));
    if (id.isEmpty()) {
        return usageError();
    }
    if (!m_scheduler->pauseCampaign(id.toStdString())) {
        std::cerr << "Campaign is not active: " << id.toStdString() << "\n";
        return 1;
    }
    return 0;
}

int NudgeCli::runResume(const QStringList &args)
{
    const QString id = getArgValue(args, QStringLiteral("--id"));
    if (id.isEmpty()) {
        return usageError();
    }
    if (!m_scheduler->resumeCampaign(id.toStdString())) {
        std::cerr << "Campaign is not paused: " << id.toStdString() << "\n";
        return 1;
    }
    return 0;
}

int NudgeCli::runRender(const QStringList &args)
{
    const QString templateId = getArgValue(args, QStringLiteral("--template"));
    if (templateId.isEmpty()) {
        return usageError();
    }

    std::map<std::string, std::string> values;
    for (int i = 0; i + 1 < args.size(); ++i) {
        if (args.at(i) != QStringLiteral("--set")) {
            continue;
        }
        const QString pair = args.at(i + 1);
        const int eq = pair.indexOf(QLatin1Char('='));
        if (eq <= 0) {
            return usageError();
        }
        values[pair.left(eq).toStdString()] = pair.mid(eq + 1).toStdString();
    }

    const auto request =
        m_scheduler->generatePersonalizedNotification(templateId.toStdString(), values);
    if (!request.has_value()) {
        std::cerr << "Unknown template: " << templateId.toStdString() << "\n";
        return 1;
    }
    const nlohmann::json payload = *request;
    std::cout << dumpJson(payload, 2) << std::endl;
    return 0;
}

int NudgeCli::runProfile(const QStringList &args)
{
    const QString name = getArgValue(args, QStringLiteral("--name"));
    const QString time = getArgValue(args, QStringLiteral("--time"));
    const QString duration = getArgValue(args, QStringLiteral("--duration"));

    if (!name.isEmpty() || !time.isEmpty() || !duration.isEmpty()) {
        PersonalizationProfile profile = m_scheduler->profile().value_or(PersonalizationProfile{});
        if (!name.isEmpty()) {
            profile.userName = name.toStdString();
        }
        if (!time.isEmpty()) {
            if (!parseTimeOfDay(time.toStdString()).has_value()) {
                return usageError();
            }
            profile.preferredReminderTime = time.toStdString();
        }
        if (!duration.isEmpty()) {
            bool ok = false;
            const int minutes = duration.toInt(&ok);
            if (!ok || minutes <= 0) {
                return usageError();
            }
            profile.preferredSessionDuration = minutes;
        }
        profile.lastActiveDate = m_clock();
        m_scheduler->updatePersonalizationProfile(profile);
    }

    const auto profile = m_scheduler->profile();
    if (!profile.has_value()) {
        std::cout << "No profile set.\n";
        return 0;
    }
    const nlohmann::json payload = *profile;
    std::cout << dumpJson(payload, 2) << std::endl;
    return 0;
}

int NudgeCli::runTrack(const QStringList &args)
{
    if (args.size() < 3) {
        return usageError();
    }
    const QString kind = args.at(2);
    const std::string id = getArgValue(args, QStringLiteral("--id")).toStdString();
    if (id.empty()) {
        return usageError();
    }

    if (kind == QStringLiteral("sent")) {
        const auto type =
            parseNotificationTypeString(getArgValue(args, QStringLiteral("--type")).toStdString());
        const QString category = getArgValue(args, QStringLiteral("--category"));
        if (!type.has_value() || category.isEmpty()) {
            return usageError();
        }
        m_analytics->trackSent(id, *type, category.toStdString(),
                               args.contains(QStringLiteral("--personalized")));
        return 0;
    }
    if (kind == QStringLiteral("delivered")) {
        const auto latency = getDoubleArg(args, QStringLiteral("--latency"));
        if (!latency.has_value()) {
            return usageError();
        }
        m_analytics->trackDelivered(id, *latency);
        return 0;
    }
    if (kind == QStringLiteral("opened")) {
        const auto seconds = getDoubleArg(args, QStringLiteral("--seconds"));
        if (!seconds.has_value()) {
            return usageError();
        }
        m_analytics->trackOpened(id, *seconds);
        return 0;
    }
    if (kind == QStringLiteral("dismissed")) {
        const auto seconds = getDoubleArg(args, QStringLiteral("--seconds"));
        if (!seconds.has_value()) {
            return usageError();
        }
        m_analytics->trackDismissed(id, *seconds);
        return 0;
    }
    if (kind == QStringLiteral("action")) {
        const QString actionId = getArgValue(args, QStringLiteral("--action-id"));
        if (actionId.isEmpty()) {
            return usageError();
        }
        QString actionType = getArgValue(args, QStringLiteral("--action-type"));
        if (actionType.isEmpty()) {
            actionType = QStringLiteral("custom");
        }
        m_analytics->trackActionTaken(id, actionId.toStdString(),
                                      parseActionTypeString(actionType.toStdString()));
        return 0;
    }
    if (kind == QStringLiteral("failed")) {
        const QString error = getArgValue(args, QStringLiteral("--error"));
        if (error.isEmpty()) {
            return usageError();
        }
        m_analytics->trackFailed(id, error.toStdString());
        return 0;
    }
    return usageError();
}

int NudgeCli::runAnalytics(const QStringList &args)
{
    const QString format = getFormat(args);
    if (format != QStringLiteral("markdown") && format != QStringLiteral("json")) {
        return usageError();
    }

    const AnalyticsExport data = m_analytics->exportAnalyticsData();
    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["analytics"] = data.analytics;
        payload["deliveryStats"] = data.deliveryStats;
        payload["engagementMetrics"] = data.engagementMetrics;
        payload["performanceInsights"] = data.performanceInsights;
        std::cout << dumpJson(payload, 2) << std::endl;
    } else {
        renderAnalyticsMarkdown(data);
    }
    return 0;
}

int NudgeCli::runExport(const QStringList &args)
{
    const QString outPath = getArgValue(args, QStringLiteral("--out"));
    if (outPath.isEmpty()) {
        return usageError();
    }

    const nlohmann::json payload = m_analytics->exportAnalyticsData();
    if (!writeJsonFile(outPath, payload)) {
        NLOG_ERROR(QStringLiteral("NudgeCli"),
                   QStringLiteral("runExport"),
                   QStringLiteral("export_write_failed"),
                   QStringLiteral("io_error"),
                   QStringLiteral("abort_command"),
                   nudge::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", outPath.toStdString()}}));
        std::cerr << "Failed to write " << outPath.toStdString() << "\n";
        return 1;
    }
    std::cout << "Exported analytics to " << outPath.toStdString() << "\n";
    return 0;
}

int NudgeCli::runMetrics(const QStringList &args)
{
    Q_UNUSED(args);
    const nlohmann::json payload = m_scheduler->refreshDeliveryMetrics();
    std::cout << dumpJson(payload, 2) << std::endl;
    return 0;
}

} // namespace nudge
