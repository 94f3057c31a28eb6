#pragma once

#include <memory>

#include <QString>
#include <QStringList>

#include "common/time_utils.hpp"
#include "engine/engine_config.hpp"

namespace nudge {

class NudgeStore;
class SpoolDeliveryGateway;
class PersonalizationEngine;
class DeliveryTimeOptimizer;
class CampaignScheduler;
class AnalyticsEngine;

class NudgeCli
{
public:
    explicit NudgeCli(Clock clock = systemClock());
    ~NudgeCli();

    // CLI dispatcher for campaign, tracking and analytics commands.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    // Opens the store and wires the engine components. Returns false if the
    // database cannot be opened.
    bool openEngine();

    int runTemplates(const QStringList &args);
    int runCampaigns(const QStringList &args);
    int runWelcome(const QStringList &args);
    int runReminders(const QStringList &args);
    int runCancel(const QStringList &args);
    int runPause(const QStringList &args);
    int runResume(const QStringList &args);
    int runRender(const QStringList &args);
    int runProfile(const QStringList &args);
    int runTrack(const QStringList &args);
    int runAnalytics(const QStringList &args);
    int runExport(const QStringList &args);
    int runMetrics(const QStringList &args);

    Clock m_clock;
    EngineConfig m_config;
    std::unique_ptr<NudgeStore> m_store;
    std::unique_ptr<SpoolDeliveryGateway> m_gateway;
    std::unique_ptr<PersonalizationEngine> m_personalizer;
    std::unique_ptr<DeliveryTimeOptimizer> m_optimizer;
    std::unique_ptr<CampaignScheduler> m_scheduler;
    std::unique_ptr<AnalyticsEngine> m_analytics;
};

} // namespace nudge
