#include <QtTest/QtTest>

#include <QSignalSpy>
#include <QTemporaryDir>

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/time_utils.hpp"
#include "engine/campaign_scheduler.hpp"
#include "engine/delivery_time_optimizer.hpp"
#include "engine/nudge_store.hpp"
#include "engine/personalization_engine.hpp"
#include "fake_delivery_gateway.hpp"

namespace {

using nudge::TimePoint;

TimePoint todayAt(int hour, int minute = 0)
{
    return nudge::atLocalTime(std::chrono::system_clock::now(), hour, minute);
}

nudge::ScheduleItem item(const std::string &templateId,
                         int offsetDays,
                         std::optional<std::string> preferredTime)
{
    nudge::ScheduleItem scheduleItem;
    scheduleItem.templateId = templateId;
    scheduleItem.offsetDays = offsetDays;
    scheduleItem.preferredTime = std::move(preferredTime);
    return scheduleItem;
}

nudge::Campaign campaign(const std::string &id, TimePoint start, TimePoint end)
{
    nudge::Campaign result;
    result.id = id;
    result.name = "Test " + id;
    result.startDate = start;
    result.endDate = end;
    return result;
}

bool startsWith(const std::string &value, const std::string &prefix)
{
    return value.rfind(prefix, 0) == 0;
}

// Scheduler plus its collaborators over one database file.
struct Fixture {
    explicit Fixture(const std::string &dbPath)
        : now(std::make_shared<TimePoint>(todayAt(8)))
        , store(dbPath)
        , personalizer(99)
        , optimizer(clock())
    {
        scheduler = std::make_unique<nudge::CampaignScheduler>(
            store, gateway, personalizer, optimizer, clock());
    }

    nudge::Clock clock() const
    {
        auto instant = now;
        return [instant] { return *instant; };
    }

    std::shared_ptr<TimePoint> now;
    nudge::NudgeStore store;
    FakeDeliveryGateway gateway;
    nudge::PersonalizationEngine personalizer;
    nudge::DeliveryTimeOptimizer optimizer;
    std::unique_ptr<nudge::CampaignScheduler> scheduler;
};

} // namespace

class CampaignSchedulerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testDefaultTemplatesInstalled();
    void testValidationRejectsReversedDates();
    void testValidationRejectsUnknownTemplate();
    void testDuplicateIdRejected();
    void testScheduledAtPreferredTime();
    void testPastItemSkipped();
    void testMalformedTimeUsesOffsetOnly();
    void testRejectedItemDropped();
    void testCancelCampaign();
    void testCancelUnknownCampaign();
    void testPauseAndResume();
    void testResumeSkipsRemovedTemplate();
    void testCompleteExpiredCampaigns();
    void testStatePersisted();
    void testGeneratePersonalizedNotification();
    void testWelcomeCampaign();
    void testDailyReminderCampaign();
    void testRefreshDeliveryMetrics();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    int m_dbCounter = 0;

    std::string nextDbPath();
};

void CampaignSchedulerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void CampaignSchedulerTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::string CampaignSchedulerTests::nextDbPath()
{
    ++m_dbCounter;
    return m_tempDir.filePath(QStringLiteral("scheduler-%1.db").arg(m_dbCounter)).toStdString();
}

void CampaignSchedulerTests::testDefaultTemplatesInstalled()
{
    Fixture fx(nextDbPath());
    QCOMPARE(static_cast<int>(fx.scheduler->templates().size()), 10);
    QVERIFY(fx.scheduler->findTemplate("welcome_day1").has_value());
    QVERIFY(!fx.scheduler->findTemplate("missing").has_value());
    QVERIFY(fx.store.loadBlob(nudge::store_keys::kTemplates).has_value());
    QVERIFY(fx.scheduler->campaigns().empty());
    QVERIFY(!fx.scheduler->profile().has_value());
}

void CampaignSchedulerTests::testValidationRejectsReversedDates()
{
    Fixture fx(nextDbPath());
    QSignalSpy changed(fx.scheduler.get(), &nudge::CampaignScheduler::campaignsChanged);

    auto bad = campaign("reversed", todayAt(9), todayAt(8));
    bad.schedule.push_back(item("welcome_day1", 0, std::string("10:00")));

    QVERIFY(!fx.scheduler->validateCampaign(bad));
    QVERIFY(!fx.scheduler->createCampaign(bad));
    QVERIFY(fx.scheduler->campaigns().empty());
    QVERIFY(fx.gateway.scheduled.empty());
    QVERIFY(!fx.store.loadBlob(nudge::store_keys::kCampaigns).has_value());
    QCOMPARE(changed.count(), 0);
}

void CampaignSchedulerTests::testValidationRejectsUnknownTemplate()
{
    Fixture fx(nextDbPath());

    auto bad = campaign("unknown", todayAt(8), nudge::addLocalDays(todayAt(8), 2));
    bad.schedule.push_back(item("welcome_day1", 0, std::string("10:00")));
    bad.schedule.push_back(item("no_such_template", 1, std::nullopt));

    QVERIFY(!fx.scheduler->validateCampaign(bad));
    QVERIFY(!fx.scheduler->createCampaign(bad));
    QVERIFY(fx.scheduler->campaigns().empty());
    QVERIFY(fx.gateway.scheduled.empty());
}

void CampaignSchedulerTests::testDuplicateIdRejected()
{
    Fixture fx(nextDbPath());
    *fx.now = todayAt(8);

    auto first = campaign("twice", todayAt(8), nudge::addLocalDays(todayAt(8), 3));
    first.schedule.push_back(item("welcome_day1", 0, std::string("10:00")));
    first.schedule.push_back(item("welcome_day3", 2, std::string("14:00")));
    QVERIFY(fx.scheduler->createCampaign(first));
    const auto armed = fx.scheduler->findCampaign("twice")->scheduledNotificationIds;
    QCOMPARE(static_cast<int>(armed.size()), 2);

    QSignalSpy changed(fx.scheduler.get(), &nudge::CampaignScheduler::campaignsChanged);
    auto second = campaign("twice", todayAt(8), nudge::addLocalDays(todayAt(8), 3));
    second.name = "Replacement";
    second.schedule.push_back(item("welcome_day1", 0, std::string("11:00")));
    QVERIFY(!fx.scheduler->validateCampaign(second));
    QVERIFY(!fx.scheduler->createCampaign(second));
    QCOMPARE(changed.count(), 0);
    QCOMPARE(static_cast<int>(fx.gateway.scheduled.size()), 2);
    QCOMPARE(static_cast<int>(fx.scheduler->campaigns().size()), 1);
    QCOMPARE(QString::fromStdString(fx.scheduler->findCampaign("twice")->name),
             QStringLiteral("Test twice"));

    // Cancelling still reaches every notification the first creation armed.
    fx.scheduler->cancelCampaign("twice");
    for (const auto &id : armed) {
        QVERIFY(std::find(fx.gateway.cancelled.begin(), fx.gateway.cancelled.end(), id)
                != fx.gateway.cancelled.end());
    }
}

void CampaignSchedulerTests::testScheduledAtPreferredTime()
{
    Fixture fx(nextDbPath());
    *fx.now = todayAt(8);

    int scheduledSignals = 0;
    nudge::NotificationType scheduledType = nudge::NotificationType::System;
    connect(fx.scheduler.get(), &nudge::CampaignScheduler::notificationScheduled, this,
            [&](const nudge::NotificationRequest &, nudge::NotificationType type, bool) {
                ++scheduledSignals;
                scheduledType = type;
            });

    auto c = campaign("morning", todayAt(8), nudge::addLocalDays(todayAt(8), 1));
    c.schedule.push_back(item("welcome_day1", 0, std::string("10:00")));

    QVERIFY(fx.scheduler->createCampaign(c));
    QCOMPARE(static_cast<int>(fx.gateway.scheduled.size()), 1);

    const auto &request = fx.gateway.scheduled.front();
    QCOMPARE(request.deliverAt, todayAt(10));
    QCOMPARE(QString::fromStdString(request.category), QStringLiteral("GENERAL"));
    QVERIFY(startsWith(request.id, "campaign_morning_welcome_day1_"));

    const auto stored = fx.scheduler->findCampaign("morning");
    QVERIFY(stored.has_value());
    QVERIFY(stored->status == nudge::CampaignStatus::Active);
    QCOMPARE(static_cast<int>(stored->scheduledNotificationIds.size()), 1);
    QCOMPARE(QString::fromStdString(stored->scheduledNotificationIds.front()),
             QString::fromStdString(request.id));

    QCOMPARE(scheduledSignals, 1);
    QVERIFY(scheduledType == nudge::NotificationType::Welcome);
}

void CampaignSchedulerTests::testPastItemSkipped()
{
    Fixture fx(nextDbPath());
    *fx.now = todayAt(11);

    auto c = campaign("late", todayAt(11), nudge::addLocalDays(todayAt(11), 1));
    c.schedule.push_back(item("welcome_day1", 0, std::string("10:00")));

    QVERIFY(fx.scheduler->createCampaign(c));
    QVERIFY(fx.gateway.scheduled.empty());

    const auto stored = fx.scheduler->findCampaign("late");
    QVERIFY(stored.has_value());
    QVERIFY(stored->status == nudge::CampaignStatus::Active);
    QVERIFY(stored->scheduledNotificationIds.empty());
}

void CampaignSchedulerTests::testMalformedTimeUsesOffsetOnly()
{
    Fixture fx(nextDbPath());
    *fx.now = todayAt(7);

    const TimePoint start = todayAt(8, 15);
    auto c = campaign("malformed", start, nudge::addLocalDays(start, 3));
    c.schedule.push_back(item("breathing_reminder", 1, std::string("quarter past")));
    c.schedule.push_back(item("breathing_reminder", 2, std::string("24:00")));

    QVERIFY(fx.scheduler->createCampaign(c));
    QCOMPARE(static_cast<int>(fx.gateway.scheduled.size()), 2);
    QCOMPARE(fx.gateway.scheduled[0].deliverAt, nudge::addLocalDays(start, 1));
    QCOMPARE(fx.gateway.scheduled[1].deliverAt, nudge::addLocalDays(start, 2));
}

void CampaignSchedulerTests::testRejectedItemDropped()
{
    Fixture fx(nextDbPath());
    *fx.now = todayAt(8);
    fx.gateway.rejectTemplateIds.insert("welcome_day3");

    auto c = campaign("partial", todayAt(8), nudge::addLocalDays(todayAt(8), 7));
    c.schedule.push_back(item("welcome_day1", 0, std::string("10:00")));
    c.schedule.push_back(item("welcome_day3", 2, std::string("14:00")));

    QVERIFY(fx.scheduler->createCampaign(c));
    QCOMPARE(static_cast<int>(fx.gateway.rejected.size()), 1);

    const auto stored = fx.scheduler->findCampaign("partial");
    QVERIFY(stored.has_value());
    QVERIFY(stored->status == nudge::CampaignStatus::Active);
    QCOMPARE(static_cast<int>(stored->scheduledNotificationIds.size()), 1);
    QVERIFY(startsWith(stored->scheduledNotificationIds.front(), "campaign_partial_welcome_day1_"));
}

void CampaignSchedulerTests::testCancelCampaign()
{
    Fixture fx(nextDbPath());
    *fx.now = todayAt(8);

    auto c = campaign("cancel-me", todayAt(8), nudge::addLocalDays(todayAt(8), 7));
    c.schedule.push_back(item("welcome_day1", 0, std::string("10:00")));
    c.schedule.push_back(item("welcome_day3", 2, std::string("14:00")));
    QVERIFY(fx.scheduler->createCampaign(c));

    const auto ids = fx.scheduler->findCampaign("cancel-me")->scheduledNotificationIds;
    QCOMPARE(static_cast<int>(ids.size()), 2);

    fx.scheduler->cancelCampaign("cancel-me");
    QCOMPARE(static_cast<int>(fx.gateway.cancelled.size()), 2);
    QCOMPARE(QString::fromStdString(fx.gateway.cancelled[0]), QString::fromStdString(ids[0]));
    QCOMPARE(QString::fromStdString(fx.gateway.cancelled[1]), QString::fromStdString(ids[1]));
    QVERIFY(fx.scheduler->findCampaign("cancel-me")->status == nudge::CampaignStatus::Cancelled);

    // Cancelling again is a no-op.
    fx.scheduler->cancelCampaign("cancel-me");
    QCOMPARE(static_cast<int>(fx.gateway.cancelled.size()), 2);
}

void CampaignSchedulerTests::testCancelUnknownCampaign()
{
    Fixture fx(nextDbPath());
    QSignalSpy changed(fx.scheduler.get(), &nudge::CampaignScheduler::campaignsChanged);

    fx.scheduler->cancelCampaign("does-not-exist");
    QVERIFY(fx.gateway.cancelled.empty());
    QVERIFY(fx.scheduler->campaigns().empty());
    QCOMPARE(changed.count(), 0);
}

void CampaignSchedulerTests::testPauseAndResume()
{
    Fixture fx(nextDbPath());
    *fx.now = todayAt(8);

    auto c = campaign("pausable", todayAt(8), nudge::addLocalDays(todayAt(8), 7));
    c.schedule.push_back(item("welcome_day1", 0, std::string("10:00")));
    c.schedule.push_back(item("welcome_day3", 2, std::string("14:00")));
    QVERIFY(fx.scheduler->createCampaign(c));
    QCOMPARE(static_cast<int>(fx.gateway.scheduled.size()), 2);

    QVERIFY(!fx.scheduler->resumeCampaign("pausable"));
    QVERIFY(fx.scheduler->pauseCampaign("pausable"));
    QCOMPARE(static_cast<int>(fx.gateway.cancelled.size()), 2);

    auto paused = fx.scheduler->findCampaign("pausable");
    QVERIFY(paused->status == nudge::CampaignStatus::Paused);
    QVERIFY(paused->scheduledNotificationIds.empty());
    QVERIFY(!fx.scheduler->pauseCampaign("pausable"));

    // The day-one item has passed by the time the campaign resumes.
    *fx.now = todayAt(12);
    QVERIFY(fx.scheduler->resumeCampaign("pausable"));
    QCOMPARE(static_cast<int>(fx.gateway.scheduled.size()), 3);

    const auto resumed = fx.scheduler->findCampaign("pausable");
    QVERIFY(resumed->status == nudge::CampaignStatus::Active);
    QCOMPARE(static_cast<int>(resumed->scheduledNotificationIds.size()), 1);
    QVERIFY(startsWith(resumed->scheduledNotificationIds.front(),
                       "campaign_pausable_welcome_day3_"));

    // Paused campaigns can still be cancelled.
    QVERIFY(fx.scheduler->pauseCampaign("pausable"));
    fx.scheduler->cancelCampaign("pausable");
    QVERIFY(fx.scheduler->findCampaign("pausable")->status == nudge::CampaignStatus::Cancelled);
}

void CampaignSchedulerTests::testResumeSkipsRemovedTemplate()
{
    Fixture fx(nextDbPath());
    *fx.now = todayAt(8);

    auto c = campaign("shrinking", todayAt(8), nudge::addLocalDays(todayAt(8), 7));
    c.schedule.push_back(item("welcome_day1", 1, std::string("10:00")));
    c.schedule.push_back(item("welcome_day3", 2, std::string("14:00")));
    QVERIFY(fx.scheduler->createCampaign(c));
    QVERIFY(fx.scheduler->pauseCampaign("shrinking"));

    std::vector<nudge::NotificationTemplate> kept;
    for (const auto &tmpl : fx.scheduler->templates()) {
        if (tmpl.id != "welcome_day1") {
            kept.push_back(tmpl);
        }
    }
    fx.scheduler->replaceTemplates(kept);

    QVERIFY(fx.scheduler->resumeCampaign("shrinking"));
    const auto resumed = fx.scheduler->findCampaign("shrinking");
    QCOMPARE(static_cast<int>(resumed->scheduledNotificationIds.size()), 1);
    QVERIFY(startsWith(resumed->scheduledNotificationIds.front(),
                       "campaign_shrinking_welcome_day3_"));
    // The stored schedule keeps both items.
    QCOMPARE(static_cast<int>(resumed->schedule.size()), 2);
}

void CampaignSchedulerTests::testCompleteExpiredCampaigns()
{
    Fixture fx(nextDbPath());
    *fx.now = todayAt(8);

    auto shortCampaign = campaign("short", todayAt(8), todayAt(20));
    auto longCampaign = campaign("long", todayAt(8), nudge::addLocalDays(todayAt(8), 5));
    QVERIFY(fx.scheduler->createCampaign(shortCampaign));
    QVERIFY(fx.scheduler->createCampaign(longCampaign));

    QCOMPARE(fx.scheduler->completeExpiredCampaigns(), 0);

    *fx.now = nudge::addLocalDays(todayAt(8), 1);
    QCOMPARE(fx.scheduler->completeExpiredCampaigns(), 1);
    QVERIFY(fx.scheduler->findCampaign("short")->status == nudge::CampaignStatus::Completed);
    QVERIFY(fx.scheduler->findCampaign("long")->status == nudge::CampaignStatus::Active);

    // Completed campaigns are terminal.
    fx.scheduler->cancelCampaign("short");
    QVERIFY(fx.scheduler->findCampaign("short")->status == nudge::CampaignStatus::Completed);
}

void CampaignSchedulerTests::testStatePersisted()
{
    const std::string path = nextDbPath();
    {
        Fixture fx(path);
        *fx.now = todayAt(8);

        nudge::PersonalizationProfile profile;
        profile.userName = "Ada";
        profile.preferredReminderTime = "07:15";
        fx.scheduler->updatePersonalizationProfile(profile);

        auto c = campaign("kept", todayAt(8), nudge::addLocalDays(todayAt(8), 2));
        c.schedule.push_back(item("welcome_day1", 0, std::string("10:00")));
        QVERIFY(fx.scheduler->createCampaign(c));
    }

    Fixture reopened(path);
    const auto kept = reopened.scheduler->findCampaign("kept");
    QVERIFY(kept.has_value());
    QVERIFY(kept->status == nudge::CampaignStatus::Active);
    QCOMPARE(static_cast<int>(kept->scheduledNotificationIds.size()), 1);
    QCOMPARE(static_cast<int>(kept->schedule.size()), 1);

    const auto profile = reopened.scheduler->profile();
    QVERIFY(profile.has_value());
    QCOMPARE(QString::fromStdString(profile->userName.value_or("")), QStringLiteral("Ada"));
    QCOMPARE(QString::fromStdString(profile->preferredReminderTime), QStringLiteral("07:15"));
}

void CampaignSchedulerTests::testGeneratePersonalizedNotification()
{
    Fixture fx(nextDbPath());
    *fx.now = todayAt(8);

    nudge::PersonalizationProfile profile;
    profile.preferredReminderTime = "09:30";
    profile.preferredSessionDuration = 12;
    fx.scheduler->updatePersonalizationProfile(profile);

    QVERIFY(!fx.scheduler->generatePersonalizedNotification("missing").has_value());

    const auto request = fx.scheduler->generatePersonalizedNotification("daily_meditation");
    QVERIFY(request.has_value());
    QVERIFY(startsWith(request->id, "generated_daily_meditation_"));
    QVERIFY(request->body.find("12 minutes") != std::string::npos);
    QCOMPARE(QString::fromStdString(request->category), QStringLiteral("REMINDER"));
    QCOMPARE(request->deliverAt, todayAt(9));

    const auto other = fx.scheduler->generatePersonalizedNotification("daily_meditation");
    QVERIFY(other.has_value());
    QVERIFY(other->id != request->id);

    QVERIFY(fx.gateway.scheduled.empty());
    QVERIFY(fx.scheduler->campaigns().empty());
}

void CampaignSchedulerTests::testWelcomeCampaign()
{
    Fixture fx(nextDbPath());
    *fx.now = todayAt(8);

    QVERIFY(fx.scheduler->createWelcomeCampaign());
    const auto campaigns = fx.scheduler->campaigns();
    QCOMPARE(static_cast<int>(campaigns.size()), 1);

    const auto &welcome = campaigns.front();
    QVERIFY(startsWith(welcome.id, "welcome_series_"));
    QCOMPARE(welcome.endDate, nudge::addLocalDays(todayAt(8), 7));
    QCOMPARE(static_cast<int>(welcome.schedule.size()), 3);
    QCOMPARE(static_cast<int>(welcome.scheduledNotificationIds.size()), 3);

    QCOMPARE(static_cast<int>(fx.gateway.scheduled.size()), 3);
    QCOMPARE(fx.gateway.scheduled[0].deliverAt, todayAt(10));
    QCOMPARE(fx.gateway.scheduled[1].deliverAt, nudge::addLocalDays(todayAt(14), 2));
    QCOMPARE(fx.gateway.scheduled[2].deliverAt, nudge::addLocalDays(todayAt(9), 3));
    QVERIFY(fx.gateway.scheduled[2].body.find("5 minutes") != std::string::npos);
}

void CampaignSchedulerTests::testDailyReminderCampaign()
{
    Fixture fx(nextDbPath());
    *fx.now = todayAt(6);

    nudge::PersonalizationProfile profile;
    profile.preferredReminderTime = "07:00";
    profile.preferredSessionDuration = 20;
    fx.scheduler->updatePersonalizationProfile(profile);

    QVERIFY(!fx.scheduler->createDailyReminderCampaign(0));
    QVERIFY(fx.scheduler->campaigns().empty());

    QVERIFY(fx.scheduler->createDailyReminderCampaign(3));
    const auto reminders = fx.scheduler->campaigns().front();
    QVERIFY(startsWith(reminders.id, "daily_reminders_"));
    QCOMPARE(static_cast<int>(reminders.schedule.size()), 3);
    QCOMPARE(static_cast<int>(reminders.scheduledNotificationIds.size()), 3);

    for (int day = 0; day < 3; ++day) {
        QCOMPARE(fx.gateway.scheduled[day].deliverAt, nudge::addLocalDays(todayAt(7), day));
        QVERIFY(fx.gateway.scheduled[day].body.find("20 minutes") != std::string::npos);
    }
}

void CampaignSchedulerTests::testRefreshDeliveryMetrics()
{
    Fixture fx(nextDbPath());
    QSignalSpy changed(fx.scheduler.get(), &nudge::CampaignScheduler::deliveryMetricsChanged);

    const auto empty = fx.scheduler->refreshDeliveryMetrics();
    QCOMPARE(empty.totalSent, 0);
    QCOMPARE(empty.deliveryRate, 0.0);

    for (int i = 0; i < 3; ++i) {
        fx.gateway.delivered.push_back(nudge::DeliveredNotification{
            "d" + std::to_string(i), "t", "b", todayAt(7), "GENERAL"});
    }
    fx.gateway.pending.push_back(nudge::PendingNotification{"p0", "t", "b", todayAt(9), "GENERAL"});

    const auto metrics = fx.scheduler->refreshDeliveryMetrics();
    QCOMPARE(metrics.totalSent, 4);
    QCOMPARE(metrics.totalDelivered, 3);
    QCOMPARE(metrics.totalPending, 1);
    QCOMPARE(metrics.deliveryRate, 0.75);
    QVERIFY(fx.scheduler->deliveryMetrics().has_value());
    QCOMPARE(changed.count(), 2);
}

QTEST_MAIN(CampaignSchedulerTests)
#include "test_campaign_scheduler.moc"
