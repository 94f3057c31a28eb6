#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <chrono>
#include <memory>
#include <string>

#include "common/time_utils.hpp"
#include "engine/nudge_store.hpp"
#include "engine/spool_delivery_gateway.hpp"

namespace {

using nudge::TimePoint;

nudge::NotificationRequest request(const std::string &id, TimePoint deliverAt)
{
    nudge::NotificationRequest result;
    result.id = id;
    result.title = "Title " + id;
    result.body = "Body";
    result.category = "GENERAL";
    result.deliverAt = deliverAt;
    return result;
}

// Whole seconds so instants survive the ISO-8601 round trip.
TimePoint baseInstant()
{
    return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
}

} // namespace

class SpoolDeliveryGatewayTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testPendingThenDelivered();
    void testRejectsDuplicateAndEmptyIds();
    void testCancelRemovesEntry();
    void testOldDeliveredEntriesPruned();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    int m_dbCounter = 0;

    std::string nextDbPath();
};

void SpoolDeliveryGatewayTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void SpoolDeliveryGatewayTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::string SpoolDeliveryGatewayTests::nextDbPath()
{
    ++m_dbCounter;
    return m_tempDir.filePath(QStringLiteral("spool-%1.db").arg(m_dbCounter)).toStdString();
}

void SpoolDeliveryGatewayTests::testPendingThenDelivered()
{
    nudge::NudgeStore store(nextDbPath());
    auto now = std::make_shared<TimePoint>(baseInstant());
    nudge::SpoolDeliveryGateway gateway(store, [now] { return *now; });

    QVERIFY(gateway.schedule(request("soon", *now + std::chrono::hours(1))));
    QCOMPARE(static_cast<int>(gateway.listPending().size()), 1);
    QVERIFY(gateway.listDelivered().empty());

    *now += std::chrono::hours(2);
    QVERIFY(gateway.listPending().empty());
    const auto delivered = gateway.listDelivered();
    QCOMPARE(static_cast<int>(delivered.size()), 1);
    QCOMPARE(QString::fromStdString(delivered[0].id), QStringLiteral("soon"));
    QCOMPARE(QString::fromStdString(delivered[0].category), QStringLiteral("GENERAL"));
}

void SpoolDeliveryGatewayTests::testRejectsDuplicateAndEmptyIds()
{
    nudge::NudgeStore store(nextDbPath());
    auto now = std::make_shared<TimePoint>(baseInstant());
    nudge::SpoolDeliveryGateway gateway(store, [now] { return *now; });

    QVERIFY(gateway.schedule(request("once", *now + std::chrono::hours(1))));
    QVERIFY(!gateway.schedule(request("once", *now + std::chrono::hours(3))));
    QVERIFY(!gateway.schedule(request("", *now + std::chrono::hours(1))));
    QCOMPARE(static_cast<int>(gateway.listPending().size()), 1);
}

void SpoolDeliveryGatewayTests::testCancelRemovesEntry()
{
    const std::string path = nextDbPath();
    auto now = std::make_shared<TimePoint>(baseInstant());
    {
        nudge::NudgeStore store(path);
        nudge::SpoolDeliveryGateway gateway(store, [now] { return *now; });
        QVERIFY(gateway.schedule(request("keep", *now + std::chrono::hours(1))));
        QVERIFY(gateway.schedule(request("drop", *now + std::chrono::hours(1))));
        gateway.cancel("drop");
        gateway.cancel("unknown");
    }

    nudge::NudgeStore store(path);
    nudge::SpoolDeliveryGateway reopened(store, [now] { return *now; });
    const auto pending = reopened.listPending();
    QCOMPARE(static_cast<int>(pending.size()), 1);
    QCOMPARE(QString::fromStdString(pending[0].id), QStringLiteral("keep"));
}

void SpoolDeliveryGatewayTests::testOldDeliveredEntriesPruned()
{
    const std::string path = nextDbPath();
    auto now = std::make_shared<TimePoint>(baseInstant());
    {
        nudge::NudgeStore store(path);
        nudge::SpoolDeliveryGateway gateway(store, [now] { return *now; });
        QVERIFY(gateway.schedule(request("old", *now + std::chrono::hours(1))));
        QVERIFY(gateway.schedule(request("recent", *now + std::chrono::hours(24 * 20))));

        // Past the retention window for "old" but not for "recent".
        *now += nudge::SpoolDeliveryGateway::kDeliveredRetention + std::chrono::hours(2);
        QCOMPARE(static_cast<int>(gateway.listDelivered().size()), 2);

        QVERIFY(gateway.schedule(request("next", *now + std::chrono::hours(1))));
        const auto delivered = gateway.listDelivered();
        QCOMPARE(static_cast<int>(delivered.size()), 1);
        QCOMPARE(QString::fromStdString(delivered[0].id), QStringLiteral("recent"));
        QCOMPARE(static_cast<int>(gateway.listPending().size()), 1);
    }

    // The pruned spool is what was persisted.
    nudge::NudgeStore store(path);
    nudge::SpoolDeliveryGateway reopened(store, [now] { return *now; });
    QCOMPARE(static_cast<int>(reopened.listDelivered().size()), 1);
    QCOMPARE(static_cast<int>(reopened.listPending().size()), 1);
}

QTEST_MAIN(SpoolDeliveryGatewayTests)
#include "test_spool_delivery_gateway.moc"
