#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "engine/engine_config.hpp"

class ConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void cleanup();
    void testDefaults();
    void testApplyConfigJson();
    void testInvalidJsonValuesSkipped();
    void testConfigFileAndEnvironment();
    void testInvalidEnvironmentIgnored();
    void testCommandLine();
    void testLoggingSettings();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

namespace {

const char *const kEnvNames[] = {
    "NUDGE_CONFIG",
    "NUDGE_DB_PATH",
    "NUDGE_ANALYTICS_INTERVAL_MS",
    "NUDGE_MAX_EVENTS",
    "NUDGE_TRACE",
    "NUDGE_RANDOM_SEED",
    "NUDGE_LOG_DIR",
    "NUDGE_LOG_LEVEL",
};

} // namespace

void ConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ConfigTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ConfigTests::cleanup()
{
    for (const char *name : kEnvNames) {
        qunsetenv(name);
    }
}

void ConfigTests::testDefaults()
{
    const auto config = nudge::loadEngineConfig();
    QCOMPARE(QString::fromStdString(config.databasePath),
             m_tempDir.path() + QStringLiteral("/.local/share/nudge/nudge.db"));
    QCOMPARE(config.analyticsIntervalMs, 300000);
    QCOMPARE(static_cast<int>(config.maxEventsHistory), 1000);
    QCOMPARE(static_cast<int>(config.exportEventLimit), 100);
    QVERIFY(!config.traceEnabled);
    QVERIFY(!config.randomSeed.has_value());
}

void ConfigTests::testApplyConfigJson()
{
    nudge::EngineConfig config;
    nudge::applyConfigJson(config, nlohmann::json{
        {"databasePath", "/tmp/custom.db"},
        {"analyticsIntervalMs", 1500},
        {"maxEventsHistory", 50},
        {"exportEventLimit", 0},
        {"trace", true},
        {"randomSeed", 99},
    });

    QCOMPARE(QString::fromStdString(config.databasePath), QStringLiteral("/tmp/custom.db"));
    QCOMPARE(config.analyticsIntervalMs, 1500);
    QCOMPARE(static_cast<int>(config.maxEventsHistory), 50);
    QCOMPARE(static_cast<int>(config.exportEventLimit), 0);
    QVERIFY(config.traceEnabled);
    QVERIFY(config.randomSeed == uint64_t{99});
}

void ConfigTests::testInvalidJsonValuesSkipped()
{
    nudge::EngineConfig config;
    config.databasePath = "/keep.db";
    nudge::applyConfigJson(config, nlohmann::json{
        {"databasePath", ""},
        {"analyticsIntervalMs", -5},
        {"maxEventsHistory", "many"},
        {"trace", "yes"},
        {"randomSeed", -1},
    });

    QCOMPARE(QString::fromStdString(config.databasePath), QStringLiteral("/keep.db"));
    QCOMPARE(config.analyticsIntervalMs, 300000);
    QCOMPARE(static_cast<int>(config.maxEventsHistory), 1000);
    QVERIFY(!config.traceEnabled);
    QVERIFY(!config.randomSeed.has_value());

    // Non-object documents are ignored.
    nudge::applyConfigJson(config, nlohmann::json::array());
    QCOMPARE(QString::fromStdString(config.databasePath), QStringLiteral("/keep.db"));
}

void ConfigTests::testConfigFileAndEnvironment()
{
    const QString configPath = m_tempDir.path() + QStringLiteral("/nudge.json");
    QFile file(configPath);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(R"({"databasePath": "/from/file.db", "analyticsIntervalMs": 2000, "maxEventsHistory": 10})");
    file.close();

    qputenv("NUDGE_CONFIG", configPath.toUtf8());
    qputenv("NUDGE_MAX_EVENTS", "25");
    qputenv("NUDGE_TRACE", "1");
    qputenv("NUDGE_RANDOM_SEED", "7");

    auto config = nudge::loadEngineConfig();
    QCOMPARE(QString::fromStdString(config.databasePath), QStringLiteral("/from/file.db"));
    QCOMPARE(config.analyticsIntervalMs, 2000);
    QCOMPARE(static_cast<int>(config.maxEventsHistory), 25);
    QVERIFY(config.traceEnabled);
    QVERIFY(config.randomSeed == uint64_t{7});

    // The environment wins over the file.
    qputenv("NUDGE_DB_PATH", "/from/env.db");
    config = nudge::loadEngineConfig();
    QCOMPARE(QString::fromStdString(config.databasePath), QStringLiteral("/from/env.db"));
}

void ConfigTests::testInvalidEnvironmentIgnored()
{
    qputenv("NUDGE_CONFIG", (m_tempDir.path() + QStringLiteral("/missing.json")).toUtf8());
    qputenv("NUDGE_ANALYTICS_INTERVAL_MS", "soon");
    qputenv("NUDGE_MAX_EVENTS", "0");
    qputenv("NUDGE_RANDOM_SEED", "abc");

    const auto config = nudge::loadEngineConfig();
    QCOMPARE(config.analyticsIntervalMs, 300000);
    QCOMPARE(static_cast<int>(config.maxEventsHistory), 1000);
    QVERIFY(!config.randomSeed.has_value());
}

void ConfigTests::testCommandLine()
{
    nudge::EngineConfig config;
    const QStringList remaining = nudge::applyCommandLine(
        config,
        {QStringLiteral("nudge-cli"), QStringLiteral("--db"), QStringLiteral("/cli.db"),
         QStringLiteral("track"), QStringLiteral("--trace"), QStringLiteral("opened")});

    QCOMPARE(QString::fromStdString(config.databasePath), QStringLiteral("/cli.db"));
    QVERIFY(config.traceEnabled);
    QCOMPARE(remaining,
             QStringList({QStringLiteral("nudge-cli"), QStringLiteral("track"), QStringLiteral("opened")}));

    // A trailing --db without a value is passed through.
    nudge::EngineConfig untouched;
    const QStringList dangling = nudge::applyCommandLine(untouched, {QStringLiteral("--db")});
    QCOMPARE(dangling, QStringList({QStringLiteral("--db")}));
    QVERIFY(untouched.databasePath.empty());
}

void ConfigTests::testLoggingSettings()
{
    nudge::EngineConfig config;
    QVERIFY(config.logLevel == nudge::logging::LogLevel::Info);
    nudge::applyConfigJson(config, nlohmann::json{{"logLevel", "error"}, {"logDirectory", "/var/tmp/nudge"}});
    QVERIFY(config.logLevel == nudge::logging::LogLevel::Error);
    QCOMPARE(QString::fromStdString(config.logDirectory), QStringLiteral("/var/tmp/nudge"));

    nudge::applyConfigJson(config, nlohmann::json{{"logLevel", "loud"}});
    QVERIFY(config.logLevel == nudge::logging::LogLevel::Error);

    qputenv("NUDGE_LOG_LEVEL", "debug");
    qputenv("NUDGE_LOG_DIR", "/tmp/nudge-logs");
    qputenv("NUDGE_TRACE", "1");
    const auto loaded = nudge::loadEngineConfig();
    QVERIFY(loaded.logLevel == nudge::logging::LogLevel::Debug);

    const auto options = nudge::loggingOptionsFor(loaded, QStringLiteral("nudge-cli"));
    QCOMPARE(options.processName, QStringLiteral("nudge-cli"));
    QCOMPARE(options.directory, QStringLiteral("/tmp/nudge-logs"));
    QVERIFY(options.traceEnabled);
    QVERIFY(options.minimumLevel == nudge::logging::LogLevel::Debug);
}

QTEST_MAIN(ConfigTests)
#include "test_config.moc"
