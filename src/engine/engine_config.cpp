#include "engine/engine_config.hpp"

#include <QFile>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace nudge {

namespace {

void warnInvalid(const QString &where, const std::string &key, const std::string &value)
{
    NLOG_WARN(QStringLiteral("EngineConfig"),
              where,
              QStringLiteral("config_value_ignored"),
              QStringLiteral("invalid_value"),
              QStringLiteral("keep_previous"),
              nudge::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"key", key}, {"value", value}}));
}

std::optional<long long> parseInteger(const QString &value)
{
    bool ok = false;
    const long long parsed = value.trimmed().toLongLong(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return parsed;
}

nlohmann::json readConfigFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        NLOG_WARN(QStringLiteral("EngineConfig"),
                  QStringLiteral("readConfigFile"),
                  QStringLiteral("config_file_unreadable"),
                  QStringLiteral("open_failed"),
                  QStringLiteral("use_defaults"),
                  nudge::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"path", path.toStdString()}}));
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(file.readAll().toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        NLOG_WARN(QStringLiteral("EngineConfig"),
                  QStringLiteral("readConfigFile"),
                  QStringLiteral("config_file_invalid"),
                  QStringLiteral("parse_error"),
                  QStringLiteral("use_defaults"),
                  nudge::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"path", path.toStdString()}, {"error", ex.what()}}));
        return nlohmann::json::object();
    }
}

} // namespace

std::string defaultDatabasePath()
{
    const QString home = qEnvironmentVariable("HOME");
    const QString base = home.isEmpty() ? QStringLiteral(".") : home;
    return (base + QStringLiteral("/.local/share/nudge/nudge.db")).toStdString();
}

void applyConfigJson(EngineConfig &config, const nlohmann::json &doc)
{
    if (!doc.is_object()) {
        return;
    }

    if (doc.contains("databasePath")) {
        const auto &value = doc.at("databasePath");
        if (value.is_string() && !value.get<std::string>().empty()) {
            config.databasePath = value.get<std::string>();
        } else {
            warnInvalid(QStringLiteral("applyConfigJson"), "databasePath", dumpJson(value));
        }
    }

    if (doc.contains("analyticsIntervalMs")) {
        const auto &value = doc.at("analyticsIntervalMs");
        if (value.is_number_integer() && value.get<long long>() > 0) {
            config.analyticsIntervalMs = value.get<int>();
        } else {
            warnInvalid(QStringLiteral("applyConfigJson"), "analyticsIntervalMs", dumpJson(value));
        }
    }

    if (doc.contains("maxEventsHistory")) {
        const auto &value = doc.at("maxEventsHistory");
        if (value.is_number_integer() && value.get<long long>() > 0) {
            config.maxEventsHistory = value.get<std::size_t>();
        } else {
            warnInvalid(QStringLiteral("applyConfigJson"), "maxEventsHistory", dumpJson(value));
        }
    }

    if (doc.contains("exportEventLimit")) {
        const auto &value = doc.at("exportEventLimit");
        if (value.is_number_integer() && value.get<long long>() >= 0) {
            config.exportEventLimit = value.get<std::size_t>();
        } else {
            warnInvalid(QStringLiteral("applyConfigJson"), "exportEventLimit", dumpJson(value));
        }
    }

    if (doc.contains("trace")) {
        const auto &value = doc.at("trace");
        if (value.is_boolean()) {
            config.traceEnabled = value.get<bool>();
        } else {
            warnInvalid(QStringLiteral("applyConfigJson"), "trace", dumpJson(value));
        }
    }

    if (doc.contains("logDirectory")) {
        const auto &value = doc.at("logDirectory");
        if (value.is_string()) {
            config.logDirectory = value.get<std::string>();
        } else {
            warnInvalid(QStringLiteral("applyConfigJson"), "logDirectory", dumpJson(value));
        }
    }

    if (doc.contains("logLevel")) {
        const auto &value = doc.at("logLevel");
        const auto level = value.is_string()
            ? logging::parseLogLevel(QString::fromStdString(value.get<std::string>()))
            : std::nullopt;
        if (level.has_value()) {
            config.logLevel = *level;
        } else {
            warnInvalid(QStringLiteral("applyConfigJson"), "logLevel", dumpJson(value));
        }
    }

    if (doc.contains("randomSeed")) {
        const auto &value = doc.at("randomSeed");
        if (value.is_number_unsigned()
            || (value.is_number_integer() && value.get<long long>() >= 0)) {
            config.randomSeed = value.get<uint64_t>();
        } else {
            warnInvalid(QStringLiteral("applyConfigJson"), "randomSeed", dumpJson(value));
        }
    }
}

EngineConfig loadEngineConfig()
{
    EngineConfig config;
    config.databasePath = defaultDatabasePath();

    const QString configPath = qEnvironmentVariable("NUDGE_CONFIG");
    if (!configPath.isEmpty()) {
        applyConfigJson(config, readConfigFile(configPath));
    }

    const QString dbPath = qEnvironmentVariable("NUDGE_DB_PATH");
    if (!dbPath.isEmpty()) {
        config.databasePath = dbPath.toStdString();
    }

    const QString interval = qEnvironmentVariable("NUDGE_ANALYTICS_INTERVAL_MS");
    if (!interval.isEmpty()) {
        const auto parsed = parseInteger(interval);
        if (parsed && *parsed > 0) {
            config.analyticsIntervalMs = static_cast<int>(*parsed);
        } else {
            warnInvalid(QStringLiteral("loadEngineConfig"),
                        "NUDGE_ANALYTICS_INTERVAL_MS", interval.toStdString());
        }
    }

    const QString maxEvents = qEnvironmentVariable("NUDGE_MAX_EVENTS");
    if (!maxEvents.isEmpty()) {
        const auto parsed = parseInteger(maxEvents);
        if (parsed && *parsed > 0) {
            config.maxEventsHistory = static_cast<std::size_t>(*parsed);
        } else {
            warnInvalid(QStringLiteral("loadEngineConfig"),
                        "NUDGE_MAX_EVENTS", maxEvents.toStdString());
        }
    }

    if (qEnvironmentVariableIntValue("NUDGE_TRACE") == 1) {
        config.traceEnabled = true;
    }

    const QString seed = qEnvironmentVariable("NUDGE_RANDOM_SEED");
    if (!seed.isEmpty()) {
        bool ok = false;
        const qulonglong parsed = seed.trimmed().toULongLong(&ok);
        if (ok) {
            config.randomSeed = static_cast<uint64_t>(parsed);
        } else {
            warnInvalid(QStringLiteral("loadEngineConfig"),
                        "NUDGE_RANDOM_SEED", seed.toStdString());
        }
    }

    const QString logDir = qEnvironmentVariable("NUDGE_LOG_DIR");
    if (!logDir.isEmpty()) {
        config.logDirectory = logDir.toStdString();
    }

    const QString logLevel = qEnvironmentVariable("NUDGE_LOG_LEVEL");
    if (!logLevel.isEmpty()) {
        if (const auto level = logging::parseLogLevel(logLevel)) {
            config.logLevel = *level;
        } else {
            warnInvalid(QStringLiteral("loadEngineConfig"),
                        "NUDGE_LOG_LEVEL", logLevel.toStdString());
        }
    }

    return config;
}

logging::LoggingOptions loggingOptionsFor(const EngineConfig &config, const QString &processName)
{
    logging::LoggingOptions options;
    options.processName = processName;
    options.traceEnabled = config.traceEnabled;
    options.directory = QString::fromStdString(config.logDirectory);
    options.minimumLevel = config.logLevel;
    return options;
}

QStringList applyCommandLine(EngineConfig &config, const QStringList &args)
{
    QStringList remaining;
    remaining.reserve(args.size());
    for (int i = 0; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg == QStringLiteral("--trace")) {
            config.traceEnabled = true;
            continue;
        }
        if (arg == QStringLiteral("--db") && i + 1 < args.size()) {
            config.databasePath = args.at(i + 1).toStdString();
            ++i;
            continue;
        }
        remaining.push_back(arg);
    }
    return remaining;
}

} // namespace nudge
