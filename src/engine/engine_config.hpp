#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace nudge {

struct EngineConfig {
    std::string databasePath;
    int analyticsIntervalMs = 300000;
    std::size_t maxEventsHistory = 1000;
    std::size_t exportEventLimit = 100;
    bool traceEnabled = false;
    std::optional<uint64_t> randomSeed;
    // Empty means the logging default under $HOME.
    std::string logDirectory;
    logging::LogLevel logLevel = logging::LogLevel::Info;
};

// $HOME/.local/share/nudge/nudge.db
std::string defaultDatabasePath();

// Applies the keys of a JSON config document on top of `config`. Keys with
// the wrong type or out-of-range values are skipped with a warning.
void applyConfigJson(EngineConfig &config, const nlohmann::json &doc);

// Defaults, then the JSON file named by NUDGE_CONFIG, then NUDGE_* environment
// variables.
EngineConfig loadEngineConfig();

// Logging setup for `processName` derived from `config`.
logging::LoggingOptions loggingOptionsFor(const EngineConfig &config, const QString &processName);

// Consumes --trace and --db PATH from `args` and applies them to `config`.
QStringList applyCommandLine(EngineConfig &config, const QStringList &args);

} // namespace nudge
