#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace nudge {

// NudgeStore is the SQLite access layer for every persisted collection.
// Each collection is one named JSON blob; the engine components own the
// in-memory state and load/save whole blobs.
class NudgeStore {
public:
    // Opens (creating if needed) the database at `databasePath`.
    explicit NudgeStore(const std::string &databasePath);
    ~NudgeStore();

    NudgeStore(const NudgeStore &) = delete;
    NudgeStore &operator=(const NudgeStore &) = delete;

    std::optional<std::string> loadBlob(const std::string &key) const;
    void saveBlob(const std::string &key, const std::string &value);
    void removeBlob(const std::string &key);
    std::vector<std::string> listKeys() const;

    bool integrityCheck(std::string *message) const;

    const std::string &path() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

namespace store_keys {
constexpr const char *kTemplates = "templates";
constexpr const char *kCampaigns = "campaigns";
constexpr const char *kProfile = "profile";
constexpr const char *kEvents = "events";
constexpr const char *kDeliveryRecords = "delivery_records";
constexpr const char *kEngagementRecords = "engagement_records";
constexpr const char *kAnalyticsSummary = "analytics_summary";
constexpr const char *kDeliveryStatistics = "delivery_statistics";
constexpr const char *kEngagementMetrics = "engagement_metrics";
constexpr const char *kDeliveryMetrics = "delivery_metrics";
constexpr const char *kDeliverySpool = "delivery_spool";
} // namespace store_keys

// Decodes blob `key` into `out`. A missing blob, a store error or a decode
// error leaves `out` untouched and returns false; failures are logged.
template <typename T>
bool loadJsonBlob(const NudgeStore &store, const std::string &key, T &out)
{
    try {
        const auto text = store.loadBlob(key);
        if (!text.has_value()) {
            return false;
        }
        T decoded = nlohmann::json::parse(*text).get<T>();
        out = std::move(decoded);
        return true;
    } catch (const std::exception &ex) {
        NLOG_WARN(QStringLiteral("NudgeStore"),
                  QStringLiteral("loadJsonBlob"),
                  QStringLiteral("blob_load_failed"),
                  QStringLiteral("persistence_failure"),
                  QStringLiteral("keep_in_memory_state"),
                  nudge::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"key", key}, {"error", ex.what()}}));
        return false;
    }
}

// Encodes `value` into blob `key`. Failures are logged and leave the
// persisted blob stale.
template <typename T>
bool saveJsonBlob(NudgeStore &store, const std::string &key, const T &value)
{
    try {
        const nlohmann::json doc = value;
        store.saveBlob(key, dumpJson(doc));
        return true;
    } catch (const std::exception &ex) {
        NLOG_WARN(QStringLiteral("NudgeStore"),
                  QStringLiteral("saveJsonBlob"),
                  QStringLiteral("blob_save_failed"),
                  QStringLiteral("persistence_failure"),
                  QStringLiteral("persisted_state_stale"),
                  nudge::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"key", key}, {"error", ex.what()}}));
        return false;
    }
}

} // namespace nudge
