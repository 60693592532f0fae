#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include <optional>
#include <string>

namespace tidemark {

// Keys persisted in sync_state
namespace settings_key {
    inline constexpr const char* last_pulled_server_seq = "lastPulledServerSeq";
    inline constexpr const char* last_sync_at = "lastSyncAt";
    inline constexpr const char* last_applied_at = "lastAppliedAt";
    inline constexpr const char* schema_json = "diagnostics.schemaJson";
    inline constexpr const char* schema_fetched_at = "diagnostics.schemaLastFetchedAt";
    inline constexpr const char* diagnostics_sent_at = "diagnostics.lastSentAt";
    inline constexpr const char* last_full_pull_duration_ms = "sync.lastFullPullDurationMs";
    inline constexpr const char* client_id = "clientId";
    inline constexpr const char* api_base_url = "apiBaseUrl";
}

// ============================================================================
// settings_store - string key/value rows in the local database
// ============================================================================

class settings_store {
public:
    explicit settings_store(database& db);

    std::optional<std::string> get(const std::string& key);
    void set(const std::string& key, const std::string& value);
    void remove(const std::string& key);

    /// Integer view of a value; nullopt when missing or not a number
    std::optional<int64_t> get_number(const std::string& key);
    void set_number(const std::string& key, int64_t value);

    /// Stable client id, generated on first use
    std::string client_id();

private:
    database& db_;
};

} // namespace tidemark

#endif // __cplusplus
