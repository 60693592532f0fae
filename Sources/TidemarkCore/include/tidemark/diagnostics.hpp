#pragma once

#ifdef __cplusplus

#include "auth.hpp"
#include "config.hpp"
#include "local_store.hpp"
#include "settings.hpp"
#include <array>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace tidemark {

// Tables and entity-type codes summarised in consistency reports
inline constexpr std::array<sync_table, 5> monitored_tables = {
    sync_table::entity_types, sync_table::entities, sync_table::attribute_defs,
    sync_table::attribute_values, sync_table::operations,
};

inline constexpr std::array<const char*, 6> watched_type_codes = {
    "engine", "engine_brand", "part", "contract", "customer", "employee",
};

// Attribute codes tried in order to label a sample entity
inline constexpr std::array<const char*, 4> label_attribute_codes = {
    "name", "number", "engine_number", "full_name",
};

inline constexpr size_t max_diagnostic_samples = 5;

/// md5 hex of "<count>|<max>|<sum>", absent values written as ""
std::string digest_checksum(int64_t count, std::optional<int64_t> max_updated_at,
                            std::optional<int64_t> sum_updated_at);

// ============================================================================
// diagnostics_reporter - periodic consistency snapshot for the server
// ============================================================================

class diagnostics_reporter {
public:
    diagnostics_reporter(local_store& store, settings_store& settings, auth_gateway& auth,
                         const sync_config& config);

    /// {"tables": {...}, "entityTypes": {...}} over live (non-tombstoned) rows
    nlohmann::json build_snapshot();

    /// Sends a snapshot when the report interval has elapsed. Returns true
    /// when one was accepted; failures are logged and never thrown.
    bool maybe_report(const std::string& client_id, int64_t server_cursor, const std::string& sync_run_id);

private:
    nlohmann::json summarize(const std::string& from_where, const std::vector<column_value_t>& params);
    nlohmann::json pending_samples(const std::string& type_id);

    local_store& store_;
    settings_store& settings_;
    auth_gateway& auth_;
    const sync_config& config_;
};

} // namespace tidemark

#endif // __cplusplus
