#pragma once

#ifdef __cplusplus

#include "network.hpp"
#include "schema.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace tidemark {

class config_error : public std::runtime_error {
public:
    explicit config_error(const std::string& msg) : std::runtime_error(msg) {}
};

inline constexpr const char* ledger_e2e_env = "TIDEMARK_LEDGER_E2E";

// ============================================================================
// sync_config - every tunable of a sync run
// ============================================================================

struct sync_config {
    std::string api_base_url;
    std::string client_id;               // empty: generated once and kept in settings
    bool e2e_enabled = false;
    std::string keyring_path;            // required when e2e_enabled

    // Push batch bounds
    size_t global_push_cap = 1200;
    size_t default_table_cap = 500;
    std::map<sync_table, size_t> table_caps = {
        {sync_table::entity_types, 200},
        {sync_table::entities, 200},
        {sync_table::attribute_defs, 200},
        {sync_table::attribute_values, 500},
        {sync_table::operations, 500},
        {sync_table::audit_log, 500},
    };

    // Paging and loop ceilings
    size_t pull_page_size = 500;
    size_t ledger_page_size = 500;
    int max_push_rounds = 20;
    int max_pull_pages = 1000;
    int max_ledger_pages = 200;

    int64_t schema_ttl_ms = 6LL * 60 * 60 * 1000;
    int64_t diagnostics_interval_ms = 10LL * 60 * 1000;

    // Per call class
    retry_policy push_policy{5, 180000};
    retry_policy pull_policy{5, 180000};
    retry_policy schema_policy{2, 15000};
    retry_policy diagnostics_policy{3, 60000};
    retry_policy ledger_policy{3, 60000};
    retry_policy health_policy{2, 6000, 1000, 30000, 500, true};

    size_t cap_for(sync_table table) const;

    /// Unknown keys are ignored; a key with the wrong type throws config_error
    static sync_config from_json(const nlohmann::json& j);
    static sync_config from_file(const std::string& path);

    /// Applies TIDEMARK_LEDGER_E2E=1
    void apply_environment();
};

} // namespace tidemark

#endif // __cplusplus
