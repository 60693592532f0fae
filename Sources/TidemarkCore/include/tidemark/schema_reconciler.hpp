#pragma once

#ifdef __cplusplus

#include "auth.hpp"
#include "config.hpp"
#include "local_store.hpp"
#include "schema.hpp"
#include "settings.hpp"
#include <optional>
#include <string>

namespace tidemark {

enum class compat_action { proceed, rebuild };

struct compat_result {
    compat_action action = compat_action::proceed;
    std::string reason;
};

// ============================================================================
// schema_reconciler - server schema snapshot, local repair, rebuild decision
// ============================================================================

class schema_reconciler {
public:
    schema_reconciler(local_store& store, settings_store& settings, auth_gateway& auth,
                      const sync_config& config);

    /// Cached snapshot when younger than the TTL, else a fresh one. Falls back
    /// to the cache (or nullopt) on any failure.
    std::optional<schema_snapshot> fetch_schema_snapshot(const std::string& api_base);

    /// Null fills, unique-constraint merges and orphan removal. Rules come
    /// from `snapshot`, or from local introspection when it is null.
    void repair_local_tables(const schema_snapshot* snapshot);

    compat_result ensure_compatible(const schema_snapshot* snapshot);

private:
    struct not_null_rule {
        std::string column;
        std::optional<std::string> default_value;
    };

    // Every identifier here was checked against the local table and the
    // compiled descriptor, and is still quoted before it reaches SQL
    struct table_rules {
        sync_table kind = sync_table::entity_types;
        std::string table;
        std::vector<not_null_rule> not_null;
        std::vector<std::vector<std::string>> uniques;
        std::vector<foreign_key_info> foreign_keys;
    };

    table_rules rules_for(sync_table table, const schema_snapshot* snapshot);

    void fill_nulls(const table_rules& rules, const table_introspection& local);
    void merge_duplicates(const table_rules& rules, const std::vector<table_rules>& all);
    void delete_orphans(const table_rules& rules);

    std::optional<schema_snapshot> cached_snapshot();

    local_store& store_;
    settings_store& settings_;
    auth_gateway& auth_;
    const sync_config& config_;
};

} // namespace tidemark

#endif // __cplusplus
