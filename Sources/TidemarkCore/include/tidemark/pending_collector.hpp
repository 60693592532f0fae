#pragma once

#ifdef __cplusplus

#include "config.hpp"
#include "local_store.hpp"
#include "schema.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace tidemark {

// One table's share of a push request, rows in wire form
struct push_pack {
    sync_table table;
    std::vector<nlohmann::json> rows;
    std::vector<std::string> ids;
};

// ============================================================================
// pending_collector - bounded, validated batches of pending rows
// ============================================================================

class pending_collector {
public:
    pending_collector(local_store& store, const sync_config& config);

    /// Recovery pass, collection pass and lookup top-up. Packs come back in
    /// dependency order. Recollection inside one push cycle skips recovery so
    /// rows quarantined by a remediation stay out until the next cycle.
    std::vector<push_pack> collect_pending(bool run_recovery = true);

    /// Re-validates `error` rows, applying table fixers; rows that pass go
    /// back to `pending`. Returns how many were recovered.
    size_t recover_error_rows();

private:
    using column_fix = std::pair<std::string, column_value_t>;

    /// Repairs a wire row in place; returns the column updates to persist
    std::vector<column_fix> fix_row(sync_table table, nlohmann::json& wire);

    void top_up(std::vector<push_pack>& packs, size_t& remaining);

    local_store& store_;
    const sync_config& config_;
};

} // namespace tidemark

#endif // __cplusplus
