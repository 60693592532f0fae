#pragma once

#ifdef __cplusplus

#include "auth.hpp"
#include "config.hpp"
#include "crypto.hpp"
#include "local_store.hpp"
#include "settings.hpp"
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tidemark {

// One entry of a /ledger/state/changes page
struct pulled_change {
    sync_table table;
    std::string row_id;
    bool is_delete = false;
    std::string payload_json;
    int64_t server_seq = 0;

    /// nullopt for unknown tables, unknown ops or missing fields
    static std::optional<pulled_change> from_json(const nlohmann::json& j);
};

struct pull_result {
    size_t pulled = 0;          // changes received
    size_t applied = 0;         // rows written
    int64_t server_cursor = 0;
    int pages = 0;
    bool stalled = false;       // server repeated a cursor while reporting more pages
    std::optional<std::string> error;
};

/// server id -> local id, per table, for one batch
using id_remap = std::map<sync_table, std::map<std::string, std::string>>;

// ============================================================================
// pull_applier - server changes into local tables
// ============================================================================

class pull_applier {
public:
    /// Called after every applied page with the running totals
    using page_callback = std::function<void(const pull_result& progress)>;

    /// `ring` is null when end-to-end encryption is off
    pull_applier(local_store& store, settings_store& settings, auth_gateway& auth,
                 const sync_config& config, const keyring* ring);

    /// Applies one batch; returns the number of rows written.
    /// A change that cannot be parsed or written is logged and skipped.
    size_t apply_pulled(const std::vector<pulled_change>& changes);

    /// Pages from `since` until the server reports no more changes
    pull_result pull_all(int64_t since, const std::string& client_id, const page_callback& on_page = nullptr);

private:
    struct staged_row {
        sync_table table;
        row_t row;
        std::string id;
        int64_t server_seq = 0;
        size_t order = 0;
    };

    id_remap prescan_lookups(const std::vector<std::pair<const pulled_change*, nlohmann::json>>& parsed);
    void remap_composite_keys(std::vector<staged_row>& rows);

    /// One row per (table, id): the higher last_server_seq when either is
    /// non-zero, else the larger updated_at, else the later change
    static void dedup(std::vector<staged_row>& rows);
    void filter_missing_references(std::vector<staged_row>& rows);

    local_store& store_;
    settings_store& settings_;
    auth_gateway& auth_;
    const sync_config& config_;
    const keyring* ring_;
};

} // namespace tidemark

#endif // __cplusplus
