#pragma once

#ifdef __cplusplus

#include "auth.hpp"
#include "config.hpp"
#include "crypto.hpp"
#include "db.hpp"
#include "diagnostics.hpp"
#include "ledger.hpp"
#include "local_store.hpp"
#include "network.hpp"
#include "pending_collector.hpp"
#include "pull_applier.hpp"
#include "push_transmitter.hpp"
#include "scheduler.hpp"
#include "schema_reconciler.hpp"
#include "settings.hpp"
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace tidemark {

// ============================================================================
// Progress events
// ============================================================================

enum class sync_mode { incremental, force_full_pull };
enum class progress_state { start, progress, done, error };

const char* to_string(sync_mode mode);
const char* to_string(progress_state state);

struct sync_progress_event {
    sync_mode mode = sync_mode::incremental;
    progress_state state = progress_state::start;
    epoch_ms_t started_at = 0;
    int64_t elapsed_ms = 0;
    std::optional<int64_t> estimate_ms;
    std::optional<int64_t> eta_ms;
    std::optional<double> progress;      // 0..1, time based when an estimate exists

    std::optional<std::string> stage;    // prepare, push, pull, apply, ledger, finalize
    std::optional<std::string> service;  // schema, diagnostics, ledger, sync
    std::optional<std::string> detail;
    std::optional<std::string> table;
    std::optional<size_t> total;
    std::optional<size_t> batch;
    std::optional<size_t> pulled;
    std::optional<std::string> error;

    nlohmann::json to_json() const;
};

struct sync_result {
    bool ok = false;
    size_t pushed = 0;
    size_t pulled = 0;
    int64_t server_cursor = 0;
    std::optional<std::string> error;
    bool auth_required = false;
    bool pull_stalled = false;

    nlohmann::json to_json() const;
};

struct sync_options {
    bool full_pull = false;                   // pull from cursor 0
    std::optional<int64_t> estimate_ms;       // full pulls: defaults to the last measured duration
    std::optional<epoch_ms_t> started_at;
};

// ============================================================================
// sync_engine - one synchronous push/pull run over the local database
// ============================================================================
//
// Owns every pipeline component. A run executes on the calling thread;
// progress handlers are invoked through the scheduler given at construction.

class sync_engine {
public:
    using on_progress_handler = std::function<void(const sync_progress_event& event)>;

    /// Loads (or creates) the keyring when config.e2e_enabled; crypto_error
    /// and nlohmann::json exceptions from an unreadable keyring propagate.
    sync_engine(database& db, std::shared_ptr<http_client> client, std::shared_ptr<session_provider> sessions,
                sync_config config, std::shared_ptr<scheduler> scheduler = nullptr,
                retrying_fetcher::sleeper sleep = nullptr);

    sync_engine(const sync_engine&) = delete;
    sync_engine& operator=(const sync_engine&) = delete;

    /// Never throws: every failure ends up in sync_result::error
    sync_result run_sync(const sync_options& options = {});

    /// Zeroes the pull cursor and the sync timestamps
    void reset_sync_state();

    /// Drops and recreates every sync table, then resets sync state
    void reset_local_database();

    void set_on_progress(on_progress_handler handler) { on_progress_ = std::move(handler); }

    const sync_config& config() const { return config_; }
    void set_api_base_url(std::string url) { config_.api_base_url = std::move(url); }

    std::string client_id();
    const keyring* ring() const { return ring_ ? &*ring_ : nullptr; }

    local_store& store() { return store_; }
    settings_store& settings() { return settings_; }

private:
    class run_progress;

    static std::optional<keyring> load_ring(const sync_config& config);

    void refresh_api_base_url();

    /// Missing lookup rows while the cursor says they were pulled
    bool needs_full_pull();

    database& db_;
    sync_config config_;
    std::shared_ptr<scheduler> scheduler_;
    retrying_fetcher fetcher_;
    auth_gateway auth_;
    settings_store settings_;
    local_store store_;
    std::optional<keyring> ring_;
    schema_reconciler reconciler_;
    pending_collector collector_;
    push_transmitter pusher_;
    pull_applier puller_;
    diagnostics_reporter diagnostics_;
    sqlite_ledger_store ledger_store_;
    ledger_replicator replicator_;

    on_progress_handler on_progress_;
};

} // namespace tidemark

#endif // __cplusplus
