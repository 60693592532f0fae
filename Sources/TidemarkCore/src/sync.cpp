#include "tidemark/sync.hpp"
#include "tidemark/log.hpp"
#include <algorithm>

namespace tidemark {

namespace {

template <typename T>
nlohmann::json optional_json(const std::optional<T>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Environment switches win over the supplied config
sync_config with_environment(sync_config config) {
    config.apply_environment();
    return config;
}

} // namespace

const char* to_string(sync_mode mode) {
    switch (mode) {
        case sync_mode::incremental: return "incremental";
        case sync_mode::force_full_pull: return "force_full_pull";
    }
    return "";
}

const char* to_string(progress_state state) {
    switch (state) {
        case progress_state::start: return "start";
        case progress_state::progress: return "progress";
        case progress_state::done: return "done";
        case progress_state::error: return "error";
    }
    return "";
}

nlohmann::json sync_progress_event::to_json() const {
    nlohmann::json j = {
        {"mode", to_string(mode)},
        {"state", to_string(state)},
        {"startedAt", started_at},
        {"elapsedMs", elapsed_ms},
        {"estimateMs", optional_json(estimate_ms)},
        {"etaMs", optional_json(eta_ms)},
        {"progress", optional_json(progress)},
    };
    if (stage) j["stage"] = *stage;
    if (service) j["service"] = *service;
    if (detail) j["detail"] = *detail;
    if (table) j["table"] = *table;
    if (total || batch) {
        j["counts"] = nlohmann::json::object();
        if (total) j["counts"]["total"] = *total;
        if (batch) j["counts"]["batch"] = *batch;
    }
    if (pulled) j["pulled"] = *pulled;
    if (error) j["error"] = *error;
    return j;
}

nlohmann::json sync_result::to_json() const {
    nlohmann::json j = {
        {"ok", ok},
        {"pushed", pushed},
        {"pulled", pulled},
        {"serverCursor", server_cursor},
    };
    if (error) j["error"] = *error;
    if (auth_required) j["authRequired"] = true;
    if (pull_stalled) j["pullStalled"] = true;
    return j;
}

// Builds and delivers the events of one run
class sync_engine::run_progress {
public:
    run_progress(sync_engine& engine, sync_mode mode, epoch_ms_t started_at, std::optional<int64_t> estimate_ms)
        : engine_(engine), mode_(mode), started_at_(started_at), estimate_ms_(estimate_ms) {}

    sync_progress_event make(progress_state state) const {
        sync_progress_event e;
        e.mode = mode_;
        e.state = state;
        e.started_at = started_at_;
        e.elapsed_ms = std::max<int64_t>(0, now_ms() - started_at_);
        if (estimate_ms_ && *estimate_ms_ > 0) {
            e.estimate_ms = *estimate_ms_;
            e.eta_ms = std::max<int64_t>(0, *estimate_ms_ - e.elapsed_ms);
            e.progress = std::min(0.99, static_cast<double>(e.elapsed_ms) / static_cast<double>(*estimate_ms_));
        }
        return e;
    }

    void emit(sync_progress_event e) const {
        if (!engine_.on_progress_) return;
        auto handler = engine_.on_progress_;
        const auto& sched = engine_.scheduler_;
        if (!sched || sched->is_on_thread()) {
            handler(e);
        } else if (sched->can_invoke()) {
            sched->invoke([handler, e = std::move(e)] { handler(e); });
        } else {
            LOG_DEBUG("sync", "Progress scheduler stopped, dropping %s event", to_string(e.state));
        }
    }

    void stage(const char* stage, const char* service, const std::string& detail = {}) const {
        auto e = make(progress_state::progress);
        e.stage = stage;
        e.service = service;
        if (!detail.empty()) e.detail = detail;
        emit(std::move(e));
    }

    void finish(const sync_result& result) const {
        auto e = make(result.ok ? progress_state::done : progress_state::error);
        e.stage = "finalize";
        e.service = "sync";
        e.pulled = result.pulled;
        if (result.ok) {
            e.progress = 1.0;
            e.eta_ms = 0;
        }
        if (result.error) e.error = *result.error;
        emit(std::move(e));
    }

private:
    sync_engine& engine_;
    sync_mode mode_;
    epoch_ms_t started_at_;
    std::optional<int64_t> estimate_ms_;
};

std::optional<keyring> sync_engine::load_ring(const sync_config& config) {
    if (!config.e2e_enabled) return std::nullopt;
    if (config.keyring_path.empty()) throw config_error("e2e enabled without a keyring path");
    return keyring::load_or_create(config.keyring_path);
}

sync_engine::sync_engine(database& db, std::shared_ptr<http_client> client,
                         std::shared_ptr<session_provider> sessions, sync_config config,
                         std::shared_ptr<scheduler> scheduler, retrying_fetcher::sleeper sleep)
    : db_(db),
      config_(with_environment(std::move(config))),
      scheduler_(std::move(scheduler)),
      fetcher_(std::move(client), std::move(sleep)),
      auth_(std::move(sessions), fetcher_),
      settings_(db),
      store_(db),
      ring_(load_ring(config_)),
      reconciler_(store_, settings_, auth_, config_),
      collector_(store_, config_),
      pusher_(store_, settings_, auth_, collector_, config_, ring()),
      puller_(store_, settings_, auth_, config_, ring()),
      diagnostics_(store_, settings_, auth_, config_),
      ledger_store_(db),
      replicator_(ledger_store_, auth_, config_) {}

std::string sync_engine::client_id() {
    if (!config_.client_id.empty()) return config_.client_id;
    return settings_.client_id();
}

void sync_engine::refresh_api_base_url() {
    auto stored = settings_.get(settings_key::api_base_url);
    if (!stored) return;
    auto url = trim(*stored);
    if (!url.empty()) config_.api_base_url = url;
}

bool sync_engine::needs_full_pull() {
    if (settings_.get_number(settings_key::last_pulled_server_seq).value_or(0) <= 0) return false;
    auto rows = db_.query("SELECT COUNT(*) AS n FROM entity_types WHERE deleted_at IS NULL");
    return rows.empty() || detail::get_int(rows.front(), "n").value_or(0) == 0;
}

void sync_engine::reset_sync_state() {
    settings_.set_number(settings_key::last_pulled_server_seq, 0);
    settings_.remove(settings_key::last_sync_at);
    settings_.remove(settings_key::last_applied_at);
    settings_.remove(settings_key::schema_fetched_at);
    settings_.remove(settings_key::diagnostics_sent_at);
}

void sync_engine::reset_local_database() {
    store_.rebuild();
    reset_sync_state();
    LOG_WARN("sync", "Local database rebuilt");
}

sync_result sync_engine::run_sync(const sync_options& options) {
    const epoch_ms_t started_at = options.started_at.value_or(now_ms());
    const sync_mode mode = options.full_pull ? sync_mode::force_full_pull : sync_mode::incremental;

    std::optional<int64_t> estimate;
    sync_result result;

    try {
        if (options.full_pull) {
            estimate = options.estimate_ms ? options.estimate_ms
                                           : settings_.get_number(settings_key::last_full_pull_duration_ms);
        }
    } catch (const db_error& e) {
        LOG_WARN("sync", "No full pull estimate: %s", e.what());
    }

    run_progress progress(*this, mode, started_at, estimate);
    progress.emit(progress.make(progress_state::start));

    auto fail = [&](std::string error) {
        result.ok = false;
        result.error = std::move(error);
        LOG_ERROR("sync", "%s", result.error->c_str());
        progress.finish(result);
        return result;
    };

    try {
        refresh_api_base_url();
        auth_.reset_session_cleared();

        if (!auth_.has_session()) {
            result.auth_required = true;
            return fail("auth required: please login");
        }

        const std::string client = client_id();
        LOG_INFO("sync", "start client=%s api=%s mode=%s", client.c_str(), config_.api_base_url.c_str(),
                 to_string(mode));

        progress.stage("prepare", "sync", "health");
        http_request health;
        health.url = make_url(config_.api_base_url, "/health");
        auto probe = auth_.authed_fetch(health, config_.health_policy);
        if (probe.is_transport_failure()) {
            return fail("server unreachable: " + (probe.error.empty() ? std::string("no response") : probe.error));
        }
        if (!probe.is_success()) {
            LOG_WARN("sync", "Health probe returned HTTP %d", probe.status_code);
        }

        progress.stage("prepare", "schema");
        store_.create_schema();
        auto snapshot = reconciler_.fetch_schema_snapshot(config_.api_base_url);
        const schema_snapshot* snap = snapshot ? &*snapshot : nullptr;

        auto compat = reconciler_.ensure_compatible(snap);
        if (compat.action == compat_action::rebuild) {
            LOG_WARN("sync", "Local schema incompatible (%s), rebuilding", compat.reason.c_str());
            reset_local_database();
            auth_.sessions().clear_session();
            result.auth_required = true;
            return fail("local database rebuilt (" + compat.reason + "): please login again");
        }
        reconciler_.repair_local_tables(snap);

        progress.stage("push", "sync");
        auto packs = collector_.collect_pending();
        size_t batch = 0;
        for (const auto& p : packs) batch += p.rows.size();
        if (batch > 0) {
            auto e = progress.make(progress_state::progress);
            e.stage = "push";
            e.service = "sync";
            e.batch = batch;
            progress.emit(std::move(e));
        }
        pusher_.set_full_pull([this, client] {
            LOG_WARN("sync", "Pulling from 0 before retrying the push");
            auto repaired = puller_.pull_all(0, client);
            return !repaired.error && !repaired.stalled;
        });
        auto pushed = pusher_.push(std::move(packs));
        result.pushed = pushed.pushed;

        bool full = options.full_pull || pushed.force_full_pull;
        if (!full && needs_full_pull()) {
            LOG_WARN("sync", "Lookup tables empty while the cursor is advanced, pulling from 0");
            full = true;
        }
        const int64_t since = full ? 0 : settings_.get_number(settings_key::last_pulled_server_seq).value_or(0);

        progress.stage("pull", "sync", "since " + std::to_string(since));
        auto pulled = puller_.pull_all(since, client, [&](const pull_result& page) {
            auto e = progress.make(progress_state::progress);
            e.stage = "apply";
            e.service = "sync";
            e.pulled = page.pulled;
            e.total = page.applied;
            progress.emit(std::move(e));
        });
        result.pulled = pulled.pulled;
        result.server_cursor = pulled.server_cursor;
        result.pull_stalled = pulled.stalled;

        progress.stage("finalize", "diagnostics");
        diagnostics_.maybe_report(client, result.server_cursor, uuid_t::generate().to_string());

        progress.stage("ledger", "ledger");
        replicator_.replicate();

        settings_.set_number(settings_key::last_sync_at, started_at);
        if (options.full_pull && !pulled.error) {
            settings_.set_number(settings_key::last_full_pull_duration_ms, now_ms() - started_at);
        }

        std::vector<std::string> errors;
        if (pushed.error) errors.push_back(*pushed.error);
        if (pulled.error) errors.push_back(*pulled.error);
        if (pulled.stalled) errors.push_back("pull stalled at cursor " + std::to_string(pulled.server_cursor));
        if (auth_.session_cleared()) {
            result.auth_required = true;
            errors.push_back("auth required: session expired");
        }

        if (!errors.empty()) {
            std::string joined;
            for (const auto& e : errors) joined += (joined.empty() ? "" : "; ") + e;
            return fail(joined);
        }

        result.ok = true;
        LOG_INFO("sync", "ok pushed=%zu pulled=%zu cursor=%lld", result.pushed, result.pulled,
                 static_cast<long long>(result.server_cursor));
        progress.finish(result);
        return result;
    } catch (const auth_required_error& e) {
        result.auth_required = true;
        return fail(e.what());
    } catch (const std::exception& e) {
        if (auth_.session_cleared()) result.auth_required = true;
        return fail(e.what());
    }
}

} // namespace tidemark
