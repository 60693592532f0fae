#include "tidemark/diagnostics.hpp"
#include "tidemark/crypto.hpp"
#include "tidemark/log.hpp"
#include <unordered_map>

namespace tidemark {

namespace {

nlohmann::json optional_number(const std::optional<int64_t>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

std::string placeholders(size_t n) {
    std::string out;
    for (size_t i = 0; i < n; ++i) out += i ? ", ?" : "?";
    return out;
}

// Display text of an attribute value_json
std::optional<std::string> label_text(const std::string& value_json) {
    auto parsed = nlohmann::json::parse(value_json, nullptr, false);
    if (parsed.is_discarded()) return value_json.empty() ? std::nullopt : std::optional<std::string>(value_json);
    if (parsed.is_null()) return std::nullopt;
    if (parsed.is_string()) {
        auto s = parsed.get<std::string>();
        if (s.empty()) return std::nullopt;
        return s;
    }
    return parsed.dump();
}

} // namespace

std::string digest_checksum(int64_t count, std::optional<int64_t> max_updated_at,
                            std::optional<int64_t> sum_updated_at) {
    std::string raw = std::to_string(count) + "|" +
                      (max_updated_at ? std::to_string(*max_updated_at) : std::string()) + "|" +
                      (sum_updated_at ? std::to_string(*sum_updated_at) : std::string());
    return md5_hex(raw);
}

diagnostics_reporter::diagnostics_reporter(local_store& store, settings_store& settings, auth_gateway& auth,
                                           const sync_config& config)
    : store_(store), settings_(settings), auth_(auth), config_(config) {}

nlohmann::json diagnostics_reporter::summarize(const std::string& from_where,
                                               const std::vector<column_value_t>& params) {
    auto rows = store_.db().query(
        "SELECT COUNT(*) AS n, MAX(updated_at) AS max_updated, SUM(updated_at) AS sum_updated, "
        "COALESCE(SUM(CASE WHEN sync_status = 'pending' THEN 1 ELSE 0 END), 0) AS pending_n, "
        "COALESCE(SUM(CASE WHEN sync_status = 'error' THEN 1 ELSE 0 END), 0) AS error_n " + from_where,
        params);

    int64_t count = 0;
    std::optional<int64_t> max_updated;
    std::optional<int64_t> sum_updated;
    int64_t pending = 0;
    int64_t errors = 0;
    if (!rows.empty()) {
        const auto& r = rows.front();
        count = detail::get_int(r, "n").value_or(0);
        max_updated = detail::get_int(r, "max_updated");
        sum_updated = detail::get_int(r, "sum_updated");
        pending = detail::get_int(r, "pending_n").value_or(0);
        errors = detail::get_int(r, "error_n").value_or(0);
    }

    return {
        {"count", count},
        {"maxUpdatedAt", optional_number(max_updated)},
        {"sumUpdatedAt", optional_number(sum_updated)},
        {"checksum", digest_checksum(count, max_updated, sum_updated)},
        {"pendingCount", pending},
        {"errorCount", errors},
    };
}

nlohmann::json diagnostics_reporter::pending_samples(const std::string& type_id) {
    auto& db = store_.db();
    auto rows = db.query("SELECT id, updated_at, sync_status FROM entities WHERE type_id = ? AND deleted_at IS NULL "
                         "AND sync_status IN ('pending', 'error') ORDER BY updated_at DESC LIMIT ?",
                         {type_id, static_cast<int64_t>(max_diagnostic_samples)});
    nlohmann::json samples = nlohmann::json::array();
    if (rows.empty()) return samples;

    // First label attribute this entity type defines
    std::optional<std::string> label_def;
    auto defs = db.query("SELECT id, code FROM attribute_defs WHERE entity_type_id = ? AND deleted_at IS NULL",
                         {type_id});
    for (const char* code : label_attribute_codes) {
        for (const auto& d : defs) {
            if (detail::get_string(d, "code") == std::optional<std::string>(code)) {
                label_def = detail::get_string(d, column::id);
                break;
            }
        }
        if (label_def) break;
    }

    std::unordered_map<std::string, std::string> labels;
    if (label_def) {
        std::vector<column_value_t> params{*label_def};
        for (const auto& r : rows) params.emplace_back(detail::get_string(r, column::id).value_or(""));
        auto values = db.query("SELECT entity_id, value_json FROM attribute_values WHERE attribute_def_id = ? "
                               "AND deleted_at IS NULL AND entity_id IN (" + placeholders(rows.size()) + ")",
                               params);
        for (const auto& v : values) {
            auto entity = detail::get_string(v, "entity_id");
            auto raw = detail::get_string(v, "value_json");
            if (!entity || !raw || labels.count(*entity)) continue;
            if (auto text = label_text(*raw)) labels[*entity] = *text;
        }
    }

    for (const auto& r : rows) {
        auto id = detail::get_string(r, column::id).value_or("");
        auto label = labels.count(id) ? labels[id] : id.substr(0, 8);
        samples.push_back({
            {"id", id},
            {"label", label},
            {"status", detail::get_string(r, column::sync_status) == std::optional<std::string>("error") ? "error" : "pending"},
            {"updatedAt", optional_number(detail::get_int(r, column::updated_at))},
        });
    }
    return samples;
}

nlohmann::json diagnostics_reporter::build_snapshot() {
    nlohmann::json tables = nlohmann::json::object();
    for (auto table : monitored_tables) {
        auto summary = summarize(std::string("FROM ") + to_string(table) + " WHERE deleted_at IS NULL", {});
        summary["table"] = to_string(table);
        summary["hash"] = summary["checksum"];
        tables[to_string(table)] = std::move(summary);
    }

    nlohmann::json types = nlohmann::json::object();
    for (const char* code : watched_type_codes) {
        auto type = store_.find_by_logical_key(sync_table::entity_types, {code});
        std::optional<std::string> type_id;
        if (type && detail::is_null(*type, column::deleted_at)) type_id = detail::get_string(*type, column::id);

        if (!type_id) {
            types[code] = {{"count", 0}, {"maxUpdatedAt", nullptr}, {"checksum", nullptr}};
            continue;
        }

        auto summary = summarize("FROM entities WHERE type_id = ? AND deleted_at IS NULL", {*type_id});
        summary.erase("sumUpdatedAt");
        auto samples = pending_samples(*type_id);
        if (!samples.empty()) summary["pendingItems"] = std::move(samples);
        types[code] = std::move(summary);
    }

    return {{"tables", tables}, {"entityTypes", types}};
}

bool diagnostics_reporter::maybe_report(const std::string& client_id, int64_t server_cursor,
                                        const std::string& sync_run_id) {
    const auto now = now_ms();
    const auto last_sent = settings_.get_number(settings_key::diagnostics_sent_at).value_or(0);
    if (now - last_sent < config_.diagnostics_interval_ms) return false;

    try {
        auto snapshot = build_snapshot();
        nlohmann::json body = {
            {"clientId", client_id},
            {"syncRunId", sync_run_id},
            {"serverSeq", server_cursor},
            {"tables", snapshot["tables"]},
            {"entityTypes", snapshot["entityTypes"]},
        };

        http_request request;
        request.method = "POST";
        request.url = make_url(config_.api_base_url, "/diagnostics/consistency/report");
        request.set_json_body(body.dump());

        auto response = auth_.authed_fetch(request, config_.diagnostics_policy);
        if (!response.is_success()) {
            LOG_WARN("diagnostics", "Report rejected: HTTP %d: %s", response.status_code,
                     truncate_for_log(response.body_string()).c_str());
            return false;
        }
        settings_.set_number(settings_key::diagnostics_sent_at, now);
        return true;
    } catch (const transport_error& e) {
        LOG_WARN("diagnostics", "Report failed: %s", e.what());
    } catch (const db_error& e) {
        LOG_WARN("diagnostics", "Snapshot failed: %s", e.what());
    }
    return false;
}

} // namespace tidemark
