#include "tidemark/push_transmitter.hpp"
#include "tidemark/log.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <unordered_set>

namespace tidemark {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// `name` appears in `text` as a whole identifier
bool mentions(const std::string& text, const std::string& name) {
    for (size_t pos = text.find(name); pos != std::string::npos; pos = text.find(name, pos + 1)) {
        bool left = pos == 0 || !is_name_char(text[pos - 1]);
        size_t end = pos + name.size();
        bool right = end >= text.size() || !is_name_char(text[end]);
        if (left && right) return true;
    }
    return false;
}

std::optional<int64_t> int_member(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    if (!j.is_object()) return std::nullopt;
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it != j.end() && (it->is_number_integer() || it->is_number_unsigned())) {
            return it->get<int64_t>();
        }
    }
    return std::nullopt;
}

std::optional<std::string> string_member(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    if (!j.is_object()) return std::nullopt;
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string()) return it->get<std::string>();
    }
    return std::nullopt;
}

// Unique indexes whose violation is fixed by dropping the local pending duplicates
struct duplicate_index {
    const char* name;
    sync_table table;
};

constexpr duplicate_index droppable_duplicates[] = {
    {"chat_reads_message_user_uq", sync_table::chat_reads},
    {"note_shares_note_recipient_uq", sync_table::note_shares},
};

size_t batch_size(const std::vector<push_pack>& packs) {
    size_t n = 0;
    for (const auto& p : packs) n += p.rows.size();
    return n;
}

} // namespace

const char* to_string(remediation_kind kind) {
    switch (kind) {
        case remediation_kind::duplicate_key: return "duplicate_key";
        case remediation_kind::invalid_row: return "invalid_row";
        case remediation_kind::dependency_missing: return "dependency_missing";
    }
    return "";
}

push_failure classify_push_failure(const std::string& body) {
    const std::string text = lowercase(body);
    push_failure failure;

    for (const auto& dup : droppable_duplicates) {
        if (text.find(dup.name) != std::string::npos) {
            failure.kind = remediation_kind::duplicate_key;
            failure.table = dup.table;
            return failure;
        }
    }

    if (text.find("sync_invalid_row") != std::string::npos) {
        for (auto table : all_sync_tables) {
            if (mentions(text, to_string(table))) {
                failure.kind = remediation_kind::invalid_row;
                failure.table = table;
                return failure;
            }
        }
        return failure;
    }

    if (text.find("sync_dependency_missing") != std::string::npos ||
        text.find("sync_conflict") != std::string::npos) {
        failure.kind = remediation_kind::dependency_missing;
    }
    return failure;
}

push_transmitter::push_transmitter(local_store& store, settings_store& settings, auth_gateway& auth,
                                   pending_collector& collector, const sync_config& config,
                                   const keyring* ring)
    : store_(store), settings_(settings), auth_(auth), collector_(collector), config_(config), ring_(ring) {}

nlohmann::json push_transmitter::build_transactions(const std::vector<push_pack>& packs) const {
    const key_bytes* key = ring_ ? ring_->primary() : nullptr;
    nlohmann::json txs = nlohmann::json::array();
    for (const auto& pack : packs) {
        for (size_t i = 0; i < pack.rows.size(); ++i) {
            const auto& row = pack.rows[i];
            auto deleted = row.find(column::deleted_at);
            bool is_delete = deleted != row.end() && !deleted->is_null();
            txs.push_back({
                {"type", is_delete ? "delete" : "upsert"},
                {"table", to_string(pack.table)},
                {"row", encrypt_row_sensitive(row, key)},
                {"row_id", pack.ids[i]},
            });
        }
    }
    return {{"txs", txs}};
}

size_t push_transmitter::mark_pushed(const std::vector<push_pack>& packs, const nlohmann::json& ack) {
    const auto response_seq = int_member(ack, {"last_seq", "server_seq"});
    const int64_t stored_cursor = settings_.get_number(settings_key::last_pulled_server_seq).value_or(0);

    std::map<sync_table, std::map<std::string, std::optional<int64_t>>> targets;

    auto applied = ack.find("applied_rows");
    if (applied != ack.end() && applied->is_array() && !applied->empty()) {
        std::map<sync_table, std::unordered_set<std::string>> batch;
        for (const auto& pack : packs) batch[pack.table].insert(pack.ids.begin(), pack.ids.end());

        for (const auto& entry : *applied) {
            auto table_name = string_member(entry, {"table"});
            auto id = string_member(entry, {"row_id", "rowId", "id"});
            if (!table_name || !id) continue;
            auto table = parse_sync_table(*table_name);
            if (!table || !batch[*table].count(*id)) continue;
            targets[*table][*id] = int_member(entry, {"server_seq", "serverSeq", "seq"});
        }
    } else {
        for (const auto& pack : packs) {
            for (const auto& id : pack.ids) targets[pack.table][id] = std::nullopt;
        }
    }

    size_t marked = 0;
    transaction tx(store_.db());
    for (const auto& [table, rows] : targets) {
        std::vector<std::string> ids;
        for (const auto& [id, _] : rows) ids.push_back(id);

        std::unordered_map<std::string, int64_t> existing;
        for (const auto& row : store_.select_by_ids(table, ids)) {
            auto id = detail::get_string(row, column::id);
            auto seq = detail::get_int(row, column::last_server_seq);
            if (id && seq) existing[*id] = *seq;
        }

        for (const auto& [id, row_seq] : rows) {
            int64_t seq = stored_cursor;
            if (row_seq) {
                seq = *row_seq;
            } else if (response_seq) {
                seq = *response_seq;
            } else if (auto it = existing.find(id); it != existing.end()) {
                seq = it->second;
            }
            store_.mark_synced(table, id, seq);
            ++marked;
        }
    }
    tx.commit();
    return marked;
}

void push_transmitter::remediate(const push_failure& failure, const std::vector<push_pack>& packs,
                                 push_outcome& outcome) {
    auto& db = store_.db();
    switch (*failure.kind) {
        case remediation_kind::duplicate_key: {
            const sync_table table = *failure.table;
            const auto& key = schema_for(table).logical_key;
            size_t dropped = 0;
            for (const auto& pack : packs) {
                if (pack.table != table) continue;
                for (const auto& row : pack.rows) {
                    std::string sql = "DELETE FROM " + std::string(to_string(table)) + " WHERE sync_status = 'pending'";
                    std::vector<column_value_t> params;
                    for (const auto& col : key) {
                        auto v = row.find(col);
                        if (v == row.end() || !v->is_string()) break;
                        sql += " AND " + col + " = ?";
                        params.emplace_back(v->get<std::string>());
                    }
                    if (params.size() != key.size()) continue;
                    db.execute(sql, params);
                    dropped += static_cast<size_t>(db.changes());
                }
            }
            LOG_WARN("push", "Duplicate key on %s: dropped %zu pending row(s)", to_string(table), dropped);
            break;
        }
        case remediation_kind::invalid_row: {
            size_t n = store_.set_status_all(*failure.table, sync_status::pending, sync_status::error);
            LOG_WARN("push", "Server rejected %s rows: %zu pending row(s) marked error",
                     to_string(*failure.table), n);
            break;
        }
        case remediation_kind::dependency_missing: {
            if (full_pull_ && full_pull_()) {
                outcome.full_pulled = true;
            } else {
                if (full_pull_) LOG_WARN("push", "Full pull before the dependency retry failed");
                outcome.force_full_pull = true;
            }
            size_t n = 0;
            for (auto table : all_sync_tables) {
                if (schema_for(table).lookup) {
                    n += store_.set_status_all(table, sync_status::synced, sync_status::pending);
                }
            }
            LOG_WARN("push", "Server reported a missing dependency: %zu lookup row(s) re-queued", n);
            break;
        }
    }
}

push_outcome push_transmitter::push(std::vector<push_pack> packs) {
    push_outcome outcome;

    for (int round = 1; !packs.empty(); ++round) {
        if (round > config_.max_push_rounds) {
            LOG_WARN("push", "Push round ceiling %d reached with %zu row(s) still pending",
                     config_.max_push_rounds, batch_size(packs));
            break;
        }

        http_request request;
        request.method = "POST";
        request.url = make_url(config_.api_base_url, "/ledger/tx/submit");
        request.set_json_body(build_transactions(packs).dump());

        auto started = std::chrono::steady_clock::now();
        http_response response;
        try {
            response = auth_.authed_fetch(request, config_.push_policy);
        } catch (const transport_error& e) {
            outcome.error = std::string("push failed: ") + e.what();
            LOG_ERROR("push", "%s", outcome.error->c_str());
            break;
        }
        auto elapsed = static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count());

        const std::string body_text = response.body_string();
        nlohmann::json body = nlohmann::json::parse(body_text, nullptr, false);
        bool ok = response.is_success() && (!body.is_object() || body.value("ok", true));

        if (ok) {
            size_t marked = mark_pushed(packs, body.is_object() ? body : nlohmann::json::object());
            outcome.pushed += marked;
            LOG_INFO("push", "Pushed %zu row(s) in %lldms", marked, elapsed);
            packs = collector_.collect_pending(false);
            continue;
        }

        LOG_WARN("push", "Push rejected: HTTP %d after %lldms: %s", response.status_code, elapsed,
                 truncate_for_log(body_text).c_str());

        auto failure = classify_push_failure(body_text);
        if (!failure.kind) {
            outcome.error = "push failed: HTTP " + std::to_string(response.status_code) + ": " +
                            truncate_for_log(body_text);
            break;
        }
        if (outcome.remediations.count(*failure.kind)) {
            outcome.error = std::string("push failed again after ") + to_string(*failure.kind) +
                            " remediation: HTTP " + std::to_string(response.status_code) + ": " +
                            truncate_for_log(body_text);
            break;
        }

        outcome.remediations.insert(*failure.kind);
        try {
            remediate(failure, packs, outcome);
        } catch (const db_error& e) {
            outcome.error = std::string("remediation ") + to_string(*failure.kind) + " failed: " + e.what();
            LOG_ERROR("push", "%s", outcome.error->c_str());
            break;
        }
        packs = collector_.collect_pending(false);
    }

    if (outcome.error) {
        LOG_ERROR("push", "%s", outcome.error->c_str());
    }
    return outcome;
}

} // namespace tidemark
