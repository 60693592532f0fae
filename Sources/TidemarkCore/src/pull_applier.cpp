#include "tidemark/pull_applier.hpp"
#include "tidemark/log.hpp"
#include <algorithm>
#include <chrono>

namespace tidemark {

namespace {

constexpr size_t max_logged_ids = 5;

std::optional<std::string> string_field(const nlohmann::json& j, const std::string& key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::string remapped(const id_remap& remap, sync_table table, const std::string& id) {
    auto t = remap.find(table);
    if (t == remap.end()) return id;
    auto it = t->second.find(id);
    return it == t->second.end() ? id : it->second;
}

// Logical key values of a staged row; nullopt when any part is missing
std::optional<std::vector<std::string>> logical_key_of(sync_table table, const row_t& row) {
    std::vector<std::string> key;
    for (const auto& col : schema_for(table).logical_key) {
        auto v = detail::get_string(row, col);
        if (!v || v->empty()) return std::nullopt;
        key.push_back(*v);
    }
    return key;
}

std::string join_key(const std::vector<std::string>& key) {
    std::string out;
    for (const auto& part : key) out += part + '\x1f';
    return out;
}

} // namespace

std::optional<pulled_change> pulled_change::from_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    auto table_name = string_field(j, "table");
    auto row_id = string_field(j, "row_id");
    auto op = string_field(j, "op");
    if (!table_name || !row_id || !op) return std::nullopt;

    auto table = parse_sync_table(*table_name);
    if (!table || (*op != "upsert" && *op != "delete")) return std::nullopt;

    pulled_change change;
    change.table = *table;
    change.row_id = *row_id;
    change.is_delete = *op == "delete";

    auto payload = j.find("payload_json");
    if (payload != j.end() && payload->is_string()) {
        change.payload_json = payload->get<std::string>();
    } else if (payload != j.end() && payload->is_object()) {
        change.payload_json = payload->dump();
    }

    auto seq = j.find("server_seq");
    if (seq != j.end() && seq->is_number_integer()) change.server_seq = seq->get<int64_t>();
    return change;
}

pull_applier::pull_applier(local_store& store, settings_store& settings, auth_gateway& auth,
                           const sync_config& config, const keyring* ring)
    : store_(store), settings_(settings), auth_(auth), config_(config), ring_(ring) {}

id_remap pull_applier::prescan_lookups(const std::vector<std::pair<const pulled_change*, nlohmann::json>>& parsed) {
    id_remap remap;

    // entity_types by code, then attribute_defs by (remapped entity_type_id, code)
    for (auto table : {sync_table::entity_types, sync_table::attribute_defs}) {
        std::map<std::string, std::string> owner_by_key;
        auto& table_remap = remap[table];

        for (const auto& [change, payload] : parsed) {
            if (change->table != table) continue;

            std::vector<std::string> key;
            bool complete = true;
            for (const auto& col : schema_for(table).logical_key) {
                auto v = string_field(payload, col);
                if (!v || v->empty()) {
                    complete = false;
                    break;
                }
                key.push_back(col == "entity_type_id" ? remapped(remap, sync_table::entity_types, *v) : *v);
            }
            if (!complete) continue;

            const std::string joined = join_key(key);
            auto owner = owner_by_key.find(joined);
            if (owner == owner_by_key.end()) {
                std::string local_id = change->row_id;
                if (auto local = store_.find_by_logical_key(table, key)) {
                    local_id = detail::get_string(*local, column::id).value_or(change->row_id);
                }
                owner = owner_by_key.emplace(joined, local_id).first;
            }
            if (owner->second != change->row_id) {
                table_remap[change->row_id] = owner->second;
            }
        }

        if (!table_remap.empty()) {
            LOG_INFO("pull", "%s: %zu server id(s) remapped onto local rows", to_string(table), table_remap.size());
        }
    }
    return remap;
}

void pull_applier::dedup(std::vector<staged_row>& rows) {
    auto better = [](const staged_row& a, const staged_row& b) {
        if ((a.server_seq != 0 || b.server_seq != 0) && a.server_seq != b.server_seq) {
            return a.server_seq > b.server_seq;
        }
        auto ua = detail::get_int(a.row, column::updated_at).value_or(0);
        auto ub = detail::get_int(b.row, column::updated_at).value_or(0);
        if (ua != ub) return ua > ub;
        return a.order > b.order;
    };

    std::map<std::pair<sync_table, std::string>, size_t> index;
    std::vector<staged_row> out;
    out.reserve(rows.size());
    for (auto& r : rows) {
        auto key = std::make_pair(r.table, r.id);
        auto it = index.find(key);
        if (it == index.end()) {
            index.emplace(key, out.size());
            out.push_back(std::move(r));
        } else if (better(r, out[it->second])) {
            out[it->second] = std::move(r);
        }
    }
    rows = std::move(out);
}

void pull_applier::filter_missing_references(std::vector<staged_row>& rows) {
    std::map<sync_table, std::vector<std::string>> dropped;
    rows.erase(std::remove_if(rows.begin(), rows.end(), [&](const staged_row& r) {
        for (const auto* f : schema_for(r.table).required_references()) {
            auto v = detail::get_string(r.row, f->name);
            if (!v || v->empty()) {
                dropped[r.table].push_back(r.id);
                return true;
            }
        }
        return false;
    }), rows.end());

    for (const auto& [table, ids] : dropped) {
        std::string sample;
        for (size_t i = 0; i < ids.size() && i < max_logged_ids; ++i) {
            if (i > 0) sample += ", ";
            sample += ids[i];
        }
        LOG_WARN("pull", "%s: skipped %zu change(s) without required references: %s", to_string(table),
                 ids.size(), sample.c_str());
    }
}

void pull_applier::remap_composite_keys(std::vector<staged_row>& rows) {
    for (auto table : {sync_table::attribute_values, sync_table::chat_reads, sync_table::note_shares}) {
        std::map<std::string, std::string> owner_by_key;
        size_t moved = 0;

        for (auto& r : rows) {
            if (r.table != table) continue;
            auto key = logical_key_of(table, r.row);
            if (!key) continue;

            const std::string joined = join_key(*key);
            auto owner = owner_by_key.find(joined);
            if (owner == owner_by_key.end()) {
                std::string local_id = r.id;
                if (auto local = store_.find_by_logical_key(table, *key)) {
                    local_id = detail::get_string(*local, column::id).value_or(r.id);
                }
                owner = owner_by_key.emplace(joined, local_id).first;
            }
            if (owner->second != r.id) {
                r.id = owner->second;
                r.row[column::id] = r.id;
                ++moved;
            }
        }
        if (moved > 0) {
            LOG_INFO("pull", "%s: %zu change(s) folded onto existing rows by unique key", to_string(table), moved);
        }
    }
}

size_t pull_applier::apply_pulled(const std::vector<pulled_change>& changes) {
    if (changes.empty()) return 0;

    std::vector<std::pair<const pulled_change*, nlohmann::json>> parsed;
    parsed.reserve(changes.size());
    for (const auto& change : changes) {
        auto payload = nlohmann::json::parse(change.payload_json, nullptr, false);
        if (payload.is_discarded() || !payload.is_object()) {
            if (!change.is_delete) {
                LOG_WARN("pull", "%s %s: unreadable payload at seq %lld skipped", to_string(change.table),
                         change.row_id.c_str(), static_cast<long long>(change.server_seq));
                continue;
            }
            payload = nlohmann::json::object();
        }
        if (change.is_delete && payload.empty()) {
            // Bare delete: tombstone the local copy, nothing to do without one
            auto local = store_.find_by_id(change.table, change.row_id);
            if (!local) continue;
            payload = to_wire(change.table, *local);
            payload[column::deleted_at] = now_ms();
            payload[column::updated_at] = payload[column::deleted_at];
        }
        if (ring_) payload = decrypt_row_sensitive(std::move(payload), *ring_);
        parsed.emplace_back(&change, std::move(payload));
    }

    const id_remap remap = prescan_lookups(parsed);

    std::vector<staged_row> staged;
    staged.reserve(parsed.size());
    for (size_t i = 0; i < parsed.size(); ++i) {
        const auto& [change, payload_in] = parsed[i];
        nlohmann::json payload = payload_in;
        const auto& schema = schema_for(change->table);

        payload[column::id] = remapped(remap, change->table, change->row_id);
        for (const auto& f : schema.fields) {
            if (!f.references) continue;
            auto it = payload.find(f.name);
            if (it != payload.end() && it->is_string()) {
                *it = remapped(remap, *f.references, it->get<std::string>());
            }
        }

        staged_row r;
        r.table = change->table;
        r.row = from_wire(change->table, payload);
        r.id = payload[column::id].get<std::string>();
        r.server_seq = change->server_seq;
        r.order = i;

        r.row[column::last_server_seq] = change->server_seq;
        r.row[column::sync_status] = std::string(to_string(sync_status::synced));
        if (change->is_delete && detail::is_null(r.row, column::deleted_at)) {
            r.row[column::deleted_at] = detail::get_int(r.row, column::updated_at).value_or(now_ms());
        }
        if (detail::is_null(r.row, column::updated_at)) r.row[column::updated_at] = now_ms();
        if (detail::is_null(r.row, column::created_at)) {
            r.row[column::created_at] = *detail::get_int(r.row, column::updated_at);
        }
        staged.push_back(std::move(r));
    }

    dedup(staged);
    filter_missing_references(staged);
    remap_composite_keys(staged);
    dedup(staged);

    std::stable_sort(staged.begin(), staged.end(), [](const staged_row& a, const staged_row& b) {
        return static_cast<int>(a.table) < static_cast<int>(b.table);
    });

    size_t written = 0;
    transaction tx(store_.db());
    for (const auto& r : staged) {
        try {
            store_.upsert_rows(r.table, {r.row});
            ++written;
        } catch (const db_error& e) {
            LOG_WARN("pull", "%s %s: apply failed, change skipped: %s", to_string(r.table), r.id.c_str(), e.what());
        }
    }
    tx.commit();
    return written;
}

pull_result pull_applier::pull_all(int64_t since, const std::string& client_id, const page_callback& on_page) {
    pull_result result;
    result.server_cursor = since;
    int64_t cursor = since;

    while (true) {
        if (result.pages >= config_.max_pull_pages) {
            LOG_WARN("pull", "Pull page ceiling %d reached at cursor %lld", config_.max_pull_pages,
                     static_cast<long long>(cursor));
            break;
        }

        http_request request;
        request.url = make_url(config_.api_base_url, "/ledger/state/changes",
                               {{"since", std::to_string(cursor)},
                                {"limit", std::to_string(config_.pull_page_size)},
                                {"client_id", client_id}});

        auto started = std::chrono::steady_clock::now();
        http_response response;
        try {
            response = auth_.authed_fetch(request, config_.pull_policy);
        } catch (const transport_error& e) {
            result.error = std::string("pull failed: ") + e.what();
            break;
        }
        auto elapsed = static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count());

        const std::string body_text = response.body_string();
        if (!response.is_success()) {
            LOG_WARN("pull", "Pull failed: HTTP %d after %lldms: %s", response.status_code, elapsed,
                     truncate_for_log(body_text).c_str());
            result.error = "pull failed: HTTP " + std::to_string(response.status_code) + ": " +
                           truncate_for_log(body_text);
            break;
        }

        auto body = nlohmann::json::parse(body_text, nullptr, false);
        if (!body.is_object()) {
            result.error = "pull failed: unreadable response: " + truncate_for_log(body_text);
            break;
        }

        std::vector<pulled_change> changes;
        auto raw = body.find("changes");
        if (raw != body.end() && raw->is_array()) {
            for (const auto& item : *raw) {
                if (auto change = pulled_change::from_json(item)) {
                    changes.push_back(std::move(*change));
                } else {
                    LOG_WARN("pull", "Malformed change skipped: %s", truncate_for_log(item.dump(), 200).c_str());
                }
            }
        }
        const size_t received = raw != body.end() && raw->is_array() ? raw->size() : 0;

        ++result.pages;
        result.pulled += received;
        try {
            result.applied += apply_pulled(changes);
        } catch (const db_error& e) {
            result.error = std::string("pull apply failed: ") + e.what();
            break;
        }

        int64_t next = cursor;
        if (auto c = body.find("server_cursor"); c != body.end() && c->is_number_integer()) {
            next = c->get<int64_t>();
        }
        int64_t stored = settings_.get_number(settings_key::last_pulled_server_seq).value_or(0);
        settings_.set_number(settings_key::last_pulled_server_seq, std::max(stored, next));
        settings_.set_number(settings_key::last_applied_at, now_ms());
        result.server_cursor = std::max(result.server_cursor, next);

        LOG_DEBUG("pull", "Page %d: %zu change(s), cursor %lld, %lldms", result.pages, received,
                  static_cast<long long>(next), elapsed);
        if (on_page) on_page(result);

        if (!body.value("has_more", false) || received == 0) break;
        if (next <= cursor) {
            result.stalled = true;
            LOG_WARN("pull", "Server repeated cursor %lld while reporting more changes", static_cast<long long>(next));
            break;
        }
        cursor = next;
    }

    if (result.error) LOG_ERROR("pull", "%s", result.error->c_str());
    return result;
}

} // namespace tidemark
