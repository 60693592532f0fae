#include "tidemark/schema_reconciler.hpp"
#include "tidemark/log.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <unordered_map>

namespace tidemark {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Literal value of a declared column default. Expressions (now(), CURRENT_TIMESTAMP)
// have no literal and yield nullopt.
std::optional<column_value_t> parse_sql_default(const std::string& raw) {
    std::string s = trim(raw);
    if (auto cast = s.find("::"); cast != std::string::npos) s = trim(s.substr(0, cast));
    while (s.size() >= 2 && s.front() == '(' && s.back() == ')') s = trim(s.substr(1, s.size() - 2));
    if (s.empty()) return std::nullopt;

    if (s.size() >= 2 && s.front() == '\'' && s.back() == '\'') {
        std::string inner;
        for (size_t i = 1; i + 1 < s.size(); ++i) {
            inner += s[i];
            if (s[i] == '\'' && i + 2 < s.size() && s[i + 1] == '\'') ++i;
        }
        return column_value_t(inner);
    }

    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true") return column_value_t(int64_t{1});
    if (lower == "false") return column_value_t(int64_t{0});

    char* end = nullptr;
    long long i = std::strtoll(s.c_str(), &end, 10);
    if (end && *end == '\0') return column_value_t(static_cast<int64_t>(i));
    double d = std::strtod(s.c_str(), &end);
    if (end && *end == '\0') return column_value_t(d);
    return std::nullopt;
}

bool has_column(const table_introspection& local, const std::string& name) {
    return std::any_of(local.columns.begin(), local.columns.end(),
                       [&](const column_info& c) { return c.name == name; });
}

bool compiled_column(sync_table table, const std::string& name) {
    auto names = schema_for(table).column_names();
    return std::find(names.begin(), names.end(), name) != names.end();
}

// A snapshot column is usable only when both the local table and the compiled
// descriptor have it. Anything else never reaches SQL.
bool known_column(sync_table table, const table_introspection& local, const std::string& name) {
    return has_column(local, name) && compiled_column(table, name);
}

std::string in_list(size_t n) {
    std::string out;
    for (size_t i = 0; i < n; ++i) out += i ? ", ?" : "?";
    return out;
}

struct candidate {
    std::string id;
    bool alive = true;
    int64_t updated_at = 0;
};

// Alive over tombstoned, then most recently updated, then smallest id
bool outranks(const candidate& a, const candidate& b) {
    if (a.alive != b.alive) return a.alive;
    if (a.updated_at != b.updated_at) return a.updated_at > b.updated_at;
    return a.id < b.id;
}

} // namespace

schema_reconciler::schema_reconciler(local_store& store, settings_store& settings, auth_gateway& auth,
                                     const sync_config& config)
    : store_(store), settings_(settings), auth_(auth), config_(config) {}

std::optional<schema_snapshot> schema_reconciler::cached_snapshot() {
    auto raw = settings_.get(settings_key::schema_json);
    if (!raw || raw->empty()) return std::nullopt;
    try {
        return schema_snapshot::from_json(nlohmann::json::parse(*raw));
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("schema", "Discarding unreadable cached schema: %s", e.what());
        return std::nullopt;
    }
}

std::optional<schema_snapshot> schema_reconciler::fetch_schema_snapshot(const std::string& api_base) {
    auto cached = cached_snapshot();
    auto fetched_at = settings_.get_number(settings_key::schema_fetched_at);
    if (cached && fetched_at && now_ms() - *fetched_at < config_.schema_ttl_ms) {
        return cached;
    }

    http_request request;
    request.url = make_url(api_base, "/diagnostics/sync-schema");
    auto started = std::chrono::steady_clock::now();
    auto elapsed_ms = [&] {
        return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count());
    };

    try {
        auto response = auth_.authed_fetch(request, config_.schema_policy);
        if (!response.is_success()) {
            LOG_WARN("schema", "Schema fetch failed: HTTP %d after %lldms: %s", response.status_code,
                     elapsed_ms(), truncate_for_log(response.body_string()).c_str());
            return cached;
        }
        auto body = nlohmann::json::parse(response.body_string());
        if (!body.value("ok", false) || !body.contains("schema") || !body["schema"].is_object()) {
            LOG_WARN("schema", "Schema fetch returned no schema: %s",
                     truncate_for_log(response.body_string()).c_str());
            return cached;
        }
        auto snapshot = schema_snapshot::from_json(body["schema"]);
        settings_.set(settings_key::schema_json, body["schema"].dump());
        settings_.set_number(settings_key::schema_fetched_at, now_ms());
        return snapshot;
    } catch (const transport_error& e) {
        LOG_WARN("schema", "Schema fetch failed after %lldms: %s", elapsed_ms(), e.what());
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("schema", "Schema response unreadable: %s", e.what());
    }
    return cached;
}

schema_reconciler::table_rules schema_reconciler::rules_for(sync_table table, const schema_snapshot* snapshot) {
    table_rules rules;
    rules.kind = table;
    rules.table = to_string(table);

    if (snapshot) {
        auto it = snapshot->tables.find(rules.table);
        if (it != snapshot->tables.end()) {
            const char* name = rules.table.c_str();
            auto local = store_.introspect(rules.table);
            for (const auto& c : it->second.columns) {
                if (!c.not_null) continue;
                if (!known_column(table, local, c.name)) {
                    LOG_DEBUG("schema", "%s: skipping NOT NULL on unknown column %s", name, c.name.c_str());
                    continue;
                }
                rules.not_null.push_back({c.name, c.default_value});
            }
            for (const auto& u : it->second.unique_constraints) {
                if (u.is_primary || u.columns.empty()) continue;
                bool usable = std::all_of(u.columns.begin(), u.columns.end(),
                                          [&](const std::string& c) { return known_column(table, local, c); });
                if (!usable) {
                    LOG_WARN("schema", "%s: skipping unique constraint over unknown column(s)", name);
                    continue;
                }
                rules.uniques.push_back(u.columns);
            }
            for (const auto& f : it->second.foreign_keys) {
                auto parent = parse_sync_table(f.ref_table);
                bool usable = known_column(table, local, f.column) && parent && store_.has_table(*parent) &&
                              known_column(*parent, store_.introspect(f.ref_table), f.ref_column);
                if (!usable) {
                    LOG_WARN("schema", "%s: skipping foreign key %s -> %s.%s with unknown identifiers", name,
                             f.column.c_str(), f.ref_table.c_str(), f.ref_column.c_str());
                    continue;
                }
                rules.foreign_keys.push_back({f.column, f.ref_table, f.ref_column});
            }
            return rules;
        }
    }

    auto local = store_.introspect(rules.table);
    for (const auto& c : local.columns) {
        if (c.not_null && !c.primary_key) rules.not_null.push_back({c.name, c.default_value});
    }
    for (const auto& idx : local.unique_indexes) {
        if (!idx.is_primary) rules.uniques.push_back(idx.columns);
    }
    rules.foreign_keys = local.foreign_keys;
    return rules;
}

void schema_reconciler::fill_nulls(const table_rules& rules, const table_introspection& local) {
    auto& db = store_.db();
    for (const auto& rule : rules.not_null) {
        if (rule.column == column::id || !has_column(local, rule.column)) continue;

        const std::string table = quote_identifier(rules.table);
        const std::string col = quote_identifier(rule.column);
        if (rule.default_value) {
            if (auto value = parse_sql_default(*rule.default_value)) {
                db.execute("UPDATE " + table + " SET " + col + " = ? WHERE " + col + " IS NULL", {*value});
                if (db.changes() > 0) {
                    LOG_INFO("schema", "%s.%s: filled %d null(s) with default", rules.table.c_str(),
                             rule.column.c_str(), db.changes());
                }
            }
        }
        db.execute("DELETE FROM " + table + " WHERE " + col + " IS NULL");
        if (db.changes() > 0) {
            LOG_WARN("schema", "%s.%s: deleted %d row(s) with null in NOT NULL column", rules.table.c_str(),
                     rule.column.c_str(), db.changes());
        }
    }
}

void schema_reconciler::merge_duplicates(const table_rules& rules, const std::vector<table_rules>& all) {
    auto& db = store_.db();
    const std::string table = quote_identifier(rules.table);
    for (const auto& columns : rules.uniques) {
        if (columns.empty() || (columns.size() == 1 && columns[0] == column::id)) continue;

        std::string select = "SELECT id, deleted_at, updated_at";
        std::string where;
        for (size_t i = 0; i < columns.size(); ++i) {
            const std::string col = quote_identifier(columns[i]);
            select += ", " + col + " AS k" + std::to_string(i);
            where += (where.empty() ? " WHERE " : " AND ") + col + " IS NOT NULL";
        }

        // One transaction per constraint, so a failing one leaves the others applied
        try {
            transaction tx(db);
            std::unordered_map<std::string, std::vector<candidate>> groups;
            for (const auto& row : db.query(select + " FROM " + table + where)) {
                std::string key;
                for (size_t i = 0; i < columns.size(); ++i) {
                    auto* v = detail::find_column(row, "k" + std::to_string(i));
                    key += (v ? detail::to_text(*v) : std::string()) + '\x1f';
                }
                candidate cand;
                cand.id = detail::get_string(row, column::id).value_or("");
                cand.alive = detail::is_null(row, column::deleted_at);
                cand.updated_at = detail::get_int(row, column::updated_at).value_or(0);
                groups[key].push_back(std::move(cand));
            }

            for (auto& [key, members] : groups) {
                if (members.size() < 2) continue;
                std::sort(members.begin(), members.end(), outranks);
                const std::string& survivor = members.front().id;

                std::vector<std::string> loser_ids;
                std::vector<column_value_t> losers;
                for (size_t i = 1; i < members.size(); ++i) {
                    loser_ids.push_back(members[i].id);
                    losers.emplace_back(members[i].id);
                }

                // Repoint references at the survivor. A referencing row whose own unique
                // key would collide is left behind and removed by the orphan pass.
                for (const auto& other : all) {
                    for (const auto& fk : other.foreign_keys) {
                        if (fk.ref_table != rules.table || fk.ref_column != column::id) continue;
                        const std::string col = quote_identifier(fk.column);
                        std::vector<column_value_t> params{survivor};
                        params.insert(params.end(), losers.begin(), losers.end());
                        db.execute("UPDATE OR IGNORE " + quote_identifier(other.table) + " SET " + col +
                                   " = ? WHERE " + col + " IN (" + in_list(losers.size()) + ")", params);
                    }
                }

                store_.delete_rows(rules.kind, loser_ids);
                LOG_WARN("schema", "%s: merged %zu duplicate(s) into %s", rules.table.c_str(), losers.size(),
                         survivor.c_str());
            }
            tx.commit();
        } catch (const db_error& e) {
            LOG_WARN("schema", "%s: duplicate merge failed: %s", rules.table.c_str(), e.what());
        }
    }
}

void schema_reconciler::delete_orphans(const table_rules& rules) {
    auto& db = store_.db();
    for (const auto& fk : rules.foreign_keys) {
        if (!db.table_exists(fk.ref_table)) continue;
        const std::string col = quote_identifier(fk.column);
        db.execute("DELETE FROM " + quote_identifier(rules.table) + " WHERE " + col + " IS NOT NULL AND " + col +
                   " NOT IN (SELECT " + quote_identifier(fk.ref_column) + " FROM " +
                   quote_identifier(fk.ref_table) + ")");
        if (db.changes() > 0) {
            LOG_WARN("schema", "%s: deleted %d orphan(s) via %s -> %s", rules.table.c_str(), db.changes(),
                     fk.column.c_str(), fk.ref_table.c_str());
        }
    }
}

void schema_reconciler::repair_local_tables(const schema_snapshot* snapshot) {
    std::vector<table_rules> all;
    for (auto table : all_sync_tables) {
        if (!store_.has_table(table)) continue;
        try {
            all.push_back(rules_for(table, snapshot));
        } catch (const db_error& e) {
            LOG_WARN("schema", "Cannot read rules for %s: %s", to_string(table), e.what());
        }
    }

    // Null fills and merges commit separately; a failed merge keeps the fills
    for (const auto& rules : all) {
        try {
            transaction tx(store_.db());
            fill_nulls(rules, store_.introspect(rules.table));
            tx.commit();
        } catch (const db_error& e) {
            LOG_WARN("schema", "Null repair of %s failed: %s", rules.table.c_str(), e.what());
        }
        merge_duplicates(rules, all);
    }

    // Dependency order, so a parent's deletions cascade into its children
    for (const auto& rules : all) {
        try {
            delete_orphans(rules);
        } catch (const db_error& e) {
            LOG_WARN("schema", "Orphan cleanup of %s failed: %s", rules.table.c_str(), e.what());
        }
    }
}

compat_result schema_reconciler::ensure_compatible(const schema_snapshot* snapshot) {
    try {
        for (auto table : all_sync_tables) {
            const char* name = to_string(table);
            if (!store_.has_table(table)) {
                if (snapshot) return {compat_action::rebuild, std::string("missing table ") + name};
                continue;
            }
            auto local = store_.introspect(name);
            if (!snapshot) continue;
            for (const auto& col : schema_for(table).column_names()) {
                if (!has_column(local, col)) {
                    return {compat_action::rebuild, std::string("missing column ") + name + "." + col};
                }
            }
        }
    } catch (const db_error& e) {
        return {compat_action::rebuild, std::string("introspection failed: ") + e.what()};
    }
    return {};
}

} // namespace tidemark
