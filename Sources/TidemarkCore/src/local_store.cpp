#include "tidemark/local_store.hpp"
#include "tidemark/log.hpp"
#include <algorithm>
#include <sstream>

namespace tidemark {

namespace {

// SQLite's default SQLITE_MAX_VARIABLE_NUMBER is 999 on older builds
constexpr size_t max_ids_per_statement = 500;

std::string placeholders(size_t n) {
    std::string out;
    for (size_t i = 0; i < n; ++i) {
        if (i > 0) out += ", ";
        out += "?";
    }
    return out;
}

template<typename Fn>
void for_each_chunk(const std::vector<std::string>& ids, Fn&& fn) {
    for (size_t i = 0; i < ids.size(); i += max_ids_per_statement) {
        size_t end = std::min(i + max_ids_per_statement, ids.size());
        std::vector<column_value_t> params;
        params.reserve(end - i);
        for (size_t j = i; j < end; ++j) params.emplace_back(ids[j]);
        fn(params);
    }
}

} // namespace

local_store::local_store(database& db) : db_(db) {
    db_.set_foreign_keys(false);
}

std::vector<row_t> local_store::select_by_status(sync_table table, sync_status status, size_t limit) {
    std::string sql = "SELECT * FROM " + std::string(to_string(table)) +
                      " WHERE sync_status = ? ORDER BY updated_at ASC, id ASC LIMIT ?";
    return db_.query(sql, {std::string(to_string(status)), static_cast<int64_t>(limit)});
}

std::vector<row_t> local_store::select_by_ids(sync_table table, const std::vector<std::string>& ids) {
    std::vector<row_t> out;
    for_each_chunk(ids, [&](const std::vector<column_value_t>& params) {
        std::string sql = "SELECT * FROM " + std::string(to_string(table)) +
                          " WHERE id IN (" + placeholders(params.size()) + ")";
        auto rows = db_.query(sql, params);
        out.insert(out.end(), std::make_move_iterator(rows.begin()), std::make_move_iterator(rows.end()));
    });
    return out;
}

std::optional<row_t> local_store::find_by_id(sync_table table, const std::string& id) {
    auto rows = db_.query("SELECT * FROM " + std::string(to_string(table)) + " WHERE id = ?", {id});
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

std::optional<row_t> local_store::find_by_logical_key(sync_table table, const std::vector<std::string>& key) {
    const auto& schema = schema_for(table);
    if (schema.logical_key.empty() || key.size() != schema.logical_key.size()) {
        return std::nullopt;
    }
    std::ostringstream sql;
    sql << "SELECT * FROM " << to_string(table) << " WHERE ";
    std::vector<column_value_t> params;
    for (size_t i = 0; i < key.size(); ++i) {
        if (i > 0) sql << " AND ";
        sql << schema.logical_key[i] << " = ?";
        params.emplace_back(key[i]);
    }
    sql << " LIMIT 1";
    auto rows = db_.query(sql.str(), params);
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

size_t local_store::count_by_status(sync_table table, sync_status status) {
    auto rows = db_.query("SELECT COUNT(*) AS n FROM " + std::string(to_string(table)) +
                          " WHERE sync_status = ?", {std::string(to_string(status))});
    if (rows.empty()) return 0;
    return static_cast<size_t>(detail::get_int(rows.front(), "n").value_or(0));
}

void local_store::upsert_rows(sync_table table, const std::vector<row_t>& rows) {
    const auto columns = schema_for(table).column_names();
    for (const auto& row : rows) {
        std::vector<std::pair<std::string, column_value_t>> values;
        values.reserve(columns.size());
        for (const auto& col : columns) {
            auto* v = detail::find_column(row, col);
            values.emplace_back(col, v ? *v : column_value_t(nullptr));
        }
        db_.insert(to_string(table), values, {column::id}, {column::created_at});
    }
}

void local_store::set_status(sync_table table, const std::vector<std::string>& ids, sync_status status) {
    for_each_chunk(ids, [&](const std::vector<column_value_t>& chunk) {
        std::vector<column_value_t> params;
        params.reserve(chunk.size() + 1);
        params.emplace_back(std::string(to_string(status)));
        params.insert(params.end(), chunk.begin(), chunk.end());
        db_.execute("UPDATE " + std::string(to_string(table)) + " SET sync_status = ? WHERE id IN (" +
                    placeholders(chunk.size()) + ")", params);
    });
}

void local_store::mark_synced(sync_table table, const std::string& id, int64_t server_seq) {
    db_.execute("UPDATE " + std::string(to_string(table)) +
                " SET sync_status = 'synced', last_server_seq = ? WHERE id = ?",
                {server_seq, id});
}

size_t local_store::set_status_all(sync_table table, sync_status from, sync_status to) {
    db_.execute("UPDATE " + std::string(to_string(table)) + " SET sync_status = ? WHERE sync_status = ?",
                {std::string(tidemark::to_string(to)), std::string(tidemark::to_string(from))});
    return static_cast<size_t>(db_.changes());
}

void local_store::delete_rows(sync_table table, const std::vector<std::string>& ids) {
    for_each_chunk(ids, [&](const std::vector<column_value_t>& params) {
        db_.execute("DELETE FROM " + std::string(to_string(table)) + " WHERE id IN (" +
                    placeholders(params.size()) + ")", params);
    });
}

bool local_store::has_table(sync_table table) {
    return db_.table_exists(to_string(table));
}

table_introspection local_store::introspect(const std::string& table) {
    table_introspection out;
    out.columns = db_.table_columns(table);
    out.foreign_keys = db_.foreign_keys(table);
    out.unique_indexes = db_.unique_indexes(table);
    return out;
}

void local_store::create_schema() {
    create_sync_tables(db_);
}

void local_store::rebuild() {
    LOG_WARN("store", "Rebuilding local sync tables");
    transaction tx(db_);
    drop_sync_tables(db_);
    create_sync_tables(db_);
    tx.commit();
}

} // namespace tidemark
