#include "tidemark/db.hpp"
#include "tidemark/log.hpp"
#include <algorithm>
#include <sstream>
#include <thread>
#include <chrono>

namespace tidemark {

namespace {

std::string joined(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

} // namespace

std::string quote_identifier(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

// ============================================================================
// statement - prepared statement owned for one call
// ============================================================================

class statement {
public:
    statement(const database& owner, const std::string& sql) : owner_(owner), sql_(sql) {
        if (sqlite3_prepare_v2(owner_.db_, sql_.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            owner_.fail("prepare", sql_);
        }
    }

    ~statement() { sqlite3_finalize(stmt_); }

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    void bind_all(const std::vector<column_value_t>& params) {
        int index = 1;
        for (const auto& param : params) bind(index++, param);
    }

    void bind(int index, const column_value_t& value) {
        std::visit([&](auto&& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                sqlite3_bind_null(stmt_, index);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                sqlite3_bind_int64(stmt_, index, v);
            } else if constexpr (std::is_same_v<T, double>) {
                sqlite3_bind_double(stmt_, index, v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                sqlite3_bind_text(stmt_, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            } else {
                sqlite3_bind_blob(stmt_, index, v.empty() ? "" : static_cast<const void*>(v.data()),
                                  static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }, value);
    }

    // True while rows remain. Throws on anything other than ROW or DONE.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc != SQLITE_DONE) owner_.fail("step", sql_);
        return false;
    }

    int columns() const { return sqlite3_column_count(stmt_); }
    const char* name(int i) const { return sqlite3_column_name(stmt_, i); }
    bool is_null(int i) const { return sqlite3_column_type(stmt_, i) == SQLITE_NULL; }
    int integer(int i) const { return sqlite3_column_int(stmt_, i); }

    std::string text(int i) const {
        auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, i));
        return p ? std::string(p, static_cast<size_t>(sqlite3_column_bytes(stmt_, i))) : std::string();
    }

    column_value_t value(int i) const {
        switch (sqlite3_column_type(stmt_, i)) {
            case SQLITE_INTEGER:
                return static_cast<int64_t>(sqlite3_column_int64(stmt_, i));
            case SQLITE_FLOAT:
                return sqlite3_column_double(stmt_, i);
            case SQLITE_TEXT:
                return text(i);
            case SQLITE_BLOB: {
                auto* bytes = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, i));
                return std::vector<uint8_t>(bytes, bytes + sqlite3_column_bytes(stmt_, i));
            }
            default:
                return nullptr;
        }
    }

private:
    const database& owner_;
    std::string sql_;
    sqlite3_stmt* stmt_ = nullptr;
};

// ============================================================================
// database
// ============================================================================

database::database(const std::string& path) : path_(path) {
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Cannot open %s: %s", path.c_str(), error.c_str());
        throw db_error("Cannot open " + path + ": " + error);
    }

    execute("PRAGMA journal_mode = WAL");
    execute("PRAGMA temp_store = MEMORY");
    sqlite3_busy_timeout(db_, 5000);
}

database::~database() {
    if (!db_) return;
    sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
    sqlite3_close(db_);
}

database::database(database&& other) noexcept : db_(other.db_), path_(std::move(other.path_)) {
    other.db_ = nullptr;
}

database& database::operator=(database&& other) noexcept {
    if (this != &other) {
        if (db_) sqlite3_close(db_);
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
    }
    return *this;
}

void database::fail(const char* what, const std::string& sql) const {
    std::string error = sqlite3_errmsg(db_);
    LOG_ERROR("db", "%s failed on %s: %s (SQL: %s)", what, path_.c_str(), error.c_str(), sql.c_str());
    throw db_error(std::string(what) + " failed: " + error + " (SQL: " + sql + ")");
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        // Multi-statement scripts (DDL) go through sqlite3_exec
        char* errmsg = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
            std::string error = errmsg ? errmsg : sqlite3_errmsg(db_);
            sqlite3_free(errmsg);
            LOG_ERROR("db", "exec failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error("exec failed: " + error + " (SQL: " + sql + ")");
        }
        return;
    }

    statement stmt(*this, sql);
    stmt.bind_all(params);
    while (stmt.step()) {
    }
}

std::vector<row_t> database::query(const std::string& sql, const std::vector<column_value_t>& params) {
    statement stmt(*this, sql);
    stmt.bind_all(params);

    std::vector<row_t> rows;
    const int count = stmt.columns();
    while (stmt.step()) {
        row_t row;
        for (int i = 0; i < count; ++i) {
            row[stmt.name(i)] = stmt.value(i);
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

void database::insert(const std::string& table,
                      const std::vector<std::pair<std::string, column_value_t>>& values,
                      const std::vector<std::string>& conflict_columns,
                      const std::vector<std::string>& preserve_columns) {
    std::vector<std::string> names;
    std::vector<std::string> updates;
    std::vector<column_value_t> params;
    auto listed = [](const std::vector<std::string>& list, const std::string& col) {
        return std::find(list.begin(), list.end(), col) != list.end();
    };
    for (const auto& [col, val] : values) {
        names.push_back(col);
        params.push_back(val);
        if (!listed(conflict_columns, col) && !listed(preserve_columns, col)) {
            updates.push_back(col + " = excluded." + col);
        }
    }

    std::ostringstream sql;
    sql << "INSERT INTO " << table << " (" << joined(names, ", ") << ") VALUES (";
    for (size_t i = 0; i < names.size(); ++i) sql << (i ? ", ?" : "?");
    sql << ")";
    if (!conflict_columns.empty()) {
        sql << " ON CONFLICT (" << joined(conflict_columns, ", ") << ")";
        if (updates.empty()) {
            sql << " DO NOTHING";
        } else {
            sql << " DO UPDATE SET " << joined(updates, ", ");
        }
    }

    execute(sql.str(), params);
}

// ============================================================================
// Introspection
// ============================================================================

bool database::table_exists(const std::string& name) const {
    statement stmt(*this, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    stmt.bind(1, name);
    return stmt.step();
}

std::vector<column_info> database::table_columns(const std::string& table) const {
    std::vector<column_info> columns;
    statement stmt(*this, "PRAGMA table_info(" + quote_identifier(table) + ")");
    // cid, name, type, notnull, dflt_value, pk
    while (stmt.step()) {
        column_info col;
        col.name = stmt.text(1);
        col.type = stmt.text(2);
        std::transform(col.type.begin(), col.type.end(), col.type.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        col.not_null = stmt.integer(3) != 0;
        if (!stmt.is_null(4)) col.default_value = stmt.text(4);
        col.primary_key = stmt.integer(5) != 0;
        columns.push_back(std::move(col));
    }
    return columns;
}

std::vector<foreign_key_info> database::foreign_keys(const std::string& table) const {
    std::vector<foreign_key_info> keys;
    statement stmt(*this, "PRAGMA foreign_key_list(" + quote_identifier(table) + ")");
    // id, seq, table, from, to, on_update, on_delete, match
    while (stmt.step()) {
        foreign_key_info fk;
        fk.ref_table = stmt.text(2);
        fk.column = stmt.text(3);
        fk.ref_column = stmt.is_null(4) ? "id" : stmt.text(4);
        keys.push_back(std::move(fk));
    }
    return keys;
}

std::vector<unique_index_info> database::unique_indexes(const std::string& table) const {
    std::vector<unique_index_info> indexes;
    {
        statement list(*this, "PRAGMA index_list(" + quote_identifier(table) + ")");
        // seq, name, unique, origin, partial
        while (list.step()) {
            if (list.integer(2) == 0) continue;
            unique_index_info idx;
            idx.name = list.text(1);
            idx.is_primary = list.text(3) == "pk";
            indexes.push_back(std::move(idx));
        }
    }
    for (auto& idx : indexes) {
        statement info(*this, "PRAGMA index_info(" + quote_identifier(idx.name) + ")");
        // seqno, cid, name
        while (info.step()) idx.columns.push_back(info.text(2));
    }
    return indexes;
}

void database::set_foreign_keys(bool enabled) {
    execute(enabled ? "PRAGMA foreign_keys = ON" : "PRAGMA foreign_keys = OFF");
}

// ============================================================================
// Transactions
// ============================================================================

void database::begin_transaction() {
    // IMMEDIATE takes the write lock now; retry while another connection holds it
    int rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
    int delay_ms = 1;
    int waited_ms = 0;
    while ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && waited_ms < 30000) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        waited_ms += delay_ms;
        delay_ms = std::min(delay_ms * 2, 1000);
        rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
    }
    if (rc != SQLITE_OK) fail("BEGIN", "BEGIN IMMEDIATE");
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    return sqlite3_get_autocommit(db_) == 0;
}

transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (completed_ || !db_.is_in_transaction()) return;
    try {
        db_.rollback();
    } catch (const db_error& e) {
        LOG_ERROR("db", "Rollback in transaction guard failed: %s", e.what());
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

void transaction::rollback() {
    db_.rollback();
    completed_ = true;
}

} // namespace tidemark
