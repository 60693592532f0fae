#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <optional>
#include <utility>
#include <vector>

namespace tidemark {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

// Structural facts read back from SQLite (PRAGMA table_info / foreign_key_list / index_list)
struct column_info {
    std::string name;
    std::string type;                       // uppercase declared type
    bool not_null = false;
    std::optional<std::string> default_value;  // raw SQL default expression
    bool primary_key = false;
};

struct foreign_key_info {
    std::string column;
    std::string ref_table;
    std::string ref_column;
};

struct unique_index_info {
    std::string name;
    std::vector<std::string> columns;
    bool is_primary = false;
};

/// "name" with embedded quotes doubled, for identifiers that cannot be bound
std::string quote_identifier(const std::string& name);

class statement;

// One read-write connection to the local store. WAL journal, 5s busy timeout.
class database {
public:
    explicit database(const std::string& path);
    ~database();

    database(const database&) = delete;
    database& operator=(const database&) = delete;

    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    // Schema introspection
    bool table_exists(const std::string& name) const;
    std::vector<column_info> table_columns(const std::string& table) const;
    std::vector<foreign_key_info> foreign_keys(const std::string& table) const;
    std::vector<unique_index_info> unique_indexes(const std::string& table) const;

    void set_foreign_keys(bool enabled);

    // Upsert when conflict_columns is non-empty. preserve_columns keep their
    // stored value on conflict.
    void insert(const std::string& table,
                const std::vector<std::pair<std::string, column_value_t>>& values,
                const std::vector<std::string>& conflict_columns = {},
                const std::vector<std::string>& preserve_columns = {});

    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    // Rows touched by the last execute()
    int changes() const { return sqlite3_changes(db_); }

    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

private:
    friend class statement;

    [[noreturn]] void fail(const char* what, const std::string& sql) const;

    sqlite3* db_ = nullptr;
    std::string path_;
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace tidemark

#endif // __cplusplus
