#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "schema.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tidemark {

// Structural facts of one local table
struct table_introspection {
    std::vector<column_info> columns;
    std::vector<foreign_key_info> foreign_keys;
    std::vector<unique_index_info> unique_indexes;
};

// ============================================================================
// local_store - table-scoped access to the synced tables
// ============================================================================
//
// Foreign key enforcement is off on this connection: pulled pages arrive in
// server order, and orphans are the reconciler's job.

class local_store {
public:
    explicit local_store(database& db);

    database& db() { return db_; }

    // Reads
    std::vector<row_t> select_by_status(sync_table table, sync_status status, size_t limit);
    std::vector<row_t> select_by_ids(sync_table table, const std::vector<std::string>& ids);
    std::optional<row_t> find_by_id(sync_table table, const std::string& id);

    /// Row owning `key` (values in table_schema::logical_key order)
    std::optional<row_t> find_by_logical_key(sync_table table, const std::vector<std::string>& key);

    size_t count_by_status(sync_table table, sync_status status);

    // Writes
    /// Insert-or-update by id. id and created_at of an existing row are kept.
    void upsert_rows(sync_table table, const std::vector<row_t>& rows);

    void set_status(sync_table table, const std::vector<std::string>& ids, sync_status status);

    /// Mark one row synced with the acknowledged sequence
    void mark_synced(sync_table table, const std::string& id, int64_t server_seq);

    /// Move every row in `from` to `to`; returns the number of rows changed
    size_t set_status_all(sync_table table, sync_status from, sync_status to);

    void delete_rows(sync_table table, const std::vector<std::string>& ids);

    // Structure
    bool has_table(sync_table table);
    table_introspection introspect(const std::string& table);
    void create_schema();

    /// Drop and recreate every sync table
    void rebuild();

private:
    database& db_;
};

} // namespace tidemark

#endif // __cplusplus
