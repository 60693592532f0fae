#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <array>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tidemark {

class database;

// ============================================================================
// Sync tables - closed set, declared in dependency order
// ============================================================================

enum class sync_table {
    entity_types,
    entities,
    attribute_defs,
    attribute_values,
    operations,
    audit_log,
    chat_messages,
    chat_reads,
    user_presence,
    notes,
    note_shares
};

inline constexpr std::array<sync_table, 11> all_sync_tables = {
    sync_table::entity_types,
    sync_table::entities,
    sync_table::attribute_defs,
    sync_table::attribute_values,
    sync_table::operations,
    sync_table::audit_log,
    sync_table::chat_messages,
    sync_table::chat_reads,
    sync_table::user_presence,
    sync_table::notes,
    sync_table::note_shares,
};

const char* to_string(sync_table table);
std::optional<sync_table> parse_sync_table(const std::string& name);

// Bookkeeping columns carried by every sync table
namespace column {
    inline constexpr const char* id = "id";
    inline constexpr const char* created_at = "created_at";
    inline constexpr const char* updated_at = "updated_at";
    inline constexpr const char* deleted_at = "deleted_at";
    inline constexpr const char* last_server_seq = "last_server_seq";
    inline constexpr const char* sync_status = "sync_status";
}

// ============================================================================
// Row descriptors
// ============================================================================

enum class field_kind {
    uuid,
    text,
    integer,
    boolean,      // stored as INTEGER 0/1, JSON bool on the wire
    enumeration,
    json_text     // JSON document carried as a string
};

struct field_descriptor {
    std::string name;
    field_kind kind = field_kind::text;
    bool required = false;                  // must be present and non-null on the wire
    bool non_empty = false;                 // text must have at least one character
    std::vector<std::string> allowed;       // enumeration values
    std::optional<sync_table> references;   // foreign key to <table>.id
    std::optional<int64_t> default_value;   // integer/boolean default for local DDL
};

struct table_schema {
    sync_table table;
    std::vector<field_descriptor> fields;   // domain fields, bookkeeping columns excluded
    std::vector<std::string> logical_key;   // business key, empty when the table has none
    std::string unique_index;               // name of the local unique index on logical_key
    bool lookup = false;                    // reference data resolved by logical key
    bool sensitive_fields = false;          // carries meta_json/payload_json

    const field_descriptor* field(const std::string& name) const;

    /// Required foreign keys, used to drop pulled rows that cannot be linked
    std::vector<const field_descriptor*> required_references() const;

    /// Every local column name, bookkeeping first
    std::vector<std::string> column_names() const;
};

/// Descriptor for one table. Built by an exhaustive switch, so adding a
/// sync_table without a descriptor fails to compile with -Wswitch.
const table_schema& schema_for(sync_table table);

/// Tables whose rows reference `parent`, with the referencing column
std::vector<std::pair<sync_table, std::string>> referencing_columns(sync_table parent);

// ============================================================================
// Wire conversion and validation
// ============================================================================

/// Project a stored row into its wire shape. Bookkeeping columns other than
/// id/created_at/updated_at/deleted_at are omitted.
nlohmann::json to_wire(sync_table table, const row_t& row);

/// Project a wire object onto local columns. Unknown keys are dropped,
/// booleans become 0/1, missing optional fields become NULL.
row_t from_wire(sync_table table, const nlohmann::json& wire);

/// Problems with a wire row; empty when the row is valid.
std::vector<std::string> validate_row(sync_table table, const nlohmann::json& wire);

// ============================================================================
// Local DDL
// ============================================================================

std::string create_table_sql(sync_table table);

/// CREATE TABLE/INDEX IF NOT EXISTS for every sync table
void create_sync_tables(database& db);

/// DROP every sync table. Settings live elsewhere and survive.
void drop_sync_tables(database& db);

// ============================================================================
// Server schema snapshot
// ============================================================================

struct snapshot_column {
    std::string name;
    std::string data_type;
    bool not_null = false;
    std::optional<std::string> default_value;
};

struct snapshot_foreign_key {
    std::string column;
    std::string ref_table;
    std::string ref_column;
};

struct snapshot_unique {
    std::vector<std::string> columns;
    bool is_primary = false;
};

struct snapshot_table {
    std::vector<snapshot_column> columns;
    std::vector<snapshot_foreign_key> foreign_keys;
    std::vector<snapshot_unique> unique_constraints;
};

struct schema_snapshot {
    epoch_ms_t generated_at = 0;
    std::map<std::string, snapshot_table> tables;

    static schema_snapshot from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

} // namespace tidemark

#endif // __cplusplus
