#include "tidemark/schema.hpp"
#include "tidemark/db.hpp"
#include <algorithm>
#include <sstream>

namespace tidemark {

const char* to_string(sync_table table) {
    switch (table) {
        case sync_table::entity_types: return "entity_types";
        case sync_table::entities: return "entities";
        case sync_table::attribute_defs: return "attribute_defs";
        case sync_table::attribute_values: return "attribute_values";
        case sync_table::operations: return "operations";
        case sync_table::audit_log: return "audit_log";
        case sync_table::chat_messages: return "chat_messages";
        case sync_table::chat_reads: return "chat_reads";
        case sync_table::user_presence: return "user_presence";
        case sync_table::notes: return "notes";
        case sync_table::note_shares: return "note_shares";
    }
    return "";
}

std::optional<sync_table> parse_sync_table(const std::string& name) {
    for (auto table : all_sync_tables) {
        if (name == to_string(table)) return table;
    }
    return std::nullopt;
}

namespace {

field_descriptor uuid_field(const std::string& name, bool required,
                            std::optional<sync_table> references = std::nullopt) {
    field_descriptor f;
    f.name = name;
    f.kind = field_kind::uuid;
    f.required = required;
    f.references = references;
    return f;
}

field_descriptor text_field(const std::string& name, bool required) {
    field_descriptor f;
    f.name = name;
    f.kind = field_kind::text;
    f.required = required;
    f.non_empty = required;
    return f;
}

field_descriptor int_field(const std::string& name, bool required,
                           std::optional<int64_t> default_value = std::nullopt) {
    field_descriptor f;
    f.name = name;
    f.kind = field_kind::integer;
    f.required = required;
    f.default_value = default_value;
    return f;
}

field_descriptor bool_field(const std::string& name) {
    field_descriptor f;
    f.name = name;
    f.kind = field_kind::boolean;
    f.required = true;
    f.default_value = 0;
    return f;
}

field_descriptor enum_field(const std::string& name, bool required, std::vector<std::string> allowed) {
    field_descriptor f;
    f.name = name;
    f.kind = field_kind::enumeration;
    f.required = required;
    f.allowed = std::move(allowed);
    return f;
}

field_descriptor json_field(const std::string& name) {
    field_descriptor f;
    f.name = name;
    f.kind = field_kind::json_text;
    return f;
}

std::vector<std::string> sync_table_names() {
    std::vector<std::string> names;
    for (auto t : all_sync_tables) names.emplace_back(to_string(t));
    return names;
}

table_schema build_schema(sync_table table) {
    table_schema s;
    s.table = table;

    switch (table) {
        case sync_table::entity_types:
            s.fields = {text_field("code", true), text_field("name", true)};
            s.logical_key = {"code"};
            s.unique_index = "entity_types_code_uq";
            s.lookup = true;
            break;

        case sync_table::entities:
            s.fields = {uuid_field("type_id", true, sync_table::entity_types)};
            break;

        case sync_table::attribute_defs:
            s.fields = {
                uuid_field("entity_type_id", true, sync_table::entity_types),
                text_field("code", true),
                text_field("name", true),
                enum_field("data_type", true, {"text", "number", "boolean", "date", "json", "link"}),
                bool_field("is_required"),
                int_field("sort_order", true, 0),
                json_field("meta_json"),
            };
            s.logical_key = {"entity_type_id", "code"};
            s.unique_index = "attribute_defs_type_code_uq";
            s.lookup = true;
            s.sensitive_fields = true;
            break;

        case sync_table::attribute_values:
            s.fields = {
                uuid_field("entity_id", true, sync_table::entities),
                uuid_field("attribute_def_id", true, sync_table::attribute_defs),
                json_field("value_json"),
            };
            s.logical_key = {"entity_id", "attribute_def_id"};
            s.unique_index = "attribute_values_entity_attr_uq";
            break;

        case sync_table::operations:
            s.fields = {
                uuid_field("engine_entity_id", true, sync_table::entities),
                enum_field("operation_type", true,
                           {"acceptance", "kitting", "defect", "repair", "test", "disassembly", "otk",
                            "packaging", "shipment", "customer_delivery", "supply_request"}),
                text_field("status", true),
                text_field("note", false),
                int_field("performed_at", false),
                text_field("performed_by", false),
                json_field("meta_json"),
            };
            s.sensitive_fields = true;
            break;

        case sync_table::audit_log:
            s.fields = {
                text_field("actor", true),
                text_field("action", true),
                uuid_field("entity_id", false),
                enum_field("table_name", false, sync_table_names()),
                json_field("payload_json"),
            };
            s.sensitive_fields = true;
            break;

        case sync_table::chat_messages:
            s.fields = {
                uuid_field("sender_user_id", true),
                text_field("sender_username", true),
                uuid_field("recipient_user_id", false),
                enum_field("message_type", true, {"text", "file", "deep_link"}),
                text_field("body_text", false),
                json_field("payload_json"),
            };
            s.sensitive_fields = true;
            break;

        case sync_table::chat_reads:
            s.fields = {
                uuid_field("message_id", true, sync_table::chat_messages),
                uuid_field("user_id", true),
                int_field("read_at", true),
            };
            s.logical_key = {"message_id", "user_id"};
            s.unique_index = "chat_reads_message_user_uq";
            break;

        case sync_table::user_presence:
            s.fields = {
                uuid_field("user_id", true),
                int_field("last_activity_at", true),
            };
            break;

        case sync_table::notes:
            s.fields = {
                uuid_field("owner_user_id", true),
                text_field("title", true),
                json_field("body_json"),
                enum_field("importance", true, {"normal", "important", "burning", "later"}),
                int_field("due_at", false),
                int_field("sort_order", false, 0),
            };
            break;

        case sync_table::note_shares:
            s.fields = {
                uuid_field("note_id", true, sync_table::notes),
                uuid_field("recipient_user_id", true),
                bool_field("hidden"),
                int_field("sort_order", false, 0),
            };
            s.logical_key = {"note_id", "recipient_user_id"};
            s.unique_index = "note_shares_note_recipient_uq";
            break;
    }
    return s;
}

std::array<table_schema, all_sync_tables.size()> build_all() {
    std::array<table_schema, all_sync_tables.size()> out;
    for (size_t i = 0; i < all_sync_tables.size(); ++i) {
        out[i] = build_schema(all_sync_tables[i]);
    }
    return out;
}

bool is_integer(const nlohmann::json& v) {
    return v.is_number_integer() || v.is_number_unsigned();
}

nlohmann::json column_to_json(const column_value_t* v) {
    if (!v || std::holds_alternative<std::nullptr_t>(*v)) return nullptr;
    return std::visit([](auto&& x) -> nlohmann::json {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            return std::string(x.begin(), x.end());
        } else {
            return x;
        }
    }, *v);
}

} // namespace

const field_descriptor* table_schema::field(const std::string& name) const {
    for (const auto& f : fields) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

std::vector<const field_descriptor*> table_schema::required_references() const {
    std::vector<const field_descriptor*> out;
    for (const auto& f : fields) {
        if (f.required && f.references) out.push_back(&f);
    }
    return out;
}

std::vector<std::string> table_schema::column_names() const {
    std::vector<std::string> names = {
        column::id, column::created_at, column::updated_at,
        column::last_server_seq, column::deleted_at, column::sync_status,
    };
    for (const auto& f : fields) names.push_back(f.name);
    return names;
}

const table_schema& schema_for(sync_table table) {
    static const auto schemas = build_all();
    return schemas[static_cast<size_t>(table)];
}

std::vector<std::pair<sync_table, std::string>> referencing_columns(sync_table parent) {
    std::vector<std::pair<sync_table, std::string>> out;
    for (auto t : all_sync_tables) {
        for (const auto& f : schema_for(t).fields) {
            if (f.references && *f.references == parent) {
                out.emplace_back(t, f.name);
            }
        }
    }
    return out;
}

nlohmann::json to_wire(sync_table table, const row_t& row) {
    const auto& schema = schema_for(table);
    nlohmann::json out = nlohmann::json::object();

    out[column::id] = column_to_json(detail::find_column(row, column::id));
    out[column::created_at] = column_to_json(detail::find_column(row, column::created_at));
    out[column::updated_at] = column_to_json(detail::find_column(row, column::updated_at));
    out[column::deleted_at] = column_to_json(detail::find_column(row, column::deleted_at));

    for (const auto& f : schema.fields) {
        const column_value_t* v = detail::find_column(row, f.name);
        if (!v || std::holds_alternative<std::nullptr_t>(*v)) {
            out[f.name] = nullptr;
            continue;
        }
        switch (f.kind) {
            case field_kind::boolean: {
                auto i = detail::get_int(row, f.name);
                out[f.name] = i ? nlohmann::json(*i != 0) : column_to_json(v);
                break;
            }
            case field_kind::integer:
                out[f.name] = column_to_json(v);
                break;
            case field_kind::uuid:
            case field_kind::text:
            case field_kind::enumeration:
            case field_kind::json_text:
                out[f.name] = std::holds_alternative<std::string>(*v)
                    ? nlohmann::json(std::get<std::string>(*v))
                    : nlohmann::json(detail::to_text(*v));
                break;
        }
    }
    return out;
}

row_t from_wire(sync_table table, const nlohmann::json& wire) {
    const auto& schema = schema_for(table);
    row_t row;

    auto int_or_null = [](const nlohmann::json& v) -> column_value_t {
        if (is_integer(v)) return v.get<int64_t>();
        if (v.is_number_float()) return static_cast<int64_t>(v.get<double>());
        return nullptr;
    };
    auto member = [&](const std::string& key) -> const nlohmann::json* {
        auto it = wire.find(key);
        return it == wire.end() ? nullptr : &*it;
    };

    if (auto* v = member(column::id); v && v->is_string()) {
        row[column::id] = v->get<std::string>();
    }
    for (const char* key : {column::created_at, column::updated_at, column::deleted_at}) {
        auto* v = member(key);
        row[key] = v ? int_or_null(*v) : column_value_t(nullptr);
    }

    for (const auto& f : schema.fields) {
        const nlohmann::json* v = member(f.name);
        column_value_t value = nullptr;
        if (v && !v->is_null()) {
            switch (f.kind) {
                case field_kind::integer:
                    value = int_or_null(*v);
                    break;
                case field_kind::boolean:
                    if (v->is_boolean()) value = static_cast<int64_t>(v->get<bool>() ? 1 : 0);
                    else if (v->is_number()) value = static_cast<int64_t>(v->get<double>() != 0 ? 1 : 0);
                    break;
                case field_kind::json_text:
                    value = v->is_string() ? v->get<std::string>() : v->dump();
                    break;
                case field_kind::uuid:
                case field_kind::text:
                case field_kind::enumeration:
                    if (v->is_string()) value = v->get<std::string>();
                    break;
            }
        }
        if (std::holds_alternative<std::nullptr_t>(value) && f.default_value) {
            value = *f.default_value;
        }
        row[f.name] = std::move(value);
    }
    return row;
}

std::vector<std::string> validate_row(sync_table table, const nlohmann::json& wire) {
    std::vector<std::string> problems;
    if (!wire.is_object()) {
        problems.emplace_back("row is not an object");
        return problems;
    }

    auto id = wire.find(column::id);
    if (id == wire.end() || !id->is_string() || !uuid_t::is_valid(id->get<std::string>())) {
        problems.emplace_back("id: expected uuid");
    }
    for (const char* key : {column::created_at, column::updated_at}) {
        auto it = wire.find(key);
        if (it == wire.end() || !is_integer(*it)) {
            problems.push_back(std::string(key) + ": expected integer");
        }
    }
    if (auto it = wire.find(column::deleted_at); it != wire.end() && !it->is_null() && !is_integer(*it)) {
        problems.emplace_back("deleted_at: expected integer or null");
    }

    for (const auto& f : schema_for(table).fields) {
        auto it = wire.find(f.name);
        if (it == wire.end() || it->is_null()) {
            if (f.required) problems.push_back(f.name + ": required");
            continue;
        }
        const auto& v = *it;
        switch (f.kind) {
            case field_kind::uuid:
                if (!v.is_string() || !uuid_t::is_valid(v.get<std::string>())) {
                    problems.push_back(f.name + ": expected uuid");
                }
                break;
            case field_kind::text:
                if (!v.is_string()) {
                    problems.push_back(f.name + ": expected string");
                } else if (f.non_empty && v.get<std::string>().empty()) {
                    problems.push_back(f.name + ": must not be empty");
                }
                break;
            case field_kind::integer:
                if (!is_integer(v)) problems.push_back(f.name + ": expected integer");
                break;
            case field_kind::boolean:
                if (!v.is_boolean()) problems.push_back(f.name + ": expected boolean");
                break;
            case field_kind::enumeration:
                if (!v.is_string() ||
                    std::find(f.allowed.begin(), f.allowed.end(), v.get<std::string>()) == f.allowed.end()) {
                    problems.push_back(f.name + ": unexpected value");
                }
                break;
            case field_kind::json_text:
                if (!v.is_string()) problems.push_back(f.name + ": expected JSON string");
                break;
        }
    }
    return problems;
}

std::string create_table_sql(sync_table table) {
    const auto& schema = schema_for(table);
    std::ostringstream sql;
    sql << "CREATE TABLE IF NOT EXISTS " << to_string(table) << " ("
        << "id TEXT PRIMARY KEY NOT NULL, "
        << "created_at INTEGER NOT NULL, "
        << "updated_at INTEGER NOT NULL, "
        << "last_server_seq INTEGER, "
        << "deleted_at INTEGER, "
        << "sync_status TEXT NOT NULL DEFAULT 'synced'";

    for (const auto& f : schema.fields) {
        bool numeric = f.kind == field_kind::integer || f.kind == field_kind::boolean;
        sql << ", " << f.name << (numeric ? " INTEGER" : " TEXT");
        if (f.required || f.default_value) sql << " NOT NULL";
        if (f.default_value) sql << " DEFAULT " << *f.default_value;
        if (f.references) sql << " REFERENCES " << to_string(*f.references) << "(id)";
    }
    sql << ")";
    return sql.str();
}

void create_sync_tables(database& db) {
    for (auto table : all_sync_tables) {
        const auto& schema = schema_for(table);
        db.execute(create_table_sql(table));
        db.execute("CREATE INDEX IF NOT EXISTS " + std::string(to_string(table)) + "_sync_status_idx ON " +
                   to_string(table) + "(sync_status)");
        if (!schema.unique_index.empty()) {
            std::string cols;
            for (const auto& c : schema.logical_key) {
                if (!cols.empty()) cols += ", ";
                cols += c;
            }
            db.execute("CREATE UNIQUE INDEX IF NOT EXISTS " + schema.unique_index + " ON " +
                       to_string(table) + "(" + cols + ")");
        }
    }
}

void drop_sync_tables(database& db) {
    // Children first so a connection with foreign keys ON can drop parents
    for (auto it = all_sync_tables.rbegin(); it != all_sync_tables.rend(); ++it) {
        db.execute("DROP TABLE IF EXISTS " + std::string(to_string(*it)));
    }
}

schema_snapshot schema_snapshot::from_json(const nlohmann::json& j) {
    schema_snapshot snap;
    snap.generated_at = j.value("generatedAt", static_cast<epoch_ms_t>(0));

    auto tables = j.find("tables");
    if (tables == j.end() || !tables->is_object()) return snap;

    for (auto& [name, t] : tables->items()) {
        snapshot_table table;
        for (const auto& c : t.value("columns", nlohmann::json::array())) {
            snapshot_column col;
            col.name = c.at("name").get<std::string>();
            col.data_type = c.value("dataType", std::string());
            col.not_null = c.value("notNull", false);
            auto d = c.find("default");
            if (d != c.end() && !d->is_null()) {
                col.default_value = d->is_string() ? d->get<std::string>() : d->dump();
            }
            table.columns.push_back(std::move(col));
        }
        for (const auto& f : t.value("foreignKeys", nlohmann::json::array())) {
            table.foreign_keys.push_back({
                f.at("column").get<std::string>(),
                f.at("refTable").get<std::string>(),
                f.value("refColumn", std::string("id")),
            });
        }
        for (const auto& u : t.value("uniqueConstraints", nlohmann::json::array())) {
            snapshot_unique uc;
            uc.columns = u.at("columns").get<std::vector<std::string>>();
            uc.is_primary = u.value("isPrimary", false);
            table.unique_constraints.push_back(std::move(uc));
        }
        snap.tables.emplace(name, std::move(table));
    }
    return snap;
}

nlohmann::json schema_snapshot::to_json() const {
    nlohmann::json tables_json = nlohmann::json::object();
    for (const auto& [name, t] : tables) {
        nlohmann::json columns = nlohmann::json::array();
        for (const auto& c : t.columns) {
            columns.push_back({
                {"name", c.name},
                {"dataType", c.data_type},
                {"notNull", c.not_null},
                {"default", c.default_value ? nlohmann::json(*c.default_value) : nlohmann::json(nullptr)},
            });
        }
        nlohmann::json fks = nlohmann::json::array();
        for (const auto& f : t.foreign_keys) {
            fks.push_back({{"column", f.column}, {"refTable", f.ref_table}, {"refColumn", f.ref_column}});
        }
        nlohmann::json uniques = nlohmann::json::array();
        for (const auto& u : t.unique_constraints) {
            uniques.push_back({{"columns", u.columns}, {"isPrimary", u.is_primary}});
        }
        tables_json[name] = {{"columns", columns}, {"foreignKeys", fks}, {"uniqueConstraints", uniques}};
    }
    return {{"generatedAt", generated_at}, {"tables", tables_json}};
}

} // namespace tidemark
