#include "tidemark/pending_collector.hpp"
#include "tidemark/log.hpp"
#include <algorithm>
#include <unordered_set>

namespace tidemark {

namespace {

constexpr size_t max_logged_ids = 5;
constexpr size_t recovery_scan_limit = 5000;

std::string sample_ids(const std::vector<std::string>& ids) {
    std::string out;
    for (size_t i = 0; i < ids.size() && i < max_logged_ids; ++i) {
        if (i > 0) out += ", ";
        out += ids[i];
    }
    if (ids.size() > max_logged_ids) out += ", ...";
    return out;
}

std::string join_problems(const std::vector<std::string>& problems) {
    std::string out;
    for (const auto& p : problems) {
        if (!out.empty()) out += "; ";
        out += p;
    }
    return out;
}

// Lookup parents a dependent row must be able to resolve on the server,
// listed children-first so a topped-up attribute_def can pull in its entity_type
struct lookup_dependency {
    sync_table child;
    const char* column;
    sync_table parent;
};

constexpr lookup_dependency lookup_dependencies[] = {
    {sync_table::attribute_values, "attribute_def_id", sync_table::attribute_defs},
    {sync_table::attribute_defs, "entity_type_id", sync_table::entity_types},
    {sync_table::entities, "type_id", sync_table::entity_types},
};

push_pack& pack_for(std::vector<push_pack>& packs, sync_table table) {
    for (auto& p : packs) {
        if (p.table == table) return p;
    }
    packs.push_back(push_pack{table, {}, {}});
    return packs.back();
}

} // namespace

pending_collector::pending_collector(local_store& store, const sync_config& config)
    : store_(store), config_(config) {}

std::vector<pending_collector::column_fix> pending_collector::fix_row(sync_table table, nlohmann::json& wire) {
    std::vector<column_fix> fixes;

    auto resolve_type_code = [&](const char* field) {
        auto it = wire.find(field);
        if (it == wire.end() || !it->is_string()) return;
        std::string value = it->get<std::string>();
        if (value.empty() || uuid_t::is_valid(value)) return;
        auto type = store_.find_by_logical_key(sync_table::entity_types, {value});
        if (!type) return;
        auto id = detail::get_string(*type, column::id);
        if (!id) return;
        *it = *id;
        fixes.emplace_back(field, *id);
    };

    switch (table) {
        case sync_table::entities:
            resolve_type_code("type_id");
            break;
        case sync_table::attribute_defs:
            resolve_type_code("entity_type_id");
            break;
        case sync_table::audit_log: {
            auto it = wire.find("table_name");
            if (it != wire.end() && !it->is_null() &&
                (!it->is_string() || !parse_sync_table(it->get<std::string>()))) {
                *it = nullptr;
                fixes.emplace_back("table_name", nullptr);
            }
            break;
        }
        case sync_table::entity_types:
        case sync_table::attribute_values:
        case sync_table::operations:
        case sync_table::chat_messages:
        case sync_table::chat_reads:
        case sync_table::user_presence:
        case sync_table::notes:
        case sync_table::note_shares:
            break;
    }
    return fixes;
}

size_t pending_collector::recover_error_rows() {
    size_t recovered = 0;
    for (auto table : all_sync_tables) {
        auto rows = store_.select_by_status(table, sync_status::error, recovery_scan_limit);
        if (rows.empty()) continue;

        std::vector<std::string> ok_ids;
        for (const auto& row : rows) {
            auto wire = to_wire(table, row);
            auto problems = validate_row(table, wire);
            if (!problems.empty()) {
                auto fixes = fix_row(table, wire);
                if (fixes.empty() || !validate_row(table, wire).empty()) continue;

                auto id = detail::get_string(row, column::id).value_or("");
                for (const auto& [col, value] : fixes) {
                    store_.db().execute("UPDATE " + std::string(to_string(table)) + " SET " + col +
                                        " = ? WHERE id = ?", {value, id});
                }
            }
            if (auto id = detail::get_string(row, column::id)) ok_ids.push_back(*id);
        }

        if (!ok_ids.empty()) {
            store_.set_status(table, ok_ids, sync_status::pending);
            recovered += ok_ids.size();
            LOG_INFO("collect", "%s: %zu error row(s) back to pending", to_string(table), ok_ids.size());
        }
    }
    return recovered;
}

std::vector<push_pack> pending_collector::collect_pending(bool run_recovery) {
    if (run_recovery) {
        recover_error_rows();
    }

    std::vector<push_pack> packs;
    size_t remaining = config_.global_push_cap;

    for (auto table : all_sync_tables) {
        if (remaining == 0) {
            LOG_INFO("collect", "Global push cap %zu reached, %s and later tables wait for the next cycle",
                     config_.global_push_cap, to_string(table));
            break;
        }

        size_t limit = std::min(config_.cap_for(table), remaining);
        auto rows = store_.select_by_status(table, sync_status::pending, limit);
        if (rows.empty()) continue;

        push_pack pack{table, {}, {}};
        std::vector<std::string> invalid;
        std::string first_problem;

        for (const auto& row : rows) {
            auto wire = to_wire(table, row);
            auto problems = validate_row(table, wire);
            auto id = detail::get_string(row, column::id).value_or("");
            if (!problems.empty()) {
                if (first_problem.empty()) first_problem = join_problems(problems);
                invalid.push_back(id);
                continue;
            }
            pack.ids.push_back(id);
            pack.rows.push_back(std::move(wire));
        }

        if (!invalid.empty()) {
            store_.set_status(table, invalid, sync_status::error);
            LOG_WARN("collect", "%s: %zu invalid row(s) marked error (%s): %s", to_string(table),
                     invalid.size(), first_problem.c_str(), sample_ids(invalid).c_str());
        }

        if (!pack.rows.empty()) {
            remaining -= pack.rows.size();
            packs.push_back(std::move(pack));
        }
    }

    top_up(packs, remaining);

    std::sort(packs.begin(), packs.end(), [](const push_pack& a, const push_pack& b) {
        return static_cast<int>(a.table) < static_cast<int>(b.table);
    });
    return packs;
}

void pending_collector::top_up(std::vector<push_pack>& packs, size_t& remaining) {
    for (const auto& dep : lookup_dependencies) {
        auto child = std::find_if(packs.begin(), packs.end(),
                                  [&](const push_pack& p) { return p.table == dep.child; });
        if (child == packs.end()) continue;

        std::vector<std::string> wanted;
        std::unordered_set<std::string> seen;
        for (const auto& row : child->rows) {
            auto it = row.find(dep.column);
            if (it == row.end() || !it->is_string()) continue;
            auto parent_id = it->get<std::string>();
            if (seen.insert(parent_id).second) wanted.push_back(parent_id);
        }
        if (wanted.empty()) continue;

        auto& parent = pack_for(packs, dep.parent);
        std::unordered_set<std::string> included(parent.ids.begin(), parent.ids.end());

        std::vector<std::string> missing;
        for (const auto& id : wanted) {
            if (!included.count(id)) missing.push_back(id);
        }

        size_t added = 0;
        for (const auto& row : store_.select_by_ids(dep.parent, missing)) {
            if (remaining == 0 || parent.rows.size() >= config_.cap_for(dep.parent)) {
                LOG_INFO("collect", "%s top-up stopped at cap", to_string(dep.parent));
                break;
            }
            auto wire = to_wire(dep.parent, row);
            if (!validate_row(dep.parent, wire).empty()) continue;
            parent.ids.push_back(detail::get_string(row, column::id).value_or(""));
            parent.rows.push_back(std::move(wire));
            --remaining;
            ++added;
        }
        if (added > 0) {
            LOG_INFO("collect", "%s: topped up %zu parent row(s) for %s", to_string(dep.parent), added,
                     to_string(dep.child));
        }
    }

    packs.erase(std::remove_if(packs.begin(), packs.end(), [](const push_pack& p) { return p.rows.empty(); }),
                packs.end());
}

} // namespace tidemark
