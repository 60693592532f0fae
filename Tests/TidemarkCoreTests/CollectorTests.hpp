#pragma once

#include "TestSupport.hpp"

namespace collector_tests {

using namespace test_support;
using tidemark::sync_status;

const tidemark::push_pack* find_pack(const std::vector<tidemark::push_pack>& packs, sync_table table) {
    for (const auto& p : packs) {
        if (p.table == table) return &p;
    }
    return nullptr;
}

void test_collect_respects_caps() {
    std::cout << "Testing push batch caps..." << std::endl;

    harness h;
    h.config.global_push_cap = 5;
    h.config.table_caps[sync_table::entity_types] = 2;

    std::vector<row_t> types;
    for (int i = 0; i < 3; ++i) {
        types.push_back(entity_type_row(new_id(), "type-" + std::to_string(i), sync_status::pending));
    }
    h.store.upsert_rows(sync_table::entity_types, types);

    std::vector<row_t> notes;
    for (int i = 0; i < 4; ++i) notes.push_back(note_row(new_id(), sync_status::pending));
    h.store.upsert_rows(sync_table::notes, notes);

    tidemark::pending_collector collector(h.store, h.config);
    auto packs = collector.collect_pending();

    assert(packs.size() == 2);
    assert(packs[0].table == sync_table::entity_types);
    assert(packs[0].rows.size() == 2);
    assert(packs[1].table == sync_table::notes);
    assert(packs[1].rows.size() == 3);
    assert(packs[0].rows[0].contains("code"));
    assert(!packs[0].rows[0].contains("sync_status"));

    // Nothing was marked by collection alone
    assert(h.store.count_by_status(sync_table::entity_types, sync_status::pending) == 3);

    std::cout << "  Push batch caps test passed!" << std::endl;
}

void test_collect_tops_up_lookup_parents() {
    std::cout << "Testing lookup top-up..." << std::endl;

    harness h;
    auto type_id = new_id();
    auto def_id = new_id();
    auto value_id = new_id();
    h.store.upsert_rows(sync_table::entity_types, {entity_type_row(type_id, "engine", sync_status::synced)});
    h.store.upsert_rows(sync_table::attribute_defs,
                        {attribute_def_row(def_id, type_id, "serial", sync_status::synced)});
    h.store.upsert_rows(sync_table::attribute_values,
                        {attribute_value_row(value_id, new_id(), def_id, R"("SN-1")", sync_status::pending)});

    tidemark::pending_collector collector(h.store, h.config);
    auto packs = collector.collect_pending();

    assert(packs.size() == 3);
    assert(packs[0].table == sync_table::entity_types);
    assert(packs[1].table == sync_table::attribute_defs);
    assert(packs[2].table == sync_table::attribute_values);
    assert(packs[0].ids == std::vector<std::string>{type_id});
    assert(packs[1].ids == std::vector<std::string>{def_id});
    assert(packs[2].ids == std::vector<std::string>{value_id});

    // Topped-up parents keep their synced status
    assert(status_of(h.store, sync_table::attribute_defs, def_id) == "synced");

    std::cout << "  Lookup top-up test passed!" << std::endl;
}

void test_collect_quarantines_invalid_rows() {
    std::cout << "Testing invalid row quarantine..." << std::endl;

    harness h;
    auto good = new_id();
    auto bad = new_id();
    h.store.upsert_rows(sync_table::notes, {note_row(good, sync_status::pending),
                                            note_row(bad, sync_status::pending, "urgent")});

    tidemark::pending_collector collector(h.store, h.config);
    auto packs = collector.collect_pending();

    assert(packs.size() == 1);
    assert(packs[0].ids == std::vector<std::string>{good});
    assert(status_of(h.store, sync_table::notes, bad) == "error");
    assert(status_of(h.store, sync_table::notes, good) == "pending");

    // Still invalid: recovery leaves it alone
    assert(collector.recover_error_rows() == 0);
    assert(status_of(h.store, sync_table::notes, bad) == "error");

    std::cout << "  Invalid row quarantine test passed!" << std::endl;
}

void test_recovery_resolves_type_code() {
    std::cout << "Testing error row recovery..." << std::endl;

    harness h;
    auto type_id = new_id();
    auto entity_id = new_id();
    h.store.upsert_rows(sync_table::entity_types, {entity_type_row(type_id, "engine", sync_status::synced)});
    h.store.upsert_rows(sync_table::entities, {entity_row(entity_id, "engine", sync_status::error)});

    tidemark::pending_collector collector(h.store, h.config);
    auto packs = collector.collect_pending();

    assert(column_of(h.store, sync_table::entities, entity_id, "type_id") == type_id);
    assert(status_of(h.store, sync_table::entities, entity_id) == "pending");

    auto entities = find_pack(packs, sync_table::entities);
    assert(entities != nullptr);
    assert(entities->rows[0]["type_id"] == type_id);
    auto types = find_pack(packs, sync_table::entity_types);
    assert(types != nullptr && types->ids == std::vector<std::string>{type_id});

    // Recollection without recovery leaves quarantined rows out
    h.store.set_status(sync_table::entities, {entity_id}, sync_status::error);
    assert(collector.collect_pending(false).empty());

    std::cout << "  Error row recovery test passed!" << std::endl;
}

} // namespace collector_tests
