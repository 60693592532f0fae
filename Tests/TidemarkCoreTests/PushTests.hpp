#pragma once

#include "TestSupport.hpp"

namespace push_tests {

using namespace test_support;
using tidemark::remediation_kind;
using tidemark::sync_status;

struct push_fixture : harness {
    tidemark::pending_collector collector{store, config};
    tidemark::push_transmitter pusher{store, settings, auth, collector, config, nullptr};
};

void test_classify_push_failure() {
    std::cout << "Testing push failure classification..." << std::endl;

    auto dup = tidemark::classify_push_failure(
        R"({"error":"duplicate key value violates unique constraint \"CHAT_READS_MESSAGE_USER_UQ\""})");
    assert(dup.kind == remediation_kind::duplicate_key);
    assert(dup.table == sync_table::chat_reads);

    auto shares = tidemark::classify_push_failure("sync_invalid_row: note_shares_note_recipient_uq");
    assert(shares.kind == remediation_kind::duplicate_key);
    assert(shares.table == sync_table::note_shares);

    auto invalid = tidemark::classify_push_failure(R"({"error":"SYNC_INVALID_ROW","table":"attribute_values"})");
    assert(invalid.kind == remediation_kind::invalid_row);
    assert(invalid.table == sync_table::attribute_values);

    // "entities" inside "entities_archive" is not a table mention
    auto whole_word = tidemark::classify_push_failure("sync_invalid_row in entities_archive for notes");
    assert(whole_word.table == sync_table::notes);

    auto no_table = tidemark::classify_push_failure("sync_invalid_row");
    assert(!no_table.kind.has_value());

    assert(tidemark::classify_push_failure("SYNC_DEPENDENCY_MISSING").kind == remediation_kind::dependency_missing);
    assert(tidemark::classify_push_failure("sync_conflict on entities").kind == remediation_kind::dependency_missing);
    assert(!tidemark::classify_push_failure("internal server error").kind.has_value());

    std::cout << "  Push failure classification test passed!" << std::endl;
}

void test_push_marks_acknowledged_rows() {
    std::cout << "Testing push acknowledgement..." << std::endl;

    push_fixture f;
    auto a = new_id();
    auto b = new_id();
    f.store.upsert_rows(sync_table::notes, {note_row(a, sync_status::pending), note_row(b, sync_status::pending)});
    f.settings.set_number(tidemark::settings_key::last_pulled_server_seq, 12);

    int round = 0;
    f.server->on("POST", "/ledger/tx/submit", [&](const tidemark::http_request& request) {
        auto body = body_json(request);
        ++round;
        if (round == 1) {
            assert(body["txs"].size() == 2);
            for (const auto& tx : body["txs"]) {
                assert(tx["type"] == "upsert");
                assert(tx["table"] == "notes");
                assert(tx["row"]["id"] == tx["row_id"]);
            }
            return json_response(200, {{"ok", true},
                                       {"last_seq", 80},
                                       {"applied_rows", {{{"table", "notes"}, {"rowId", a}, {"seq", 77}}}}});
        }
        assert(body["txs"].size() == 1);
        assert(body["txs"][0]["row_id"] == b);
        return json_response(200, {{"ok", true}});
    });

    auto outcome = f.pusher.push(f.collector.collect_pending());

    assert(!outcome.error);
    assert(outcome.pushed == 2);
    assert(outcome.remediations.empty());
    assert(f.server->count("POST", "/ledger/tx/submit") == 2);
    assert(status_of(f.store, sync_table::notes, a) == "synced");
    assert(tidemark::detail::get_int(*f.store.find_by_id(sync_table::notes, a), "last_server_seq") == 77);
    // No per-row or response sequence: falls back to the stored cursor
    assert(tidemark::detail::get_int(*f.store.find_by_id(sync_table::notes, b), "last_server_seq") == 12);

    std::cout << "  Push acknowledgement test passed!" << std::endl;
}

void test_push_duplicate_remediation_runs_once() {
    std::cout << "Testing duplicate key remediation..." << std::endl;

    push_fixture f;
    auto message_id = new_id();
    f.store.upsert_rows(sync_table::chat_messages, {chat_message_row(message_id, sync_status::pending)});
    std::vector<row_t> reads;
    for (int i = 0; i < 10; ++i) {
        reads.push_back(chat_read_row(new_id(), message_id, new_id(), sync_status::pending));
    }
    f.store.upsert_rows(sync_table::chat_reads, reads);

    f.server->on("POST", "/ledger/tx/submit", [](const tidemark::http_request&) {
        return json_response(409, {{"ok", false},
                                   {"error", "duplicate key value violates unique constraint chat_reads_message_user_uq"}});
    });

    auto outcome = f.pusher.push(f.collector.collect_pending());

    assert(f.server->count("POST", "/ledger/tx/submit") == 2);
    assert(outcome.remediations.size() == 1);
    assert(outcome.remediations.count(remediation_kind::duplicate_key) == 1);
    assert(outcome.error.has_value());
    assert(outcome.pushed == 0);
    assert(count_rows(f.db, "chat_reads") == 0);
    assert(status_of(f.store, sync_table::chat_messages, message_id) == "pending");

    // The second submit carried only the message
    auto second = body_json(f.server->requests_to("POST", "/ledger/tx/submit")[1]);
    assert(second["txs"].size() == 1);
    assert(second["txs"][0]["table"] == "chat_messages");

    std::cout << "  Duplicate key remediation test passed!" << std::endl;
}

void test_push_invalid_row_remediation() {
    std::cout << "Testing invalid row remediation..." << std::endl;

    push_fixture f;
    auto note = new_id();
    f.store.upsert_rows(sync_table::notes, {note_row(note, sync_status::pending)});
    f.server->on("POST", "/ledger/tx/submit", [](const tidemark::http_request&) {
        return json_response(400, {{"ok", false}, {"error", "SYNC_INVALID_ROW"}, {"table", "notes"}});
    });

    auto outcome = f.pusher.push(f.collector.collect_pending());

    // Quarantining empties the batch, so the cycle ends without a second submit
    assert(!outcome.error);
    assert(outcome.remediations.count(remediation_kind::invalid_row) == 1);
    assert(f.server->count("POST", "/ledger/tx/submit") == 1);
    assert(status_of(f.store, sync_table::notes, note) == "error");

    std::cout << "  Invalid row remediation test passed!" << std::endl;
}

void test_push_dependency_remediation() {
    std::cout << "Testing dependency remediation..." << std::endl;

    push_fixture f;
    auto type_id = new_id();
    auto other_type = new_id();
    auto entity_id = new_id();
    f.store.upsert_rows(sync_table::entity_types, {entity_type_row(type_id, "engine", sync_status::synced),
                                                   entity_type_row(other_type, "pump", sync_status::synced)});
    f.store.upsert_rows(sync_table::entities, {entity_row(entity_id, type_id, sync_status::pending)});

    int round = 0;
    f.server->on("POST", "/ledger/tx/submit", [&](const tidemark::http_request&) {
        if (++round == 1) return json_response(409, {{"ok", false}, {"error", "SYNC_DEPENDENCY_MISSING"}});
        return json_response(200, {{"ok", true}, {"last_seq", 9}});
    });

    auto outcome = f.pusher.push(f.collector.collect_pending());

    assert(!outcome.error);
    assert(outcome.force_full_pull);
    assert(outcome.remediations.count(remediation_kind::dependency_missing) == 1);
    assert(outcome.pushed == 3);

    // First batch: the entity plus its topped-up type. Second: every lookup row re-queued.
    auto submits = f.server->requests_to("POST", "/ledger/tx/submit");
    assert(submits.size() == 2);
    assert(body_json(submits[0])["txs"].size() == 2);
    assert(body_json(submits[1])["txs"].size() == 3);

    assert(status_of(f.store, sync_table::entities, entity_id) == "synced");
    assert(status_of(f.store, sync_table::entity_types, other_type) == "synced");
    assert(tidemark::detail::get_int(*f.store.find_by_id(sync_table::entity_types, other_type), "last_server_seq") == 9);

    std::cout << "  Dependency remediation test passed!" << std::endl;
}

void test_push_dependency_pulls_before_retry() {
    std::cout << "Testing full pull before dependency retry..." << std::endl;

    push_fixture f;
    auto type_id = new_id();
    auto entity_id = new_id();
    f.store.upsert_rows(sync_table::entity_types, {entity_type_row(type_id, "engine", sync_status::synced)});
    f.store.upsert_rows(sync_table::entities, {entity_row(entity_id, type_id, sync_status::pending)});

    int round = 0;
    f.server->on("POST", "/ledger/tx/submit", [&](const tidemark::http_request&) {
        if (++round == 1) return json_response(409, {{"ok", false}, {"error", "SYNC_DEPENDENCY_MISSING"}});
        return json_response(200, {{"ok", true}, {"last_seq", 4}});
    });

    std::vector<size_t> submits_at_pull;
    f.pusher.set_full_pull([&] {
        submits_at_pull.push_back(f.server->count("POST", "/ledger/tx/submit"));
        return true;
    });

    auto outcome = f.pusher.push(f.collector.collect_pending());

    // The pull ran once, after the rejected batch and before the retry
    assert(!outcome.error);
    assert(submits_at_pull == std::vector<size_t>{1});
    assert(f.server->count("POST", "/ledger/tx/submit") == 2);
    assert(outcome.full_pulled);
    assert(!outcome.force_full_pull);
    assert(status_of(f.store, sync_table::entities, entity_id) == "synced");

    // A failed pull leaves the decision to the caller
    push_fixture g;
    g.store.upsert_rows(sync_table::entity_types, {entity_type_row(type_id, "engine", sync_status::synced)});
    g.store.upsert_rows(sync_table::entities, {entity_row(entity_id, type_id, sync_status::pending)});
    round = 0;
    g.server->on("POST", "/ledger/tx/submit", [&](const tidemark::http_request&) {
        if (++round == 1) return json_response(409, {{"ok", false}, {"error", "SYNC_DEPENDENCY_MISSING"}});
        return json_response(200, {{"ok", true}, {"last_seq", 4}});
    });
    g.pusher.set_full_pull([] { return false; });

    auto fallback = g.pusher.push(g.collector.collect_pending());
    assert(!fallback.error);
    assert(!fallback.full_pulled);
    assert(fallback.force_full_pull);

    std::cout << "  Full pull before dependency retry test passed!" << std::endl;
}

void test_push_encrypts_sensitive_fields() {
    std::cout << "Testing encrypted push rows..." << std::endl;

    harness h;
    auto ring = tidemark::keyring::generate();
    tidemark::pending_collector collector(h.store, h.config);
    tidemark::push_transmitter pusher(h.store, h.settings, h.auth, collector, h.config, &ring);

    auto op = new_id();
    h.store.upsert_rows(sync_table::operations,
                        {operation_row(op, new_id(), R"({"serial":"SN-9"})", sync_status::pending)});
    auto deleted = note_row(new_id(), sync_status::pending);
    deleted["deleted_at"] = int64_t{5000};
    h.store.upsert_rows(sync_table::notes, {deleted});

    auto txs = pusher.build_transactions(collector.collect_pending())["txs"];
    assert(txs.size() == 2);
    assert(txs[0]["table"] == "operations");
    auto sealed = txs[0]["row"]["meta_json"].get<std::string>();
    assert(tidemark::is_e2e_encrypted(sealed));
    assert(tidemark::decrypt_text(sealed, *ring.primary()) == std::string(R"({"serial":"SN-9"})"));
    assert(txs[1]["type"] == "delete");

    std::cout << "  Encrypted push rows test passed!" << std::endl;
}

} // namespace push_tests
