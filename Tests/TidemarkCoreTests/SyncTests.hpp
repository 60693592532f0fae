#pragma once

#include "TestSupport.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <thread>

namespace sync_tests {

using namespace test_support;
using tidemark::progress_state;
using tidemark::sync_status;

// Engine over an in-memory database with a server that answers every endpoint
struct sync_fixture {
    tidemark::database db{":memory:"};
    std::shared_ptr<fake_server> server = std::make_shared<fake_server>();
    std::shared_ptr<fake_sessions> sessions = std::make_shared<fake_sessions>();
    std::shared_ptr<tidemark::scheduler> scheduler;
    std::unique_ptr<tidemark::sync_engine> engine;

    std::mutex events_mutex;
    std::vector<tidemark::sync_progress_event> events;

    json pending_changes = json::array();
    int64_t cursor = 0;
    bool has_more = false;

    explicit sync_fixture(std::shared_ptr<tidemark::scheduler> sched = nullptr) : scheduler(std::move(sched)) {
        server->on("POST", "/ledger/tx/submit", [](const tidemark::http_request& request) {
            return json_response(200, {{"ok", true}, {"last_seq", 1}, {"received", body_json(request)["txs"].size()}});
        });
        server->on("GET", "/ledger/state/changes", [this](const tidemark::http_request&) {
            json page = {{"changes", pending_changes}, {"server_cursor", cursor}, {"has_more", has_more}};
            if (!has_more) pending_changes = json::array();
            return json_response(200, page);
        });
        server->on("POST", "/diagnostics/consistency/report", [](const tidemark::http_request&) {
            return json_response(200, {{"ok", true}});
        });
        server->on("GET", "/ledger/blocks", [](const tidemark::http_request&) {
            return json_response(200, {{"ok", true}, {"last_height", 0}, {"blocks", json::array()}});
        });
        make_engine();
    }

    void make_engine() {
        engine = std::make_unique<tidemark::sync_engine>(db, server, sessions, test_config(), scheduler, no_sleep);
        engine->set_on_progress([this](const tidemark::sync_progress_event& e) {
            std::lock_guard<std::mutex> lock(events_mutex);
            events.push_back(e);
        });
    }

    bool saw_stage(const std::string& stage) {
        std::lock_guard<std::mutex> lock(events_mutex);
        for (const auto& e : events) {
            if (e.stage == stage) return true;
        }
        return false;
    }
};

void test_engine_round_trip() {
    std::cout << "Testing sync run..." << std::endl;

    sync_fixture f(std::make_shared<tidemark::immediate_scheduler>());
    f.engine->store().create_schema();
    auto note = new_id();
    f.engine->store().upsert_rows(sync_table::notes, {note_row(note, sync_status::pending)});

    auto type_id = new_id();
    f.pending_changes.push_back(change("entity_types", type_id, entity_type_payload(type_id, "engine"), 10));
    f.cursor = 10;

    auto result = f.engine->run_sync();
    assert(result.ok);
    assert(!result.error);
    assert(result.pushed == 1);
    assert(result.pulled == 1);
    assert(result.server_cursor == 10);
    assert(status_of(f.engine->store(), sync_table::notes, note) == "synced");
    assert(f.engine->store().find_by_id(sync_table::entity_types, type_id).has_value());
    assert(f.engine->settings().get(tidemark::settings_key::last_sync_at).has_value());
    assert(f.server->count("GET", "/health") == 1);
    assert(f.server->count("POST", "/diagnostics/consistency/report") == 1);
    assert(f.server->count("GET", "/ledger/blocks") == 1);

    auto pulls = f.server->requests_to("GET", "/ledger/state/changes");
    assert(query_param(pulls[0].url, "since") == "0");
    assert(query_param(pulls[0].url, "client_id") == "client-test");

    // Events: start, stages, then done
    assert(f.events.front().state == progress_state::start);
    assert(f.events.front().mode == tidemark::sync_mode::incremental);
    assert(f.events.back().state == progress_state::done);
    assert(f.events.back().progress == 1.0);
    assert(f.events.back().stage == std::string("finalize"));
    assert(f.saw_stage("prepare"));
    assert(f.saw_stage("apply"));
    assert(f.saw_stage("ledger"));
    bool saw_batch = false;
    for (const auto& e : f.events) {
        if (e.stage == std::string("push") && e.batch == size_t{1}) saw_batch = true;
    }
    assert(saw_batch);

    auto done = f.events.back().to_json();
    assert(done["state"] == "done");
    assert(done["service"] == "sync");
    assert(done["pulled"] == 1);
    assert(result.to_json()["serverCursor"] == 10);

    // The next run continues from the stored cursor
    auto second = f.engine->run_sync();
    assert(second.ok);
    assert(second.pushed == 0);
    pulls = f.server->requests_to("GET", "/ledger/state/changes");
    assert(query_param(pulls.back().url, "since") == "10");

    std::cout << "  Sync run test passed!" << std::endl;
}

void test_engine_requires_session() {
    std::cout << "Testing sync without session..." << std::endl;

    sync_fixture f;
    f.sessions->current.reset();

    auto result = f.engine->run_sync();
    assert(!result.ok);
    assert(result.auth_required);
    assert(result.error == std::string("auth required: please login"));
    assert(f.server->count("GET", "/health") == 0);
    assert(f.events.back().state == progress_state::error);
    assert(f.events.back().error == result.error);

    std::cout << "  Sync without session test passed!" << std::endl;
}

void test_engine_expired_session_requires_login() {
    std::cout << "Testing sync with an expired session..." << std::endl;

    sync_fixture f;
    f.sessions->current->refresh_token.clear();
    f.server->on("GET", "/ledger/state/changes", [](const tidemark::http_request&) {
        return json_response(401, {{"error", "jwt expired"}});
    });

    auto result = f.engine->run_sync();
    assert(!result.ok);
    assert(result.auth_required);
    assert(result.error->rfind("auth required", 0) == 0);
    assert(f.sessions->clear_calls == 1);
    assert(!f.sessions->current.has_value());
    assert(f.events.back().state == progress_state::error);

    // The next run stops before touching the network
    auto again = f.engine->run_sync();
    assert(again.auth_required);
    assert(f.server->count("GET", "/ledger/state/changes") == 1);

    std::cout << "  Sync with an expired session test passed!" << std::endl;
}

void test_engine_reads_e2e_environment() {
    std::cout << "Testing e2e environment switch on the engine..." << std::endl;

    setenv(tidemark::ledger_e2e_env, "1", 1);
    bool threw = false;
    try {
        sync_fixture f;
    } catch (const tidemark::config_error& e) {
        threw = true;
        assert(std::string(e.what()).find("keyring") != std::string::npos);
    }
    unsetenv(tidemark::ledger_e2e_env);
    assert(threw);

    // Without the switch the same config builds a plaintext engine
    sync_fixture plain;
    assert(plain.engine->run_sync().ok);

    std::cout << "  E2e environment switch test passed!" << std::endl;
}

void test_engine_unreachable_server() {
    std::cout << "Testing unreachable server..." << std::endl;

    sync_fixture f;
    f.server->on("GET", "/health", [](const tidemark::http_request&) {
        tidemark::http_response r;
        r.error = "timed out";
        return r;
    });

    auto result = f.engine->run_sync();
    assert(!result.ok);
    assert(!result.auth_required);
    assert(result.error->rfind("server unreachable", 0) == 0);
    assert(f.server->count("GET", "/ledger/state/changes") == 0);

    // A server that answers with an error status is not treated as unreachable
    f.server->on("GET", "/health", [](const tidemark::http_request&) { return text_response(404, "no health"); });
    assert(f.engine->run_sync().ok);

    std::cout << "  Unreachable server test passed!" << std::endl;
}

void test_engine_rebuilds_incompatible_database() {
    std::cout << "Testing incompatible local schema..." << std::endl;

    sync_fixture f;
    f.db.execute("CREATE TABLE notes (id TEXT PRIMARY KEY NOT NULL, created_at INTEGER NOT NULL, "
                 "updated_at INTEGER NOT NULL, last_server_seq INTEGER, deleted_at INTEGER, "
                 "sync_status TEXT NOT NULL DEFAULT 'synced', title TEXT NOT NULL)");
    f.engine->settings().set_number(tidemark::settings_key::last_pulled_server_seq, 50);
    f.server->on("GET", "/diagnostics/sync-schema", [](const tidemark::http_request&) {
        return json_response(200, {{"ok", true}, {"schema", {{"generatedAt", 1}, {"tables", json::object()}}}});
    });

    auto result = f.engine->run_sync();
    assert(!result.ok);
    assert(result.auth_required);
    assert(result.error->find("local database rebuilt (missing column notes.owner_user_id)") != std::string::npos);
    assert(f.sessions->clear_calls == 1);
    assert(f.engine->settings().get_number(tidemark::settings_key::last_pulled_server_seq) == 0);
    assert(f.server->count("GET", "/ledger/state/changes") == 0);

    bool has_owner = false;
    for (const auto& c : f.db.table_columns("notes")) {
        if (c.name == "owner_user_id") has_owner = true;
    }
    assert(has_owner);

    std::cout << "  Incompatible local schema test passed!" << std::endl;
}

void test_engine_full_pull_modes() {
    std::cout << "Testing full pull selection..." << std::endl;

    sync_fixture f;
    f.engine->store().create_schema();

    // Cursor advanced but lookups empty: the run starts over from 0
    f.engine->settings().set_number(tidemark::settings_key::last_pulled_server_seq, 30);
    f.cursor = 30;
    assert(f.engine->run_sync().ok);
    assert(query_param(f.server->requests_to("GET", "/ledger/state/changes").back().url, "since") == "0");

    // Explicit full pull, with its duration recorded for the next estimate
    auto type_id = new_id();
    f.pending_changes.push_back(change("entity_types", type_id, entity_type_payload(type_id, "engine"), 31));
    f.cursor = 31;
    tidemark::sync_options options;
    options.full_pull = true;
    options.estimate_ms = 60000;
    auto result = f.engine->run_sync(options);
    assert(result.ok);
    assert(query_param(f.server->requests_to("GET", "/ledger/state/changes").back().url, "since") == "0");
    assert(f.events.back().mode == tidemark::sync_mode::force_full_pull);
    assert(f.events.back().estimate_ms == int64_t{60000});
    assert(f.engine->settings().get_number(tidemark::settings_key::last_full_pull_duration_ms).has_value());

    // Lookups present again: back to incremental
    assert(f.engine->run_sync().ok);
    assert(query_param(f.server->requests_to("GET", "/ledger/state/changes").back().url, "since") == "31");

    std::cout << "  Full pull selection test passed!" << std::endl;
}

void test_engine_reports_stall() {
    std::cout << "Testing stalled pull..." << std::endl;

    sync_fixture f;
    f.engine->store().create_schema();
    auto type_id = new_id();
    f.pending_changes.push_back(change("entity_types", type_id, entity_type_payload(type_id, "engine"), 0));
    f.cursor = 0;
    f.has_more = true;

    auto result = f.engine->run_sync();
    assert(!result.ok);
    assert(result.pull_stalled);
    assert(result.error->find("pull stalled at cursor 0") != std::string::npos);
    assert(result.to_json()["pullStalled"] == true);

    std::cout << "  Stalled pull test passed!" << std::endl;
}

void test_thread_scheduler_contract() {
    std::cout << "Testing thread scheduler..." << std::endl;

    std::vector<int> order;
    std::atomic<bool> inside_on_thread{false};
    {
        tidemark::std_thread_scheduler worker;
        assert(worker.can_invoke());
        assert(!worker.is_on_thread());
        for (int i = 0; i < 5; ++i) {
            worker.invoke([&, i] {
                if (i == 0) inside_on_thread = worker.is_on_thread() && worker.can_invoke();
                order.push_back(i);
            });
        }
        worker.invoke(nullptr);
    }
    // Queued tasks run in order before the worker joins
    assert(inside_on_thread);
    assert((order == std::vector<int>{0, 1, 2, 3, 4}));

    std::cout << "  Thread scheduler test passed!" << std::endl;
}

void test_progress_through_scheduler() {
    std::cout << "Testing progress delivery..." << std::endl;

    auto worker = std::make_shared<tidemark::std_thread_scheduler>();
    std::thread::id delivered_on;
    std::atomic<int> delivered{0};
    {
        sync_fixture f(worker);
        f.engine->set_on_progress([&](const tidemark::sync_progress_event&) {
            delivered_on = std::this_thread::get_id();
            ++delivered;
        });
        assert(f.engine->run_sync().ok);
    }
    // Dropping the last reference drains the queue and joins the worker
    worker.reset();

    assert(delivered > 0);
    assert(delivered_on != std::this_thread::get_id());

    std::cout << "  Progress delivery test passed!" << std::endl;
}

// ============================================================================
// sync_manager
// ============================================================================

void test_next_delay() {
    std::cout << "Testing automatic sync delay..." << std::endl;

    tidemark::sync_result failed;
    tidemark::sync_result idle;
    idle.ok = true;
    tidemark::sync_result busy_run;
    busy_run.ok = true;
    busy_run.pulled = 3;

    const int64_t base = tidemark::default_auto_interval_ms;
    assert(tidemark::compute_next_delay(failed, 1, base, 0) == 30000);
    assert(tidemark::compute_next_delay(failed, 2, base, 0) == 60000);
    assert(tidemark::compute_next_delay(failed, 3, base, 0) == 120000);
    assert(tidemark::compute_next_delay(failed, 50, base, 0) == 480000);
    assert(tidemark::compute_next_delay(failed, 1, base, 1.0) == 34500);

    assert(tidemark::compute_next_delay(busy_run, 0, base, 0) == 45000);
    assert(tidemark::compute_next_delay(busy_run, 0, 30000, 0) == 15000);

    assert(tidemark::compute_next_delay(idle, 0, base, 0) == base);
    assert(tidemark::compute_next_delay(idle, 0, 1000, 0) == tidemark::min_auto_delay_ms);

    std::cout << "  Automatic sync delay test passed!" << std::endl;
}

void test_manager_single_flight() {
    std::cout << "Testing single in-flight sync..." << std::endl;

    sync_fixture f;
    tidemark::sync_manager manager(*f.engine);

    std::mutex gate_mutex;
    std::condition_variable gate;
    bool entered = false;
    bool release = false;
    f.engine->set_on_progress([&](const tidemark::sync_progress_event& e) {
        if (e.state != progress_state::start) return;
        std::unique_lock<std::mutex> lock(gate_mutex);
        entered = true;
        gate.notify_all();
        gate.wait(lock, [&] { return release; });
    });

    tidemark::sync_result first;
    std::thread runner([&] { first = manager.run_once(); });
    {
        std::unique_lock<std::mutex> lock(gate_mutex);
        gate.wait(lock, [&] { return entered; });
    }

    assert(manager.status().state == tidemark::manager_state::syncing);
    auto rejected = manager.run_once();
    assert(!rejected.ok);
    assert(rejected.error == std::string("sync busy"));

    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        release = true;
    }
    gate.notify_all();
    runner.join();

    assert(first.ok);
    auto status = manager.status();
    assert(status.state == tidemark::manager_state::idle);
    assert(status.last_sync_at.has_value());
    assert(status.last_result.has_value() && status.last_result->ok);
    assert(!status.last_error);

    // Failures are reflected in the status
    f.sessions->current.reset();
    f.engine->set_on_progress(nullptr);
    assert(!manager.run_once().ok);
    assert(manager.status().state == tidemark::manager_state::error);
    assert(manager.status().last_error == std::string("auth required: please login"));
    assert(std::string(tidemark::to_string(manager.status().state)) == "error");

    std::cout << "  Single in-flight sync test passed!" << std::endl;
}

void test_manager_auto_loop() {
    std::cout << "Testing automatic sync loop..." << std::endl;

    sync_fixture f;
    tidemark::sync_manager manager(*f.engine);
    assert(!manager.auto_running());

    manager.start_auto(60 * 1000);
    assert(manager.auto_running());

    // The first run waits a full interval, so stopping right away runs nothing
    manager.stop_auto();
    assert(!manager.auto_running());
    assert(f.server->count("GET", "/health") == 0);
    assert(!manager.status().next_auto_sync_in_ms);

    std::cout << "  Automatic sync loop test passed!" << std::endl;
}

} // namespace sync_tests
