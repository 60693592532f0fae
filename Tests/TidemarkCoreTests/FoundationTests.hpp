#pragma once

#include "TestSupport.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace foundation_tests {

using namespace test_support;
using tidemark::sync_status;

// ============================================================================
// Log shipping buffer
// ============================================================================

void test_log_buffer() {
    std::cout << "Testing log buffer..." << std::endl;

    std::vector<std::vector<std::string>> shipped;
    tidemark::log_buffer buffer(3, 10, [&](const std::vector<std::string>& lines) { shipped.push_back(lines); });

    for (int i = 0; i < 5; ++i) buffer.push("line " + std::to_string(i));

    // Capacity 3: the two oldest lines are gone
    assert(buffer.size() == 3);
    assert(buffer.dropped() == 2);
    assert(shipped.empty());

    buffer.flush();
    assert(shipped.size() == 1);
    assert(shipped[0].size() == 3);
    assert(shipped[0][0] == "line 2");
    assert(shipped[0][2] == "line 4");
    assert(buffer.size() == 0);

    // Threshold flush
    tidemark::log_buffer eager(100, 2, [&](const std::vector<std::string>& lines) { shipped.push_back(lines); });
    eager.push("a");
    assert(shipped.size() == 1);
    eager.push("b");
    assert(shipped.size() == 2);
    assert(shipped[1].size() == 2);

    // Installed buffers receive every formatted line
    auto installed = std::make_shared<tidemark::log_buffer>(10, 0, nullptr);
    auto previous = tidemark::get_log_level();
    tidemark::set_log_level(tidemark::log_level::info);
    tidemark::set_log_buffer(installed);
    LOG_INFO("test", "hello %d", 42);
    LOG_DEBUG("test", "not at this level");
    tidemark::set_log_buffer(nullptr);
    tidemark::set_log_level(previous);
    assert(installed->size() == 1);

    std::cout << "  Log buffer test passed!" << std::endl;
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_defaults_and_json() {
    std::cout << "Testing sync config..." << std::endl;

    tidemark::sync_config defaults;
    assert(defaults.global_push_cap == 1200);
    assert(defaults.cap_for(sync_table::entity_types) == 200);
    assert(defaults.cap_for(sync_table::operations) == 500);
    assert(defaults.cap_for(sync_table::notes) == 500);
    assert(defaults.push_policy.attempts == 5);
    assert(defaults.push_policy.timeout_ms == 180000);
    assert(defaults.schema_policy.timeout_ms == 15000);
    assert(defaults.health_policy.allow_offline);
    assert(defaults.schema_ttl_ms == 6LL * 60 * 60 * 1000);

    auto config = tidemark::sync_config::from_json({
        {"apiBaseUrl", "https://api.example"},
        {"globalPushCap", 50},
        {"tableCaps", {{"notes", 7}, {"no_such_table", 3}}},
        {"retry", {{"pull", {{"attempts", 2}, {"timeoutMs", 1000}}}}},
        {"somethingElse", true},
    });
    assert(config.api_base_url == "https://api.example");
    assert(config.global_push_cap == 50);
    assert(config.cap_for(sync_table::notes) == 7);
    assert(config.pull_policy.attempts == 2);
    assert(config.pull_policy.timeout_ms == 1000);
    assert(config.push_policy.attempts == 5);

    bool threw = false;
    try {
        tidemark::sync_config::from_json({{"globalPushCap", "lots"}});
    } catch (const tidemark::config_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        tidemark::sync_config::from_json({{"e2e", true}});
    } catch (const tidemark::config_error&) {
        threw = true;
    }
    assert(threw);

    // File round trip
    auto path = std::filesystem::temp_directory_path() / ("tidemark_config_" + new_id() + ".json");
    {
        std::ofstream out(path);
        out << R"({"apiBaseUrl": "http://file.example", "pullPageSize": 25})";
    }
    auto from_file = tidemark::sync_config::from_file(path.string());
    assert(from_file.api_base_url == "http://file.example");
    assert(from_file.pull_page_size == 25);
    std::filesystem::remove(path);

    threw = false;
    try {
        tidemark::sync_config::from_file((std::filesystem::temp_directory_path() / "missing_tidemark.json").string());
    } catch (const tidemark::config_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Sync config test passed!" << std::endl;
}

// ============================================================================
// Persisted settings
// ============================================================================

void test_config_rejects_negative_counts() {
    std::cout << "Testing negative config counts..." << std::endl;

    auto rejected = [](const json& j) {
        try {
            tidemark::sync_config::from_json(j);
        } catch (const tidemark::config_error&) {
            return true;
        }
        return false;
    };

    assert(rejected({{"globalPushCap", -1}}));
    assert(rejected({{"defaultTableCap", -20}}));
    assert(rejected({{"pullPageSize", -1}}));
    assert(rejected({{"ledgerPageSize", -3}}));
    assert(rejected({{"tableCaps", {{"entities", -5}}}}));
    assert(rejected({{"tableCaps", {{"entities", 2.5}}}}));

    auto zero = tidemark::sync_config::from_json({{"globalPushCap", 0}, {"tableCaps", {{"entities", 0}}}});
    assert(zero.global_push_cap == 0);
    assert(zero.cap_for(sync_table::entities) == 0);

    std::cout << "  Negative config counts test passed!" << std::endl;
}

void test_config_environment_switch() {
    std::cout << "Testing config environment switch..." << std::endl;

    unsetenv(tidemark::ledger_e2e_env);
    tidemark::sync_config config;
    config.apply_environment();
    assert(!config.e2e_enabled);

    setenv(tidemark::ledger_e2e_env, "0", 1);
    config.apply_environment();
    assert(!config.e2e_enabled);

    setenv(tidemark::ledger_e2e_env, "1", 1);
    config.apply_environment();
    assert(config.e2e_enabled);
    unsetenv(tidemark::ledger_e2e_env);

    std::cout << "  Config environment switch test passed!" << std::endl;
}

void test_settings_store() {
    std::cout << "Testing settings store..." << std::endl;

    tidemark::database db(":memory:");
    tidemark::settings_store settings(db);

    assert(!settings.get(tidemark::settings_key::last_sync_at).has_value());
    settings.set_number(tidemark::settings_key::last_pulled_server_seq, 42);
    assert(settings.get_number(tidemark::settings_key::last_pulled_server_seq) == 42);
    settings.set_number(tidemark::settings_key::last_pulled_server_seq, 43);
    assert(settings.get_number(tidemark::settings_key::last_pulled_server_seq) == 43);

    settings.set(tidemark::settings_key::api_base_url, "not a number");
    assert(!settings.get_number(tidemark::settings_key::api_base_url).has_value());

    settings.remove(tidemark::settings_key::api_base_url);
    assert(!settings.get(tidemark::settings_key::api_base_url).has_value());

    auto id = settings.client_id();
    assert(tidemark::uuid_t::is_valid(id));
    assert(settings.client_id() == id);

    std::cout << "  Settings store test passed!" << std::endl;
}

// ============================================================================
// Table descriptors, wire form and validation
// ============================================================================

void test_schema_descriptors() {
    std::cout << "Testing table descriptors..." << std::endl;

    // Dependency order
    assert(tidemark::all_sync_tables.front() == sync_table::entity_types);
    assert(tidemark::all_sync_tables.back() == sync_table::note_shares);
    for (auto table : tidemark::all_sync_tables) {
        assert(tidemark::parse_sync_table(tidemark::to_string(table)) == table);
        assert(tidemark::schema_for(table).table == table);
    }
    assert(!tidemark::parse_sync_table("users").has_value());

    assert(tidemark::schema_for(sync_table::entity_types).lookup);
    assert(tidemark::schema_for(sync_table::attribute_defs).lookup);
    assert(!tidemark::schema_for(sync_table::entities).lookup);

    auto refs = tidemark::referencing_columns(sync_table::entity_types);
    bool entities_type_id = false;
    for (const auto& [table, column] : refs) {
        if (table == sync_table::entities && column == "type_id") entities_type_id = true;
    }
    assert(entities_type_id);

    tidemark::database db(":memory:");
    tidemark::local_store store(db);
    store.create_schema();
    for (auto table : tidemark::all_sync_tables) {
        assert(store.has_table(table));
    }
    auto uniques = db.unique_indexes("entity_types");
    bool code_unique = false;
    for (const auto& u : uniques) {
        if (u.columns == std::vector<std::string>{"code"}) code_unique = true;
    }
    assert(code_unique);

    // Stored -> wire: booleans become JSON bools, bookkeeping stays local
    auto def = attribute_def_row(new_id(), new_id(), "name", sync_status::pending);
    def["is_required"] = int64_t{1};
    auto wire = tidemark::to_wire(sync_table::attribute_defs, def);
    assert(wire["is_required"] == true);
    assert(!wire.contains("sync_status"));
    assert(!wire.contains("last_server_seq"));
    assert(tidemark::validate_row(sync_table::attribute_defs, wire).empty());

    // Wire -> stored: defaults for missing booleans, JSON objects dumped into text
    json incoming = {{"id", new_id()}, {"entity_type_id", new_id()}, {"code", "x"}, {"name", "X"},
                     {"data_type", "json"}, {"created_at", 1}, {"updated_at", 2},
                     {"meta_json", {{"k", 1}}}, {"unknown", "dropped"}};
    auto stored = tidemark::from_wire(sync_table::attribute_defs, incoming);
    assert(tidemark::detail::get_int(stored, "is_required") == 0);
    assert(tidemark::detail::get_string(stored, "meta_json") == std::string(R"({"k":1})"));
    assert(tidemark::detail::find_column(stored, "unknown") == nullptr);

    // Validation problems
    json bad = {{"id", "not-a-uuid"}, {"created_at", 1}, {"updated_at", 1}, {"owner_user_id", new_id()},
                {"title", ""}, {"importance", "urgent"}};
    auto problems = tidemark::validate_row(sync_table::notes, bad);
    assert(problems.size() == 3);

    std::cout << "  Table descriptors test passed!" << std::endl;
}

// ============================================================================
// Field encryption and keyring
// ============================================================================

void test_field_encryption() {
    std::cout << "Testing field encryption..." << std::endl;

    auto ring = tidemark::keyring::generate();
    auto foreign = tidemark::keyring::generate();
    const std::string secret = R"({"serial":"SN-1"})";

    auto tagged = tidemark::encrypt_text(secret, *ring.primary());
    assert(tidemark::is_e2e_encrypted(tagged));
    assert(tidemark::decrypt_text(tagged, *ring.primary()) == secret);
    assert(!tidemark::decrypt_text(tagged, *foreign.primary()).has_value());
    assert(!tidemark::decrypt_text("enc:e2e:v1:broken", *ring.primary()).has_value());

    // Two encryptions never share a nonce
    assert(tidemark::encrypt_text(secret, *ring.primary()) != tagged);

    json row = {{"id", new_id()}, {"meta_json", secret}, {"payload_json", ""}, {"title", "plain"}};
    auto sealed = tidemark::encrypt_row_sensitive(row, ring.primary());
    assert(tidemark::is_e2e_encrypted(sealed["meta_json"].get<std::string>()));
    assert(sealed["payload_json"] == "");
    assert(sealed["title"] == "plain");

    // Already tagged fields are not sealed twice
    auto twice = tidemark::encrypt_row_sensitive(sealed, ring.primary());
    assert(twice["meta_json"] == sealed["meta_json"]);

    assert(tidemark::decrypt_row_sensitive(sealed, ring)["meta_json"] == secret);

    // A ring without the key leaves ciphertext untouched
    assert(tidemark::decrypt_row_sensitive(sealed, foreign)["meta_json"] == sealed["meta_json"]);

    // Without a key nothing changes
    assert(tidemark::encrypt_row_sensitive(row, nullptr) == row);

    // Base64 and digests
    std::vector<uint8_t> bytes = {0, 1, 2, 250, 251};
    assert(tidemark::base64_decode(tidemark::base64_encode(bytes)) == bytes);
    assert(tidemark::base64_encode(std::vector<uint8_t>{'a', 'b'}) == "YWI=");
    bool threw = false;
    try {
        tidemark::base64_decode("abc");
    } catch (const tidemark::crypto_error&) {
        threw = true;
    }
    assert(threw);
    assert(tidemark::md5_hex("") == "d41d8cd98f00b204e9800998ecf8427e");
    assert(tidemark::sha256_hex("abc") ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    std::cout << "  Field encryption test passed!" << std::endl;
}

void test_keyring_rotation() {
    std::cout << "Testing keyring rotation..." << std::endl;

    auto ring = tidemark::keyring::generate();
    auto first = *ring.primary();
    auto sealed = tidemark::encrypt_text("old secret", first);

    for (int i = 0; i < 8; ++i) ring.rotate();
    assert(ring.keys().size() == 1 + tidemark::keyring::max_previous_keys);
    assert(*ring.primary() != first);

    // The first key fell off the end after more than five rotations
    json row = {{"meta_json", sealed}};
    assert(tidemark::decrypt_row_sensitive(row, ring)["meta_json"] == sealed);

    auto fresh = tidemark::keyring::generate();
    auto old_primary = *fresh.primary();
    fresh.rotate();
    assert(fresh.keys()[1] == old_primary);
    assert(tidemark::decrypt_row_sensitive({{"meta_json", tidemark::encrypt_text("x", old_primary)}}, fresh)["meta_json"] == "x");

    // Persistence
    auto dir = std::filesystem::temp_directory_path() / ("tidemark_keys_" + new_id());
    auto path = (dir / "keyring.json").string();
    auto created = tidemark::keyring::load_or_create(path);
    assert(std::filesystem::exists(path));
    auto loaded = tidemark::keyring::load_or_create(path);
    assert(loaded.keys() == created.keys());

    created.rotate();
    created.save(path);
    auto reloaded = tidemark::keyring::load_or_create(path);
    assert(reloaded.keys().size() == 2);
    assert(*reloaded.primary() == *created.primary());
    assert(reloaded.to_json()["previous"].size() == 1);
    std::filesystem::remove_all(dir);

    std::cout << "  Keyring rotation test passed!" << std::endl;
}

} // namespace foundation_tests
