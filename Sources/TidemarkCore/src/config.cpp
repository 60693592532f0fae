#include "tidemark/config.hpp"
#include "tidemark/log.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace tidemark {

namespace {

template<typename T>
void read(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::type_error& e) {
        throw config_error(std::string("config: bad value for '") + key + "': " + e.what());
    }
}

// Counts arrive as signed JSON numbers; a negative one must not wrap into a huge size_t
size_t to_count(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number_integer()) {
        throw config_error("config: " + key + " must be an integer");
    }
    auto n = value.get<int64_t>();
    if (n < 0) {
        LOG_ERROR("config", "Rejecting negative %s (%lld)", key.c_str(), static_cast<long long>(n));
        throw config_error("config: " + key + " must not be negative");
    }
    return static_cast<size_t>(n);
}

void read_count(const nlohmann::json& j, const char* key, size_t& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    out = to_count(*it, key);
}

void read_policy(const nlohmann::json& retry, const char* key, retry_policy& policy) {
    auto it = retry.find(key);
    if (it == retry.end() || it->is_null()) return;
    if (!it->is_object()) {
        throw config_error(std::string("config: retry.") + key + " must be an object");
    }
    read(*it, "attempts", policy.attempts);
    read(*it, "timeoutMs", policy.timeout_ms);
    read(*it, "baseDelayMs", policy.base_delay_ms);
    read(*it, "maxDelayMs", policy.max_delay_ms);
    read(*it, "jitterMs", policy.jitter_ms);
    read(*it, "allowOffline", policy.allow_offline);
    if (policy.attempts < 1) {
        throw config_error(std::string("config: retry.") + key + ".attempts must be at least 1");
    }
}

} // namespace

size_t sync_config::cap_for(sync_table table) const {
    auto it = table_caps.find(table);
    return it == table_caps.end() ? default_table_cap : it->second;
}

sync_config sync_config::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw config_error("config: document must be a JSON object");
    }

    sync_config config;
    read(j, "apiBaseUrl", config.api_base_url);
    read(j, "clientId", config.client_id);
    read(j, "e2e", config.e2e_enabled);
    read(j, "keyringPath", config.keyring_path);
    read_count(j, "globalPushCap", config.global_push_cap);
    read_count(j, "defaultTableCap", config.default_table_cap);
    read_count(j, "pullPageSize", config.pull_page_size);
    read_count(j, "ledgerPageSize", config.ledger_page_size);
    read(j, "maxPushRounds", config.max_push_rounds);
    read(j, "maxPullPages", config.max_pull_pages);
    read(j, "maxLedgerPages", config.max_ledger_pages);
    read(j, "schemaTtlMs", config.schema_ttl_ms);
    read(j, "diagnosticsIntervalMs", config.diagnostics_interval_ms);

    if (auto caps = j.find("tableCaps"); caps != j.end() && !caps->is_null()) {
        if (!caps->is_object()) throw config_error("config: tableCaps must be an object");
        for (auto& [name, value] : caps->items()) {
            auto table = parse_sync_table(name);
            if (!table) {
                LOG_WARN("config", "Ignoring cap for unknown table %s", name.c_str());
                continue;
            }
            config.table_caps[*table] = to_count(value, "tableCaps." + name);
        }
    }

    if (auto retry = j.find("retry"); retry != j.end() && !retry->is_null()) {
        if (!retry->is_object()) throw config_error("config: retry must be an object");
        read_policy(*retry, "push", config.push_policy);
        read_policy(*retry, "pull", config.pull_policy);
        read_policy(*retry, "schema", config.schema_policy);
        read_policy(*retry, "diagnostics", config.diagnostics_policy);
        read_policy(*retry, "ledger", config.ledger_policy);
        read_policy(*retry, "health", config.health_policy);
    }

    if (config.e2e_enabled && config.keyring_path.empty()) {
        throw config_error("config: e2e requires keyringPath");
    }
    return config;
}

sync_config sync_config::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw config_error("config: cannot open " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    try {
        return from_json(nlohmann::json::parse(buffer.str()));
    } catch (const nlohmann::json::parse_error& e) {
        throw config_error("config: cannot parse " + path + ": " + e.what());
    }
}

void sync_config::apply_environment() {
    const char* value = std::getenv(ledger_e2e_env);
    if (value && std::string(value) == "1") {
        e2e_enabled = true;
    }
}

} // namespace tidemark
