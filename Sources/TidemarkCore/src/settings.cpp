#include "tidemark/settings.hpp"
#include "tidemark/log.hpp"
#include <cerrno>
#include <cstdlib>

namespace tidemark {

settings_store::settings_store(database& db) : db_(db) {
    db_.execute("CREATE TABLE IF NOT EXISTS sync_state ("
                "key TEXT PRIMARY KEY NOT NULL, "
                "value TEXT NOT NULL, "
                "updated_at INTEGER NOT NULL)");
}

std::optional<std::string> settings_store::get(const std::string& key) {
    auto rows = db_.query("SELECT value FROM sync_state WHERE key = ?", {key});
    if (rows.empty()) return std::nullopt;
    return detail::get_string(rows.front(), "value");
}

void settings_store::set(const std::string& key, const std::string& value) {
    db_.insert("sync_state",
               {{"key", key}, {"value", value}, {"updated_at", now_ms()}},
               {"key"});
}

void settings_store::remove(const std::string& key) {
    db_.execute("DELETE FROM sync_state WHERE key = ?", {key});
}

std::optional<int64_t> settings_store::get_number(const std::string& key) {
    auto raw = get(key);
    if (!raw || raw->empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(raw->c_str(), &end, 10);
    if (errno != 0 || end == raw->c_str() || *end != '\0') {
        LOG_WARN("settings", "Ignoring non-numeric value for %s: %s", key.c_str(), raw->c_str());
        return std::nullopt;
    }
    return static_cast<int64_t>(v);
}

void settings_store::set_number(const std::string& key, int64_t value) {
    set(key, std::to_string(value));
}

std::string settings_store::client_id() {
    if (auto existing = get(settings_key::client_id); existing && !existing->empty()) {
        return *existing;
    }
    auto id = uuid_t::generate().to_string();
    set(settings_key::client_id, id);
    return id;
}

} // namespace tidemark
