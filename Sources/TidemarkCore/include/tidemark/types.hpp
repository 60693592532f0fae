#pragma once

#ifdef __cplusplus

#include <cctype>
#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <variant>
#include <chrono>
#include <array>
#include <random>
#include <sstream>
#include <unordered_map>

namespace tidemark {

// Milliseconds since Unix epoch, the unit of every *_at column
using epoch_ms_t = int64_t;

inline epoch_ms_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// SQLite storage classes
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

// One row as returned by database::query, keyed by column name
using row_t = std::unordered_map<std::string, column_value_t>;

// ============================================================================
// Sync status - lifecycle of a locally mutated row
// ============================================================================

enum class sync_status {
    pending,
    synced,
    error
};

inline const char* to_string(sync_status s) {
    switch (s) {
        case sync_status::pending: return "pending";
        case sync_status::synced: return "synced";
        case sync_status::error: return "error";
    }
    return "synced";
}

inline std::optional<sync_status> parse_sync_status(const std::string& s) {
    if (s == "pending") return sync_status::pending;
    if (s == "synced") return sync_status::synced;
    if (s == "error") return sync_status::error;
    return std::nullopt;
}

// UUID (lowercase hyphenated string on the wire and in storage)
struct uuid_t {
    std::array<uint8_t, 16> bytes{};

    uuid_t() = default;

    explicit uuid_t(const std::array<uint8_t, 16>& b) : bytes(b) {}

    std::string to_string() const {
        static constexpr char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
            out += hex[bytes[i] >> 4];
            out += hex[bytes[i] & 0x0F];
        }
        return out;
    }

    // Random (version 4, RFC 4122 variant)
    static uuid_t generate() {
        thread_local std::mt19937 engine{std::random_device{}()};
        std::uniform_int_distribution<unsigned> octet(0, 255);

        uuid_t id;
        for (auto& b : id.bytes) b = static_cast<uint8_t>(octet(engine));
        id.bytes[6] = static_cast<uint8_t>(0x40 | (id.bytes[6] & 0x0F));
        id.bytes[8] = static_cast<uint8_t>(0x80 | (id.bytes[8] & 0x3F));
        return id;
    }

    // 8-4-4-4-12 hex digits, any version
    static bool is_valid(const std::string& s) {
        if (s.size() != 36) return false;
        for (size_t i = 0; i < s.size(); ++i) {
            char c = s[i];
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (c != '-') return false;
            } else if (!std::isxdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        return true;
    }
};

// ============================================================================
// Helpers for reading typed values out of a row_t
// ============================================================================

namespace detail {

    inline const column_value_t* find_column(const row_t& row, const std::string& key) {
        auto it = row.find(key);
        return it == row.end() ? nullptr : &it->second;
    }

    inline std::optional<std::string> get_string(const row_t& row, const std::string& key) {
        auto* v = find_column(row, key);
        if (v && std::holds_alternative<std::string>(*v)) return std::get<std::string>(*v);
        return std::nullopt;
    }

    inline std::optional<int64_t> get_int(const row_t& row, const std::string& key) {
        auto* v = find_column(row, key);
        if (!v) return std::nullopt;
        if (std::holds_alternative<int64_t>(*v)) return std::get<int64_t>(*v);
        if (std::holds_alternative<double>(*v)) return static_cast<int64_t>(std::get<double>(*v));
        return std::nullopt;
    }

    inline bool is_null(const row_t& row, const std::string& key) {
        auto* v = find_column(row, key);
        return !v || std::holds_alternative<std::nullptr_t>(*v);
    }

    // Text form used for grouping and logging
    inline std::string to_text(const column_value_t& v) {
        if (std::holds_alternative<std::string>(v)) return std::get<std::string>(v);
        if (std::holds_alternative<int64_t>(v)) return std::to_string(std::get<int64_t>(v));
        if (std::holds_alternative<double>(v)) {
            std::ostringstream os;
            os << std::get<double>(v);
            return os.str();
        }
        return "";
    }

} // namespace detail

} // namespace tidemark

#endif // __cplusplus
