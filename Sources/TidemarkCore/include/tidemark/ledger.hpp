#pragma once

#ifdef __cplusplus

#include "auth.hpp"
#include "config.hpp"
#include "db.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tidemark {

class ledger_error : public std::runtime_error {
public:
    explicit ledger_error(const std::string& msg) : std::runtime_error(msg) {}
};

inline constexpr const char* ledger_genesis_hash = "GENESIS";

struct ledger_index {
    int64_t last_height = 0;
    std::string last_hash = ledger_genesis_hash;
    int64_t last_seq = 0;
};

/// sha256 hex of "<prev_hash>|<created_at>|<tx_id>,<tx_id>,..."
std::string block_content_hash(const std::string& prev_hash, int64_t created_at,
                               const std::vector<std::string>& tx_ids);

// ============================================================================
// ledger_block_store - local replica of the server's block chain
// ============================================================================

class ledger_block_store {
public:
    virtual ~ledger_block_store() = default;

    virtual ledger_index load_index() = 0;

    /// Throws ledger_error when the block does not extend the stored tip
    virtual void append_remote_block(const nlohmann::json& block) = 0;
};

// Blocks kept as JSON documents in a ledger_blocks table next to the sync tables
class sqlite_ledger_store : public ledger_block_store {
public:
    explicit sqlite_ledger_store(database& db);

    ledger_index load_index() override;
    void append_remote_block(const nlohmann::json& block) override;

    std::optional<nlohmann::json> block_at(int64_t height);

private:
    database& db_;
};

struct replicate_result {
    size_t appended = 0;
    int64_t last_height = 0;
    int pages = 0;
    std::optional<std::string> error;
};

// ============================================================================
// ledger_replicator - pages /ledger/blocks into a block store
// ============================================================================

class ledger_replicator {
public:
    ledger_replicator(ledger_block_store& store, auth_gateway& auth, const sync_config& config);

    /// Stops on an empty page, a server height that does not advance, a
    /// rejected block, or the page ceiling. Rejected blocks are not retried.
    replicate_result replicate();

private:
    ledger_block_store& store_;
    auth_gateway& auth_;
    const sync_config& config_;
};

} // namespace tidemark

#endif // __cplusplus
