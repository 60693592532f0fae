#include "tidemark/ledger.hpp"
#include "tidemark/crypto.hpp"
#include "tidemark/log.hpp"

namespace tidemark {

namespace {

int64_t int_value(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) {
        throw ledger_error(std::string("ledger_block_malformed: missing ") + key);
    }
    return it->get<int64_t>();
}

std::string string_value(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw ledger_error(std::string("ledger_block_malformed: missing ") + key);
    }
    return it->get<std::string>();
}

} // namespace

std::string block_content_hash(const std::string& prev_hash, int64_t created_at,
                               const std::vector<std::string>& tx_ids) {
    std::string raw = prev_hash + "|" + std::to_string(created_at) + "|";
    for (size_t i = 0; i < tx_ids.size(); ++i) {
        if (i > 0) raw += ",";
        raw += tx_ids[i];
    }
    return sha256_hex(raw);
}

// MARK: - sqlite_ledger_store

sqlite_ledger_store::sqlite_ledger_store(database& db) : db_(db) {
    db_.execute("CREATE TABLE IF NOT EXISTS ledger_blocks ("
                "height INTEGER PRIMARY KEY, "
                "hash TEXT NOT NULL, "
                "prev_hash TEXT NOT NULL, "
                "created_at INTEGER NOT NULL, "
                "last_seq INTEGER NOT NULL, "
                "block_json TEXT NOT NULL)");
}

ledger_index sqlite_ledger_store::load_index() {
    ledger_index index;
    auto rows = db_.query("SELECT height, hash, last_seq FROM ledger_blocks ORDER BY height DESC LIMIT 1");
    if (rows.empty()) return index;
    index.last_height = detail::get_int(rows.front(), "height").value_or(0);
    index.last_hash = detail::get_string(rows.front(), "hash").value_or(ledger_genesis_hash);
    index.last_seq = detail::get_int(rows.front(), "last_seq").value_or(0);
    return index;
}

void sqlite_ledger_store::append_remote_block(const nlohmann::json& block) {
    if (!block.is_object()) throw ledger_error("ledger_block_malformed: not an object");

    const auto index = load_index();
    const int64_t height = int_value(block, "height");
    if (height != index.last_height + 1) {
        throw ledger_error("ledger_out_of_order: expected=" + std::to_string(index.last_height + 1) +
                           " got=" + std::to_string(height));
    }

    const std::string prev_hash = string_value(block, "prev_hash");
    if (prev_hash != index.last_hash) {
        throw ledger_error("ledger_prev_hash_mismatch at height " + std::to_string(height));
    }

    const int64_t created_at = int_value(block, "created_at");
    std::vector<std::string> tx_ids;
    int64_t last_seq = index.last_seq;
    if (auto txs = block.find("txs"); txs != block.end() && txs->is_array()) {
        for (const auto& tx : *txs) {
            tx_ids.push_back(string_value(tx, "tx_id"));
            if (auto seq = tx.find("seq"); seq != tx.end() && seq->is_number_integer()) {
                last_seq = seq->get<int64_t>();
            }
        }
    }

    const std::string hash = string_value(block, "hash");
    if (block_content_hash(prev_hash, created_at, tx_ids) != hash) {
        throw ledger_error("ledger_block_hash_mismatch at height " + std::to_string(height));
    }

    db_.execute("INSERT INTO ledger_blocks (height, hash, prev_hash, created_at, last_seq, block_json) "
                "VALUES (?, ?, ?, ?, ?, ?)",
                {height, hash, prev_hash, created_at, last_seq, block.dump()});
}

std::optional<nlohmann::json> sqlite_ledger_store::block_at(int64_t height) {
    auto rows = db_.query("SELECT block_json FROM ledger_blocks WHERE height = ?", {height});
    if (rows.empty()) return std::nullopt;
    auto text = detail::get_string(rows.front(), "block_json");
    if (!text) return std::nullopt;
    return nlohmann::json::parse(*text);
}

// MARK: - ledger_replicator

ledger_replicator::ledger_replicator(ledger_block_store& store, auth_gateway& auth, const sync_config& config)
    : store_(store), auth_(auth), config_(config) {}

replicate_result ledger_replicator::replicate() {
    replicate_result result;
    int64_t height = store_.load_index().last_height;
    result.last_height = height;

    while (result.pages < config_.max_ledger_pages) {
        http_request request;
        request.url = make_url(config_.api_base_url, "/ledger/blocks",
                               {{"since", std::to_string(height)},
                                {"limit", std::to_string(config_.ledger_page_size)}});

        http_response response;
        try {
            response = auth_.authed_fetch(request, config_.ledger_policy);
        } catch (const transport_error& e) {
            result.error = std::string("ledger replication failed: ") + e.what();
            break;
        }
        if (!response.is_success()) {
            result.error = "ledger replication failed: HTTP " + std::to_string(response.status_code) + ": " +
                           truncate_for_log(response.body_string());
            break;
        }

        auto body = nlohmann::json::parse(response.body_string(), nullptr, false);
        if (!body.is_object() || !body.value("ok", false)) {
            result.error = "ledger replication failed: " + truncate_for_log(response.body_string());
            break;
        }
        ++result.pages;

        auto blocks = body.find("blocks");
        if (blocks == body.end() || !blocks->is_array() || blocks->empty()) break;

        bool rejected = false;
        for (const auto& block : *blocks) {
            try {
                store_.append_remote_block(block);
                ++result.appended;
            } catch (const ledger_error& e) {
                result.error = std::string("ledger append failed: ") + e.what();
                rejected = true;
                break;
            } catch (const db_error& e) {
                result.error = std::string("ledger append failed: ") + e.what();
                rejected = true;
                break;
            }
        }

        const int64_t stored = store_.load_index().last_height;
        result.last_height = stored;
        if (rejected) break;

        int64_t server_height = stored;
        if (auto h = body.find("last_height"); h != body.end() && h->is_number_integer()) {
            server_height = h->get<int64_t>();
        }
        if (server_height <= height || stored <= height) {
            LOG_WARN("ledger", "Server height stalled at %lld", static_cast<long long>(server_height));
            break;
        }
        height = stored;
    }

    if (result.error) {
        LOG_WARN("ledger", "%s", result.error->c_str());
    } else if (result.appended > 0) {
        LOG_INFO("ledger", "Appended %zu block(s), height %lld", result.appended,
                 static_cast<long long>(result.last_height));
    }
    return result;
}

} // namespace tidemark
