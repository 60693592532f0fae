#pragma once

#ifdef __cplusplus

#include "auth.hpp"
#include "config.hpp"
#include "crypto.hpp"
#include "local_store.hpp"
#include "pending_collector.hpp"
#include "settings.hpp"
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tidemark {

// Automated corrective actions for a rejected push, one per failure category
enum class remediation_kind {
    duplicate_key,        // drop the pending rows whose logical keys collided
    invalid_row,          // quarantine the table's pending rows as `error`
    dependency_missing    // full pull from cursor 0, re-push lookup rows
};

const char* to_string(remediation_kind kind);

struct push_failure {
    std::optional<remediation_kind> kind;   // nullopt: no automated fix applies
    std::optional<sync_table> table;
};

/// Classifies a rejected push by the server's error text
push_failure classify_push_failure(const std::string& body);

struct push_outcome {
    size_t pushed = 0;
    std::optional<std::string> error;
    bool force_full_pull = false;            // a full pull is still owed after the push
    bool full_pulled = false;                // the dependency remediation pulled from 0
    std::set<remediation_kind> remediations;   // categories used this cycle
};

// ============================================================================
// push_transmitter - ledger transaction submit with bounded remediation
// ============================================================================

class push_transmitter {
public:
    /// `ring` is null when end-to-end encryption is off
    push_transmitter(local_store& store, settings_store& settings, auth_gateway& auth,
                     pending_collector& collector, const sync_config& config, const keyring* ring);

    /// Submits `packs`, recollecting after every success or remediation until
    /// nothing is pending, an unfixable failure occurs, or the round ceiling.
    push_outcome push(std::vector<push_pack> packs);

    /// Pulls from cursor 0 and returns true on success. Run by the
    /// dependency remediation before the retry round. Without one, the
    /// caller is asked to pull through push_outcome::force_full_pull.
    using full_pull_fn = std::function<bool()>;
    void set_full_pull(full_pull_fn fn) { full_pull_ = std::move(fn); }

    /// {"txs": [...]} for one submit request
    nlohmann::json build_transactions(const std::vector<push_pack>& packs) const;

private:
    size_t mark_pushed(const std::vector<push_pack>& packs, const nlohmann::json& ack);
    void remediate(const push_failure& failure, const std::vector<push_pack>& packs, push_outcome& outcome);

    local_store& store_;
    settings_store& settings_;
    auth_gateway& auth_;
    pending_collector& collector_;
    const sync_config& config_;
    const keyring* ring_;
    full_pull_fn full_pull_;
};

} // namespace tidemark

#endif // __cplusplus
