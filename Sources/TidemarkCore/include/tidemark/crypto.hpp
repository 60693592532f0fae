#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <array>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tidemark {

class crypto_error : public std::runtime_error {
public:
    explicit crypto_error(const std::string& msg) : std::runtime_error(msg) {}
};

using key_bytes = std::array<uint8_t, 32>;

inline constexpr const char* e2e_tag_prefix = "enc:e2e:v1:";

// Row fields protected when end-to-end encryption is on
inline constexpr std::array<const char*, 2> sensitive_fields = {"meta_json", "payload_json"};

std::string base64_encode(const uint8_t* data, size_t len);
inline std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

/// Throws crypto_error on malformed input
std::vector<uint8_t> base64_decode(const std::string& b64);

std::string md5_hex(const std::string& data);
std::string sha256_hex(const std::string& data);

bool is_e2e_encrypted(const std::string& value);

/// AES-256-GCM, random 96-bit nonce, 128-bit tag:
/// enc:e2e:v1:<b64 nonce>:<b64 tag>:<b64 ciphertext>
std::string encrypt_text(const std::string& plaintext, const key_bytes& key);

/// nullopt when `value` is not a well-formed tagged string or the tag does not verify
std::optional<std::string> decrypt_text(const std::string& value, const key_bytes& key);

// ============================================================================
// keyring - ordered keys, primary first
// ============================================================================
//
// Persisted as {"primary": b64, "previous": [b64...], "updatedAt": ms}.
// Rotation pushes the old primary to the front of `previous` and keeps at
// most max_previous_keys of them.

class keyring {
public:
    static constexpr size_t max_previous_keys = 5;

    keyring() = default;
    explicit keyring(std::vector<key_bytes> keys, epoch_ms_t updated_at = 0);

    static key_bytes generate_key();
    static keyring generate();

    static keyring from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    /// Reads the ring at `path`, or writes a fresh one when the file is missing
    static keyring load_or_create(const std::string& path);
    void save(const std::string& path) const;

    void rotate();

    const key_bytes* primary() const { return keys_.empty() ? nullptr : &keys_.front(); }
    const std::vector<key_bytes>& keys() const { return keys_; }
    epoch_ms_t updated_at() const { return updated_at_; }
    bool empty() const { return keys_.empty(); }

private:
    std::vector<key_bytes> keys_;
    epoch_ms_t updated_at_ = 0;
};

/// Encrypts each non-empty, not-yet-tagged sensitive string field. No-op without a key.
nlohmann::json encrypt_row_sensitive(nlohmann::json row, const key_bytes* key);

/// Decrypts each tagged sensitive field with the first ring key that verifies;
/// fields no key opens are left as they are.
nlohmann::json decrypt_row_sensitive(nlohmann::json row, const keyring& ring);

} // namespace tidemark

#endif // __cplusplus
