#include "tidemark/crypto.hpp"
#include "tidemark/log.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <sstream>

namespace tidemark {

namespace {

struct cipher_ctx_deleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using cipher_ctx_ptr = std::unique_ptr<EVP_CIPHER_CTX, cipher_ctx_deleter>;

struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

constexpr int nonce_len = 12;
constexpr int tag_len = 16;

std::vector<uint8_t> random_bytes(size_t n) {
    std::vector<uint8_t> out(n);
    if (RAND_bytes(out.data(), static_cast<int>(n)) != 1) {
        throw crypto_error("OpenSSL: RAND_bytes failed");
    }
    return out;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == sep) {
            parts.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(std::move(current));
    return parts;
}

key_bytes key_from_b64(const std::string& b64) {
    auto raw = base64_decode(b64);
    if (raw.size() != 32) {
        throw crypto_error("keyring: key must be 32 bytes, got " + std::to_string(raw.size()));
    }
    key_bytes key{};
    std::copy(raw.begin(), raw.end(), key.begin());
    return key;
}

} // namespace

std::string base64_encode(const uint8_t* data, size_t len) {
    if (len == 0) return "";
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data, static_cast<int>(len));
    if (n < 0) throw crypto_error("OpenSSL: EVP_EncodeBlock failed");
    out.resize(static_cast<size_t>(n));
    return out;
}

std::vector<uint8_t> base64_decode(const std::string& b64) {
    std::string s;
    s.reserve(b64.size());
    for (unsigned char c : b64) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') continue;
        s.push_back(static_cast<char>(c));
    }
    if (s.empty()) return {};
    if (s.size() % 4 != 0) throw crypto_error("invalid base64 length");

    std::vector<uint8_t> out((s.size() * 3) / 4 + 4);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(s.data()),
                            static_cast<int>(s.size()));
    if (n < 0) throw crypto_error("invalid base64");
    out.resize(static_cast<size_t>(n));

    // EVP_DecodeBlock counts padding as zero bytes
    size_t pad = 0;
    if (s.back() == '=') pad++;
    if (s.size() >= 2 && s[s.size() - 2] == '=') pad++;
    if (pad) {
        if (out.size() < pad) throw crypto_error("invalid base64 padding");
        out.resize(out.size() - pad);
    }
    return out;
}

namespace {

std::string digest_hex(const EVP_MD* md, const char* name, const std::string& data) {
    md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) throw crypto_error("OpenSSL: EVP_MD_CTX_new failed");

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw crypto_error(std::string("OpenSSL: EVP ") + name + " digest failed");
    }

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out += hex[digest[i] >> 4];
        out += hex[digest[i] & 0x0F];
    }
    return out;
}

} // namespace

std::string md5_hex(const std::string& data) {
    return digest_hex(EVP_md5(), "md5", data);
}

std::string sha256_hex(const std::string& data) {
    return digest_hex(EVP_sha256(), "sha256", data);
}

bool is_e2e_encrypted(const std::string& value) {
    return value.rfind(e2e_tag_prefix, 0) == 0;
}

std::string encrypt_text(const std::string& plaintext, const key_bytes& key) {
    auto nonce = random_bytes(nonce_len);

    cipher_ctx_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) throw crypto_error("OpenSSL: EVP_CIPHER_CTX_new failed");

    std::vector<uint8_t> ciphertext(plaintext.size() + 16);
    std::vector<uint8_t> tag(tag_len);
    int len = 0;
    int total = 0;

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, nonce_len, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        throw crypto_error("OpenSSL: AES-256-GCM init failed");
    }
    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        throw crypto_error("OpenSSL: AES-256-GCM update failed");
    }
    total = len;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total, &len) != 1) {
        throw crypto_error("OpenSSL: AES-256-GCM final failed");
    }
    total += len;
    ciphertext.resize(static_cast<size_t>(total));

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, tag_len, tag.data()) != 1) {
        throw crypto_error("OpenSSL: AES-256-GCM get tag failed");
    }

    return std::string(e2e_tag_prefix) + base64_encode(nonce) + ":" + base64_encode(tag) + ":" +
           base64_encode(ciphertext);
}

std::optional<std::string> decrypt_text(const std::string& value, const key_bytes& key) {
    if (!is_e2e_encrypted(value)) return std::nullopt;
    auto parts = split(value, ':');
    if (parts.size() != 6 || parts[3].empty() || parts[4].empty() || parts[5].empty()) {
        return std::nullopt;
    }

    std::vector<uint8_t> nonce, tag, data;
    try {
        nonce = base64_decode(parts[3]);
        tag = base64_decode(parts[4]);
        data = base64_decode(parts[5]);
    } catch (const crypto_error& e) {
        LOG_DEBUG("crypto", "Malformed encrypted field: %s", e.what());
        return std::nullopt;
    }
    if (nonce.empty() || tag.size() != tag_len) return std::nullopt;

    cipher_ctx_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) throw crypto_error("OpenSSL: EVP_CIPHER_CTX_new failed");

    std::vector<uint8_t> plaintext(data.size() + 16);
    int len = 0;
    int total = 0;

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        throw crypto_error("OpenSSL: AES-256-GCM init failed");
    }
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, data.data(), static_cast<int>(data.size())) != 1) {
        return std::nullopt;
    }
    total = len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, tag_len, tag.data()) != 1) {
        return std::nullopt;
    }
    // Final fails when the tag does not verify under this key
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) != 1) {
        return std::nullopt;
    }
    total += len;
    return std::string(reinterpret_cast<const char*>(plaintext.data()), static_cast<size_t>(total));
}

keyring::keyring(std::vector<key_bytes> keys, epoch_ms_t updated_at)
    : keys_(std::move(keys)), updated_at_(updated_at) {}

key_bytes keyring::generate_key() {
    auto raw = random_bytes(32);
    key_bytes key{};
    std::copy(raw.begin(), raw.end(), key.begin());
    return key;
}

keyring keyring::generate() {
    return keyring({generate_key()}, now_ms());
}

keyring keyring::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("primary") || !j["primary"].is_string()) {
        throw crypto_error("keyring: missing primary key");
    }
    std::vector<key_bytes> keys;
    keys.push_back(key_from_b64(j["primary"].get<std::string>()));
    if (auto prev = j.find("previous"); prev != j.end() && prev->is_array()) {
        for (const auto& k : *prev) {
            if (!k.is_string()) continue;
            keys.push_back(key_from_b64(k.get<std::string>()));
        }
    }
    epoch_ms_t updated = 0;
    if (auto u = j.find("updatedAt"); u != j.end() && u->is_number()) {
        updated = u->get<epoch_ms_t>();
    }
    return keyring(std::move(keys), updated);
}

nlohmann::json keyring::to_json() const {
    nlohmann::json previous = nlohmann::json::array();
    for (size_t i = 1; i < keys_.size(); ++i) {
        previous.push_back(base64_encode(keys_[i].data(), keys_[i].size()));
    }
    return {
        {"primary", keys_.empty() ? std::string() : base64_encode(keys_[0].data(), keys_[0].size())},
        {"previous", previous},
        {"updatedAt", updated_at_},
    };
}

keyring keyring::load_or_create(const std::string& path) {
    std::ifstream in(path);
    if (in) {
        std::stringstream buffer;
        buffer << in.rdbuf();
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(buffer.str());
        } catch (const nlohmann::json::parse_error& e) {
            throw crypto_error("keyring: cannot parse " + path + ": " + e.what());
        }
        return from_json(j);
    }

    LOG_INFO("crypto", "Creating keyring at %s", path.c_str());
    auto ring = generate();
    ring.save(path);
    return ring;
}

void keyring::save(const std::string& path) const {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out) throw crypto_error("keyring: cannot write " + path);
    out << to_json().dump(2);
    if (!out) throw crypto_error("keyring: write failed for " + path);
}

void keyring::rotate() {
    keys_.insert(keys_.begin(), generate_key());
    if (keys_.size() > max_previous_keys + 1) {
        keys_.resize(max_previous_keys + 1);
    }
    updated_at_ = now_ms();
}

nlohmann::json encrypt_row_sensitive(nlohmann::json row, const key_bytes* key) {
    if (!key || !row.is_object()) return row;
    for (const char* field : sensitive_fields) {
        auto it = row.find(field);
        if (it == row.end() || !it->is_string()) continue;
        const auto& value = it->get_ref<const std::string&>();
        if (value.empty() || is_e2e_encrypted(value)) continue;
        *it = encrypt_text(value, *key);
    }
    return row;
}

nlohmann::json decrypt_row_sensitive(nlohmann::json row, const keyring& ring) {
    if (ring.empty() || !row.is_object()) return row;
    for (const char* field : sensitive_fields) {
        auto it = row.find(field);
        if (it == row.end() || !it->is_string()) continue;
        std::string value = it->get<std::string>();
        if (!is_e2e_encrypted(value)) continue;
        for (const auto& key : ring.keys()) {
            if (auto plain = decrypt_text(value, key)) {
                *it = *plain;
                break;
            }
        }
    }
    return row;
}

} // namespace tidemark
