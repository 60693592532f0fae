#pragma once

#ifdef __cplusplus

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tidemark {

// ============================================================================
// HTTP Client Interface
// ============================================================================
//
// Abstract interface for HTTP operations. The host application supplies the
// implementation (libcurl, platform networking, or an in-process fake).

struct http_response {
    int status_code = 0;                 // 0: no response (timeout, connection failure)
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;
    std::string error;                   // transport failure description when status_code == 0

    bool is_success() const { return status_code >= 200 && status_code < 300; }
    bool is_transport_failure() const { return status_code == 0; }
    std::string body_string() const {
        return std::string(body.begin(), body.end());
    }
};

struct http_request {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;
    int64_t timeout_ms = 0;              // 0: client default

    void set_body(const std::string& s) {
        body = std::vector<uint8_t>(s.begin(), s.end());
    }

    void set_json_body(const std::string& json) {
        set_body(json);
        headers["Content-Type"] = "application/json";
    }
};

class http_client {
public:
    virtual ~http_client() = default;

    // Synchronous request (blocks until complete or request.timeout_ms elapses).
    // Transport failures are reported as status_code 0, never thrown.
    virtual http_response send(const http_request& request) = 0;
};

class transport_error : public std::runtime_error {
public:
    explicit transport_error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Retry policy
// ============================================================================

struct retry_policy {
    int attempts = 3;
    int64_t timeout_ms = 60000;
    int64_t base_delay_ms = 1000;
    int64_t max_delay_ms = 30000;
    int64_t jitter_ms = 500;
    bool allow_offline = false;          // exhausted transport failures return status 0 instead of throwing
};

/// Delay before retry number `attempt` (1-based): base * 2^(attempt-1) capped
/// at max_delay, plus uniform jitter in [0, jitter_ms].
int64_t backoff_delay_ms(const retry_policy& policy, int attempt, std::mt19937_64& rng);

/// True for responses worth another attempt: no response, 408, 429 and 5xx
bool is_retryable(const http_response& response);

// ============================================================================
// retrying_fetcher - attempts, per-call timeout, exponential backoff
// ============================================================================

class retrying_fetcher {
public:
    using sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit retrying_fetcher(std::shared_ptr<http_client> client, sleeper sleep = nullptr);

    /// Sends `request` up to policy.attempts times. A final HTTP error status is
    /// returned as-is; a final transport failure throws transport_error unless
    /// policy.allow_offline.
    http_response fetch(http_request request, const retry_policy& policy);

    http_client& client() { return *client_; }

private:
    std::shared_ptr<http_client> client_;
    sleeper sleep_;
    std::mt19937_64 rng_;
};

// ============================================================================
// URL helpers
// ============================================================================

std::string url_encode(const std::string& value);

/// base + path with exactly one '/' between them, plus an encoded query string
std::string make_url(const std::string& base, const std::string& path,
                     const std::vector<std::pair<std::string, std::string>>& query = {});

/// Body text cut to `limit` characters for log lines
std::string truncate_for_log(const std::string& body, size_t limit = 4000);

} // namespace tidemark

#endif // __cplusplus
