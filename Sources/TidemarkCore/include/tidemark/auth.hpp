#pragma once

#ifdef __cplusplus

#include "network.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace tidemark {

class auth_required_error : public std::runtime_error {
public:
    explicit auth_required_error(const std::string& msg) : std::runtime_error(msg) {}
};

struct session {
    std::string access_token;
    std::string refresh_token;
    nlohmann::json user;                 // opaque user info owned by the session provider
};

struct refresh_result {
    bool ok = false;
    std::string access_token;
    std::string error;
};

// ============================================================================
// session_provider - owns tokens; the engine never speaks the auth protocol
// ============================================================================

class session_provider {
public:
    virtual ~session_provider() = default;

    virtual std::optional<session> get_session() = 0;

    /// Exchange a refresh token for a new access token. The provider persists
    /// whatever the exchange returns.
    virtual refresh_result refresh(const std::string& refresh_token) = 0;

    virtual void clear_session() = 0;
};

// ============================================================================
// auth_gateway - bearer auth with a single refresh-and-retry
// ============================================================================

class auth_gateway {
public:
    auth_gateway(std::shared_ptr<session_provider> sessions, retrying_fetcher& fetcher);

    /// Sends `request` with the current bearer token. On 401/403 with a refresh
    /// token, refreshes once and retries once. A signed-in request that ends
    /// unauthorized (no refresh token, refresh failed, or retry rejected) clears
    /// the session and throws auth_required_error. Without a session the
    /// response is returned as is.
    http_response authed_fetch(http_request request, const retry_policy& policy);

    bool has_session();

    /// Set once an unauthorized response has cleared the session
    bool session_cleared() const { return session_cleared_; }
    void reset_session_cleared() { session_cleared_ = false; }

    session_provider& sessions() { return *sessions_; }

private:
    [[noreturn]] void expire(const http_request& request, int status, const std::string& why);

    std::shared_ptr<session_provider> sessions_;
    retrying_fetcher& fetcher_;
    bool session_cleared_ = false;
};

} // namespace tidemark

#endif // __cplusplus
