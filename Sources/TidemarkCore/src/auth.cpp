#include "tidemark/auth.hpp"
#include "tidemark/log.hpp"

namespace tidemark {

namespace {

bool is_unauthorized(const http_response& response) {
    return response.status_code == 401 || response.status_code == 403;
}

} // namespace

auth_gateway::auth_gateway(std::shared_ptr<session_provider> sessions, retrying_fetcher& fetcher)
    : sessions_(std::move(sessions)), fetcher_(fetcher) {}

bool auth_gateway::has_session() {
    auto s = sessions_->get_session();
    return s && !s->access_token.empty();
}

void auth_gateway::expire(const http_request& request, int status, const std::string& why) {
    LOG_WARN("auth", "%s %s returned %d (%s), clearing session", request.method.c_str(), request.url.c_str(),
             status, why.c_str());
    sessions_->clear_session();
    session_cleared_ = true;
    throw auth_required_error("auth required: " + why);
}

http_response auth_gateway::authed_fetch(http_request request, const retry_policy& policy) {
    auto current = sessions_->get_session();
    const bool signed_in = current && !current->access_token.empty();
    if (signed_in) {
        request.headers["Authorization"] = "Bearer " + current->access_token;
    }

    auto first = fetcher_.fetch(request, policy);
    if (!is_unauthorized(first) || !signed_in) {
        return first;
    }
    if (current->refresh_token.empty()) {
        expire(request, first.status_code, "session expired");
    }

    LOG_INFO("auth", "%s %s returned %d, refreshing session", request.method.c_str(),
             request.url.c_str(), first.status_code);

    auto refreshed = sessions_->refresh(current->refresh_token);
    if (!refreshed.ok || refreshed.access_token.empty()) {
        expire(request, first.status_code, "session refresh failed: " + refreshed.error);
    }

    request.headers["Authorization"] = "Bearer " + refreshed.access_token;
    auto retried = fetcher_.fetch(request, policy);
    if (is_unauthorized(retried)) {
        expire(request, retried.status_code, "refreshed session rejected");
    }
    return retried;
}

} // namespace tidemark
