#include "tidemark/network.hpp"
#include "tidemark/log.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <thread>

namespace tidemark {

int64_t backoff_delay_ms(const retry_policy& policy, int attempt, std::mt19937_64& rng) {
    int64_t delay = policy.base_delay_ms;
    for (int i = 1; i < attempt && delay < policy.max_delay_ms; ++i) {
        delay *= 2;
    }
    delay = std::min(delay, policy.max_delay_ms);
    if (policy.jitter_ms > 0) {
        std::uniform_int_distribution<int64_t> jitter(0, policy.jitter_ms);
        delay += jitter(rng);
    }
    return delay;
}

bool is_retryable(const http_response& response) {
    int s = response.status_code;
    return s == 0 || s == 408 || s == 429 || s >= 500;
}

retrying_fetcher::retrying_fetcher(std::shared_ptr<http_client> client, sleeper sleep)
    : client_(std::move(client))
    , sleep_(std::move(sleep))
    , rng_(std::random_device{}())
{
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

http_response retrying_fetcher::fetch(http_request request, const retry_policy& policy) {
    request.timeout_ms = policy.timeout_ms;
    int attempts = std::max(1, policy.attempts);

    http_response response;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto started = std::chrono::steady_clock::now();
        response = client_->send(request);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();

        if (!is_retryable(response)) {
            return response;
        }

        if (response.is_transport_failure()) {
            LOG_WARN("http", "%s %s failed after %lldms (attempt %d/%d): %s",
                     request.method.c_str(), request.url.c_str(), static_cast<long long>(elapsed),
                     attempt, attempts, response.error.c_str());
        } else {
            LOG_WARN("http", "%s %s returned %d after %lldms (attempt %d/%d): %s",
                     request.method.c_str(), request.url.c_str(), response.status_code,
                     static_cast<long long>(elapsed), attempt, attempts,
                     truncate_for_log(response.body_string()).c_str());
        }

        if (attempt < attempts) {
            sleep_(std::chrono::milliseconds(backoff_delay_ms(policy, attempt, rng_)));
        }
    }

    if (response.is_transport_failure() && !policy.allow_offline) {
        throw transport_error(request.method + " " + request.url + ": " +
                              (response.error.empty() ? std::string("no response") : response.error));
    }
    return response;
}

std::string url_encode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

std::string make_url(const std::string& base, const std::string& path,
                     const std::vector<std::pair<std::string, std::string>>& query) {
    std::string url = base;
    while (!url.empty() && url.back() == '/') url.pop_back();
    if (path.empty() || path.front() != '/') url += '/';
    url += path;

    char sep = '?';
    for (const auto& [key, value] : query) {
        url += sep;
        url += url_encode(key);
        url += '=';
        url += url_encode(value);
        sep = '&';
    }
    return url;
}

std::string truncate_for_log(const std::string& body, size_t limit) {
    if (body.size() <= limit) return body;
    return body.substr(0, limit) + "...";
}

} // namespace tidemark
