#include <mcpbridge/gateway/auth.h>

#include <spdlog/spdlog.h>

namespace mcpbridge::gateway {

namespace {
constexpr std::size_t kPruneThreshold = 4096;
}

ApiKeyAuthenticator::ApiKeyAuthenticator(std::set<std::string> validKeys)
    : validKeys_(std::move(validKeys)) {
    spdlog::debug("ApiKeyAuthenticator configured with {} key(s)", validKeys_.size());
}

bool ApiKeyAuthenticator::authenticateKey(const std::string& apiKey) const {
    return !apiKey.empty() && validKeys_.find(apiKey) != validKeys_.end();
}

std::optional<std::string> ApiKeyAuthenticator::authenticate(const Request& req) const {
    auto key = extractApiKey(req);
    if (key && authenticateKey(*key)) {
        return key;
    }
    return std::nullopt;
}

std::optional<std::string> ApiKeyAuthenticator::extractApiKey(const Request& req) {
    if (auto h = req.find("X-API-Key"); h != req.end() && !h->value().empty()) {
        return std::string(h->value());
    }

    if (auto h = req.find(http::field::authorization); h != req.end()) {
        const std::string header(h->value());
        const std::string bearerPrefix = "Bearer ";
        if (header.rfind(bearerPrefix, 0) == 0 && header.size() > bearerPrefix.size()) {
            return header.substr(bearerPrefix.size());
        }
    }

    // Query parameter as fallback
    return getQueryParam(std::string(req.target()), "apiKey");
}

RateLimiter::RateLimiter(std::size_t requestsPerMinute, std::chrono::milliseconds window)
    : limit_(requestsPerMinute), window_(window) {}

bool RateLimiter::allow(const std::string& clientId, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (clients_.size() > kPruneThreshold) {
        for (auto it = clients_.begin(); it != clients_.end();) {
            if (now - it->second.windowStart >= window_)
                it = clients_.erase(it);
            else
                ++it;
        }
    }

    auto& info = clients_[clientId];
    if (info.count == 0 || now - info.windowStart >= window_) {
        info.windowStart = now;
        info.count = 0;
    }
    ++info.count;
    if (info.count > limit_) {
        spdlog::debug("Rate limit exceeded for client {}", clientId);
        return false;
    }
    return true;
}

} // namespace mcpbridge::gateway
