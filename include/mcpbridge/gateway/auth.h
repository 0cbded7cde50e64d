#pragma once

#include <mcpbridge/gateway/http_types.h>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace mcpbridge::gateway {

/**
 * Static shared-secret check for gateway calls.
 *
 * A key is read from, in order: the X-API-Key header, an `Authorization: Bearer <key>`
 * header, the `apiKey` query parameter.
 */
class ApiKeyAuthenticator {
public:
    explicit ApiKeyAuthenticator(std::set<std::string> validKeys);

    bool authenticateKey(const std::string& apiKey) const;

    // The key that authenticated the request, or std::nullopt
    std::optional<std::string> authenticate(const Request& req) const;

    static std::optional<std::string> extractApiKey(const Request& req);

private:
    std::set<std::string> validKeys_;
};

/**
 * Fixed one-minute window counter per client id. Thread-safe.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(std::size_t requestsPerMinute,
                         std::chrono::milliseconds window = std::chrono::minutes(1));

    // Count one request; false once the client exceeded its budget for the current window
    bool allow(const std::string& clientId, Clock::time_point now = Clock::now());

    std::size_t limit() const noexcept { return limit_; }

private:
    struct ClientInfo {
        std::size_t count = 0;
        Clock::time_point windowStart;
    };

    std::size_t limit_;
    std::chrono::milliseconds window_;
    std::mutex mutex_;
    std::unordered_map<std::string, ClientInfo> clients_;
};

} // namespace mcpbridge::gateway
