#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace mcpbridge::config {

inline constexpr const char* kDefaultDaemonUrl = "http://localhost:8090";
inline constexpr const char* kDefaultGatewayKey = "default-dev-key";

// Settings for the stdio bridge process (env MCPD_URL / MCPD_API_KEY / MCPD_TIMEOUT_MS)
struct BridgeConfig {
    std::string daemonUrl = kDefaultDaemonUrl;
    std::optional<std::string> apiKey;
    std::optional<std::string> targetServer;
    bool namespacing = true;
    std::chrono::milliseconds requestTimeout{10'000};

    static BridgeConfig fromEnvironment();
};

// Settings for the HTTP gateway (env HOST / PORT / MCPD_URL / API_KEY / ENABLE_CORS / ...)
struct GatewayConfig {
    std::string bindAddress = "0.0.0.0";
    uint16_t port = 3000;
    std::string daemonUrl = kDefaultDaemonUrl;
    std::set<std::string> apiKeys{kDefaultGatewayKey};
    bool enableCors = true;
    unsigned rateLimitPerMinute = 100;
    std::size_t maxBodyBytes = 10 * 1024 * 1024;
    std::chrono::milliseconds requestTimeout{10'000};

    static GatewayConfig fromEnvironment();
};

// Settings for the daemon supervisor; paths derive from configDir unless set explicitly
struct SupervisorConfig {
    std::filesystem::path configDir;
    std::filesystem::path logPath;
    std::filesystem::path configPath;
    std::string apiBaseUrl = kDefaultDaemonUrl;
    std::optional<std::filesystem::path> bundledResourceDir;
    std::optional<std::filesystem::path> binaryOverride;

    std::chrono::milliseconds healthProbeDelay{5'000};
    std::chrono::milliseconds absoluteTimeout{8'000};
    std::chrono::milliseconds portConflictProbeDelay{500};
    std::chrono::milliseconds restartGrace{1'000};
    std::chrono::milliseconds probeTimeout{2'000};
    std::chrono::milliseconds stopTimeout{10'000};

    // Fills empty paths from configDir (or the default config directory)
    SupervisorConfig& resolvePaths();

    static SupervisorConfig fromEnvironment();
};

} // namespace mcpbridge::config
