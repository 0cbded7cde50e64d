#pragma once

#include <mcpbridge/core/types.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpbridge::backend {

using json = nlohmann::json;

// One configured tool server as reported by the daemon (read-only here)
struct ServerDescriptor {
    std::string name;
    std::string packageReference;
    std::vector<std::string> declaredTools;
    std::vector<std::string> requiredEnvVars;
    std::vector<std::string> requiredArgs;

    // Accepts either an object entry or a bare name string
    static ServerDescriptor fromJson(const json& j);
    json toJson() const;
};

struct ToolDescriptor {
    std::string rawName;
    std::string description;
    json inputSchema;

    // Fills the description and schema defaults when the daemon omits them
    static ToolDescriptor fromJson(const json& j, const std::string& server);
    json toJson() const;
};

// Parse `{"servers":[...]}` or a bare array; anything else yields an empty list
std::vector<ServerDescriptor> parseServerList(const json& body);
// Parse `{"tools":[...]}`; a missing key yields an empty list
std::vector<ToolDescriptor> parseToolList(const json& body, const std::string& server);

/**
 * Daemon HTTP API (`<baseUrl>/api/v1/...`).
 *
 * Implementations are stateless apart from their configuration, so one instance may
 * serve concurrent callers.
 */
class IBackendClient {
public:
    virtual ~IBackendClient() = default;

    // GET /health
    virtual Result<void> health() = 0;
    // GET /health/servers, falling back to GET /servers
    virtual Result<void> serversHealth() = 0;
    // GET /servers, body as returned
    virtual Result<json> getServers() = 0;
    // GET /servers/{name}/tools, body as returned
    virtual Result<json> getServerTools(const std::string& server) = 0;
    // POST /servers/{name}/tools/{tool}/call with {"arguments": arguments}
    virtual Result<json> invokeTool(const std::string& server, const std::string& tool,
                                    const json& arguments) = 0;

    Result<std::vector<ServerDescriptor>> listServers();
    Result<std::vector<ToolDescriptor>> listTools(const std::string& server);
};

struct BackendClientConfig {
    std::string baseUrl = "http://localhost:8090";
    std::string apiPrefix = "/api/v1";
    std::optional<std::string> apiKey;
    std::chrono::milliseconds timeout{10'000};
    std::chrono::milliseconds connectTimeout{3'000};
};

// libcurl implementation; each request uses its own easy handle
class BackendClient : public IBackendClient {
public:
    explicit BackendClient(BackendClientConfig config);
    ~BackendClient() override;

    Result<void> health() override;
    Result<void> serversHealth() override;
    Result<json> getServers() override;
    Result<json> getServerTools(const std::string& server) override;
    Result<json> invokeTool(const std::string& server, const std::string& tool,
                            const json& arguments) override;

    const BackendClientConfig& config() const noexcept { return config_; }

private:
    struct HttpReply {
        long status = 0;
        std::string body;
    };

    Result<HttpReply> perform(const std::string& method, const std::string& path,
                              const std::optional<std::string>& body) const;
    Result<json> performJson(const std::string& method, const std::string& path,
                             const std::optional<std::string>& body,
                             const std::optional<std::string>& server) const;

    BackendClientConfig config_;
};

// Percent-encode one URL path segment
std::string encodePathSegment(const std::string& segment);

} // namespace mcpbridge::backend
