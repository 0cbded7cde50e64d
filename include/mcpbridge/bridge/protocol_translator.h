#pragma once

#include <mcpbridge/backend/backend_client.h>
#include <mcpbridge/bridge/namespace_resolver.h>
#include <mcpbridge/core/types.h>

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mcpbridge::bridge {

using json = nlohmann::json;

// How one session sees the daemon's catalog
struct SessionOptions {
    BridgeMode mode = BridgeMode::Unified;
    bool namespacing = true;
    std::optional<std::string> targetServer;

    static SessionOptions unified() { return SessionOptions{}; }
    static SessionOptions individual(std::string server, bool namespacing = true) {
        return SessionOptions{BridgeMode::Individual, namespacing, std::move(server)};
    }
};

struct CatalogEntry {
    std::string externalName;
    std::string server;
    backend::ToolDescriptor tool;

    // MCP tool shape: {name, description, inputSchema} with name = externalName
    json toJson() const;
};

using Catalog = std::vector<CatalogEntry>;

// Backend reply shapes, classified once at the translator boundary
struct ContentReply {
    json content; // the reply's "content" array
    bool isError = false;
};
struct TextReply {
    std::string text;
};
struct StructuredReply {
    json value;
};
using BackendReply = std::variant<ContentReply, TextReply, StructuredReply>;

BackendReply classifyReply(const json& raw);

// Protocol-neutral tool result: MCP content blocks plus an error flag
struct NormalizedResult {
    json content = json::array();
    bool isError = false;

    static NormalizedResult fromReply(const BackendReply& reply);
    static NormalizedResult text(std::string text);
    static NormalizedResult failure(const std::string& message);

    // {content:[...]} with "isError": true only on failure
    json toJson() const;
};

/**
 * Mode-aware catalog aggregation and tool invocation shared by every protocol adapter.
 *
 * Catalog refreshes are all-or-nothing: a refresh that completes replaces the cached
 * catalog for its session key in one step, a refresh that fails leaves it untouched.
 * Tool calls never throw; failures come back as NormalizedResult::failure.
 */
class ProtocolTranslator {
public:
    explicit ProtocolTranslator(std::shared_ptr<backend::IBackendClient> backend);

    // Aggregate the catalog for a session. One server failing only drops that server's tools.
    Result<Catalog> listTools(const SessionOptions& options);

    // Last catalog produced by listTools for these options, if any
    std::shared_ptr<const Catalog> cachedTools(const SessionOptions& options) const;

    NormalizedResult callTool(const std::string& externalName, const json& arguments,
                              const SessionOptions& options);

    // Explicit (server, tool) pair, normalized like callTool
    NormalizedResult callToolDirect(const std::string& server, const std::string& tool,
                                    const json& arguments);

    // Raw pass-throughs for REST/WebSocket adapters that mirror the daemon's shapes
    Result<json> forwardCall(const std::string& server, const std::string& tool,
                             const json& arguments);
    Result<json> serversRaw();
    Result<json> serverToolsRaw(const std::string& server);
    Result<std::vector<backend::ServerDescriptor>> listServers();
    Result<backend::ServerDescriptor> getServer(const std::string& name);

    backend::IBackendClient& backend() { return *backend_; }

private:
    static std::string cacheKey(const SessionOptions& options);

    std::shared_ptr<backend::IBackendClient> backend_;
    mutable std::mutex cacheMutex_;
    std::map<std::string, std::shared_ptr<const Catalog>> cache_;
};

} // namespace mcpbridge::bridge
