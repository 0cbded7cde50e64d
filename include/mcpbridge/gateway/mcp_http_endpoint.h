#pragma once

#include <mcpbridge/bridge/protocol_translator.h>
#include <mcpbridge/gateway/auth.h>

#include <memory>
#include <optional>
#include <string>

namespace mcpbridge::gateway {

/**
 * MCP JSON-RPC over plain HTTP POST.
 *
 *   POST /mcp                          all servers, namespaced (serverInfo mcpd-gateway)
 *   POST /partner/<p>/<server>/mcp     one server, names as the server reports them
 *
 * Every request gets a JSON-RPC envelope back with status 200, notifications included.
 */
class McpHttpEndpoint {
public:
    explicit McpHttpEndpoint(std::shared_ptr<bridge::ProtocolTranslator> translator);

    // True when the path (query stripped) belongs to this endpoint
    static bool matches(const std::string& path);

    // Session options for a matching path; std::nullopt for anything else
    static std::optional<bridge::SessionOptions> sessionFor(const std::string& path);

    Response handle(const Request& req);

    // JSON-RPC body in, JSON-RPC envelope out
    json handleBody(const std::string& body, const bridge::SessionOptions& session);

private:
    std::shared_ptr<bridge::ProtocolTranslator> translator_;
};

} // namespace mcpbridge::gateway
