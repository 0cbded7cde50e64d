#pragma once

#include <mcpbridge/bridge/protocol_translator.h>
#include <mcpbridge/mcp/error_handling.h>

#include <memory>
#include <optional>
#include <string>

namespace mcpbridge::mcp {

struct DispatcherOptions {
    bridge::SessionOptions session;
    std::string serverName = "mcpd-bridge";
    std::string serverVersion = "1.0.0";
    // Advertise resources/prompts capabilities in initialize (HTTP endpoint)
    bool advertiseResourcesAndPrompts = false;
    // Answer messages without an id instead of treating them as notifications (HTTP endpoint)
    bool answerNotifications = false;
};

/**
 * JSON-RPC 2.0 method table for an MCP session, shared by the stdio bridge and the
 * MCP-over-HTTP endpoint. Business logic is delegated to ProtocolTranslator.
 */
class McpDispatcher {
public:
    McpDispatcher(std::shared_ptr<bridge::ProtocolTranslator> translator,
                  DispatcherOptions options);

    // Response for one inbound message, or std::nullopt when nothing is sent back
    std::optional<json> handle(const json& message);

    json initialize(const json& params) const;
    json listTools();
    json callTool(const json& params);

    const DispatcherOptions& options() const noexcept { return options_; }

private:
    std::optional<json> dispatch(const json& id, const std::string& method, const json& params);

    std::shared_ptr<bridge::ProtocolTranslator> translator_;
    DispatcherOptions options_;
};

// serverInfo.name for a stdio session: mcpd-<server> in Individual mode, mcpd-bridge otherwise
std::string bridgeServerName(const bridge::SessionOptions& session);

} // namespace mcpbridge::mcp
