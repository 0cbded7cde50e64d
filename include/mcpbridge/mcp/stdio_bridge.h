#pragma once

#include <mcpbridge/bridge/protocol_translator.h>
#include <mcpbridge/mcp/mcp_dispatcher.h>
#include <mcpbridge/mcp/transport.h>

#include <atomic>
#include <memory>

namespace mcpbridge::mcp {

/**
 * JSON-RPC over stdio in front of the daemon. One session per process; requests are handled
 * in arrival order and a failed tool call never ends the session.
 */
class StdioBridgeSession {
public:
    StdioBridgeSession(std::shared_ptr<bridge::ProtocolTranslator> translator,
                       bridge::SessionOptions session, std::unique_ptr<ITransport> transport);

    /**
     * Startup checks against the daemon. An unreachable daemon is only a warning; in
     * Individual mode a reachable daemon that does not know the target server fails with
     * ServerNotFound.
     */
    Result<void> preflight();

    // Serve until EOF, transport failure or *shutdown becomes true
    void run(std::atomic<bool>* shutdown = nullptr);

    // One inbound message; std::nullopt when no response is due
    std::optional<json> handleMessage(const json& message);

    McpDispatcher& dispatcher() noexcept { return dispatcher_; }

private:
    std::shared_ptr<bridge::ProtocolTranslator> translator_;
    bridge::SessionOptions session_;
    std::unique_ptr<ITransport> transport_;
    McpDispatcher dispatcher_;
};

} // namespace mcpbridge::mcp
