#pragma once

#include <mcpbridge/bridge/protocol_translator.h>
#include <mcpbridge/gateway/auth.h>

#include <boost/asio/ip/tcp.hpp>

#include <memory>
#include <optional>
#include <string>

namespace mcpbridge::gateway {

// What to do after one inbound frame
struct WsOutcome {
    std::optional<json> reply;
    bool close = false;
};

/**
 * Per-connection WebSocket state: starts unauthenticated unless the connect URL carried a
 * valid apiKey. Messages are typed JSON objects `{type, server?, tool?, params?, id?}`.
 *
 * Until authenticated only `{type:"auth", apiKey}` is accepted; anything else is answered
 * with an Unauthorized error and the connection is closed.
 */
class WebSocketSession {
public:
    WebSocketSession(std::shared_ptr<bridge::ProtocolTranslator> translator,
                     std::shared_ptr<const ApiKeyAuthenticator> auth,
                     const std::optional<std::string>& connectKey = std::nullopt);

    WsOutcome onMessage(const std::string& text);

    bool authenticated() const noexcept { return authenticated_; }

private:
    json dispatch(const json& msg);

    std::shared_ptr<bridge::ProtocolTranslator> translator_;
    std::shared_ptr<const ApiKeyAuthenticator> auth_;
    bool authenticated_ = false;
};

// Complete the upgrade for `req` on `socket` and serve frames until the peer goes away.
// The socket stays owned by the caller.
void runWebSocket(boost::asio::ip::tcp::socket& socket, Request req,
                  std::shared_ptr<bridge::ProtocolTranslator> translator,
                  std::shared_ptr<const ApiKeyAuthenticator> auth);

} // namespace mcpbridge::gateway
