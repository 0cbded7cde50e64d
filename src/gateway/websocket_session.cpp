#include <mcpbridge/gateway/websocket_session.h>

#include <boost/asio/buffer.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket.hpp>
#include <spdlog/spdlog.h>

namespace mcpbridge::gateway {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace {

// Copy the client's correlation id, when it sent one, onto a reply frame
json withId(json frame, const json& msg) {
    if (msg.is_object() && msg.contains("id")) {
        frame["id"] = msg["id"];
    }
    return frame;
}

json errorFrame(const std::string& message, const json& msg = json()) {
    return withId(json{{"type", "error"}, {"error", message}}, msg);
}

std::string stringField(const json& msg, const char* key) {
    if (msg.contains(key) && msg[key].is_string()) {
        return msg[key].get<std::string>();
    }
    return {};
}

} // namespace

WebSocketSession::WebSocketSession(std::shared_ptr<bridge::ProtocolTranslator> translator,
                                   std::shared_ptr<const ApiKeyAuthenticator> auth,
                                   const std::optional<std::string>& connectKey)
    : translator_(std::move(translator)), auth_(std::move(auth)) {
    if (connectKey && auth_->authenticateKey(*connectKey)) {
        authenticated_ = true;
    }
}

WsOutcome WebSocketSession::onMessage(const std::string& text) {
    json msg;
    try {
        msg = json::parse(text);
    } catch (const json::parse_error& e) {
        if (!authenticated_) {
            return {errorFrame("Unauthorized"), true};
        }
        return {errorFrame(std::string("Invalid JSON: ") + e.what()), false};
    }
    if (!msg.is_object()) {
        if (!authenticated_) {
            return {errorFrame("Unauthorized"), true};
        }
        return {errorFrame("Message must be a JSON object"), false};
    }

    const std::string type = stringField(msg, "type");
    if (type == "auth") {
        if (authenticated_ || auth_->authenticateKey(stringField(msg, "apiKey"))) {
            authenticated_ = true;
            return {withId(json{{"type", "auth"}, {"status", "success"}}, msg), false};
        }
        spdlog::info("WebSocket client failed authentication");
        return {errorFrame("Unauthorized"), true};
    }
    if (!authenticated_) {
        spdlog::info("WebSocket message '{}' rejected before authentication", type);
        return {errorFrame("Unauthorized"), true};
    }

    try {
        return {dispatch(msg), false};
    } catch (const std::exception& e) {
        return {errorFrame(e.what(), msg), false};
    }
}

json WebSocketSession::dispatch(const json& msg) {
    const std::string type = stringField(msg, "type");

    if (type == "servers.list") {
        auto servers = translator_->serversRaw();
        if (!servers)
            return errorFrame(servers.error().message, msg);
        return withId(json{{"type", "servers.list"}, {"data", servers.value()}}, msg);
    }

    if (type == "tools.list") {
        const std::string server = stringField(msg, "server");
        if (server.empty())
            return errorFrame("Server is required", msg);
        auto tools = translator_->serverToolsRaw(server);
        if (!tools)
            return errorFrame(tools.error().message, msg);
        return withId(
            json{{"type", "tools.list"}, {"server", server}, {"data", tools.value()}}, msg);
    }

    if (type == "tools.call") {
        const std::string server = stringField(msg, "server");
        const std::string tool = stringField(msg, "tool");
        if (server.empty() || tool.empty())
            return errorFrame("Server and tool are required", msg);
        json params = msg.contains("params") ? msg["params"] : json::object();
        auto result = translator_->forwardCall(server, tool, params);
        if (!result)
            return errorFrame(result.error().message, msg);
        return withId(json{{"type", "tools.result"}, {"data", result.value()}}, msg);
    }

    return errorFrame("Unknown message type: " + type, msg);
}

void runWebSocket(tcp::socket& socket, Request req,
                  std::shared_ptr<bridge::ProtocolTranslator> translator,
                  std::shared_ptr<const ApiKeyAuthenticator> auth) {
    beast::error_code ec;
    websocket::stream<tcp::socket&> ws{socket};
    ws.accept(req, ec);
    if (ec) {
        spdlog::warn("WebSocket handshake failed: {}", ec.message());
        return;
    }
    spdlog::info("WebSocket client connected");

    WebSocketSession session(std::move(translator), std::move(auth),
                             getQueryParam(std::string(req.target()), "apiKey"));
    for (;;) {
        beast::flat_buffer buffer;
        ws.read(buffer, ec);
        if (ec == websocket::error::closed) {
            break;
        }
        if (ec) {
            spdlog::debug("WebSocket read error: {}", ec.message());
            break;
        }

        auto outcome = session.onMessage(beast::buffers_to_string(buffer.data()));
        if (outcome.reply) {
            const std::string payload = 
                outcome.reply->dump(-1, ' ', false, json::error_handler_t::replace);
            ws.text(true);
            ws.write(boost::asio::buffer(payload), ec);
            if (ec) {
                spdlog::debug("WebSocket write error: {}", ec.message());
                break;
            }
        }
        if (outcome.close) {
            ws.close(websocket::close_code::policy_error, ec);
            break;
        }
    }
    spdlog::info("WebSocket client disconnected");
}

} // namespace mcpbridge::gateway
