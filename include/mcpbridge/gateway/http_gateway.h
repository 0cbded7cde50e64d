#pragma once

#include <mcpbridge/bridge/protocol_translator.h>
#include <mcpbridge/config/config.h>
#include <mcpbridge/gateway/auth.h>
#include <mcpbridge/gateway/mcp_http_endpoint.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace mcpbridge::gateway {

namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

/**
 * REST + MCP-over-HTTP + WebSocket front end for the daemon.
 *
 * Connections are accepted asynchronously on the io_context; each one is served on its own
 * thread and closed after a single response (WebSocket upgrades stay open until the peer
 * leaves). stop() shuts down open connections and run() returns once their threads are done.
 * handleRequest() is the whole routing table and can be driven without sockets.
 */
class HttpGateway {
public:
    HttpGateway(boost::asio::io_context& ioc, std::shared_ptr<bridge::ProtocolTranslator> translator,
                config::GatewayConfig cfg);
    ~HttpGateway();

    HttpGateway(const HttpGateway&) = delete;
    HttpGateway& operator=(const HttpGateway&) = delete;

    // Bind and serve until stop(); throws std::runtime_error when the listener cannot be set up
    void run();
    // Safe from any thread
    void stop();

    // Port actually bound by run(), 0 until listening
    unsigned short boundPort() const noexcept { return boundPort_.load(); }

    Response handleRequest(const Request& req, const std::string& peer);

    const config::GatewayConfig& config() const noexcept { return cfg_; }

private:
    void doAccept();
    void handleSession(tcp::socket socket);
    void serveConnection(tcp::socket& socket);
    void shutdownSessions();
    void waitForSessions();

    Response dispatch(const Request& req, const std::string& path, const std::string& peer);
    Response route(const Request& req, const std::string& path);
    Response apiIndex(const Request& req) const;
    Response listAllTools(const Request& req);
    Response callTool(const Request& req, const std::string& server, const std::string& tool,
                      const json& params);
    Response mcpCompat(const Request& req);
    Response preflight(const Request& req) const;
    void applyCors(Response& res) const;

    boost::asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<bridge::ProtocolTranslator> translator_;
    config::GatewayConfig cfg_;
    std::shared_ptr<const ApiKeyAuthenticator> auth_;
    RateLimiter limiter_;
    McpHttpEndpoint mcpEndpoint_;
    std::atomic<bool> stopping_{false};
    std::atomic<unsigned short> boundPort_{0};

    // Sockets of connections still being served
    std::mutex sessionsMutex_;
    std::condition_variable sessionsCv_;
    std::set<tcp::socket*> sessions_;
    std::size_t activeSessions_ = 0;
};

// Status for a translator error: ServerNotFound → 404, anything else → 500
http::status statusFor(const Error& error);

} // namespace mcpbridge::gateway
