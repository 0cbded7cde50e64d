#include <mcpbridge/gateway/http_gateway.h>
#include <mcpbridge/gateway/websocket_session.h>

#include <boost/algorithm/string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/websocket/rfc6455.hpp>

#include <boost/asio/post.hpp>

#include <spdlog/spdlog.h>

#include <sys/socket.h>

#include <chrono>
#include <thread>
#include <vector>

namespace mcpbridge::gateway {

namespace {

constexpr const char* kAllowedHeaders =
    "Content-Type, Authorization, X-API-Key, X-MCP-Server, X-MCP-Tool";
constexpr const char* kAllowedMethods = "GET, POST, PUT, DELETE, OPTIONS";

Response errorResponse(http::status status, const std::string& message, unsigned version) {
    return makeJsonResponse(status, json{{"error", message}}, version);
}

std::vector<std::string> pathSegments(const std::string& path) {
    std::vector<std::string> parts;
    boost::split(parts, path, boost::is_any_of("/"));
    std::vector<std::string> out;
    for (auto& p : parts) {
        if (!p.empty())
            out.push_back(decodePathSegment(p));
    }
    return out;
}

// Request body as JSON; an empty body counts as {}
Result<json> parseBody(const Request& req) {
    if (req.body().empty()) {
        return json::object();
    }
    try {
        return json::parse(req.body());
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData, std::string("Invalid JSON body: ") + e.what()};
    }
}

// Entries of a daemon server listing, whichever of the two shapes it came in
json serverEntries(const json& body) {
    if (body.is_array())
        return body;
    if (body.is_object() && body.contains("servers") && body["servers"].is_array())
        return body["servers"];
    return json::array();
}

std::string entryName(const json& entry) {
    if (entry.is_string())
        return entry.get<std::string>();
    if (entry.is_object() && entry.contains("name") && entry["name"].is_string())
        return entry["name"].get<std::string>();
    return {};
}

std::string headerValue(const Request& req, const char* name) {
    if (auto h = req.find(name); h != req.end())
        return std::string(h->value());
    return {};
}

} // namespace

http::status statusFor(const Error& error) {
    switch (error.code) {
        case ErrorCode::ServerNotFound:
            return http::status::not_found;
        case ErrorCode::InvalidArgument:
        case ErrorCode::InvalidData:
            return http::status::bad_request;
        default:
            return http::status::internal_server_error;
    }
}

HttpGateway::HttpGateway(boost::asio::io_context& ioc,
                         std::shared_ptr<bridge::ProtocolTranslator> translator,
                         config::GatewayConfig cfg)
    : ioc_(ioc), acceptor_(ioc), translator_(translator), cfg_(std::move(cfg)),
      auth_(std::make_shared<const ApiKeyAuthenticator>(cfg_.apiKeys)),
      limiter_(cfg_.rateLimitPerMinute), mcpEndpoint_(std::move(translator)) {}

HttpGateway::~HttpGateway() {
    stopping_.store(true);
    shutdownSessions();
    waitForSessions();
}

void HttpGateway::run() {
    if (stopping_.load())
        return;
    beast::error_code ec;
    const tcp::endpoint ep{boost::asio::ip::make_address(cfg_.bindAddress, ec), cfg_.port};
    if (ec)
        throw std::runtime_error("Invalid bind address: " + ec.message());
    acceptor_.open(ep.protocol(), ec);
    if (ec)
        throw std::runtime_error("acceptor open failed: " + ec.message());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(ep, ec);
    if (ec)
        throw std::runtime_error("bind failed: " + ec.message());
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec)
        throw std::runtime_error("listen failed: " + ec.message());
    boundPort_.store(acceptor_.local_endpoint(ec).port());
    spdlog::info("mcpd HTTP Gateway listening on {}:{}", cfg_.bindAddress, boundPort_.load());
    spdlog::info("MCP-over-HTTP: POST /mcp, POST /partner/<partner>/<server>/mcp");

    doAccept();
    ioc_.run();

    waitForSessions();
    spdlog::info("mcpd HTTP Gateway stopped");
}

void HttpGateway::doAccept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (stopping_.load() || ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            spdlog::warn("accept error: {}", ec.message());
        } else {
            {
                std::lock_guard<std::mutex> lk(sessionsMutex_);
                ++activeSessions_;
            }
            std::thread(&HttpGateway::handleSession, this, std::move(socket)).detach();
        }
        doAccept();
    });
}

void HttpGateway::stop() {
    stopping_.store(true);
    // The acceptor belongs to the io_context thread; close it there
    boost::asio::post(ioc_, [this] {
        beast::error_code ec;
        acceptor_.close(ec);
    });
    shutdownSessions();
}

void HttpGateway::shutdownSessions() {
    std::lock_guard<std::mutex> lk(sessionsMutex_);
    for (auto* socket : sessions_) {
        // Wakes the session thread out of its blocking read
        ::shutdown(socket->native_handle(), SHUT_RDWR);
    }
}

void HttpGateway::waitForSessions() {
    std::unique_lock<std::mutex> lk(sessionsMutex_);
    sessionsCv_.wait(lk, [this] { return activeSessions_ == 0; });
}

void HttpGateway::handleSession(tcp::socket socket) {
    bool serve = false;
    {
        std::lock_guard<std::mutex> lk(sessionsMutex_);
        if (!stopping_.load()) {
            sessions_.insert(&socket);
            serve = true;
        }
    }
    if (serve) {
        serveConnection(socket);
    }
    {
        std::lock_guard<std::mutex> lk(sessionsMutex_);
        sessions_.erase(&socket);
        --activeSessions_;
        // Notify under the lock: the waiter may destroy the gateway as soon as it wakes
        sessionsCv_.notify_all();
    }
}

void HttpGateway::serveConnection(tcp::socket& socket) {
    beast::flat_buffer buffer;
    beast::error_code ec;
    http::request_parser<http::string_body> parser;
    parser.body_limit(cfg_.maxBodyBytes);
    http::read(socket, buffer, parser, ec);

    if (ec == http::error::body_limit) {
        auto res = errorResponse(http::status::payload_too_large, "Request body too large", 11);
        applyCors(res);
        res.keep_alive(false);
        http::write(socket, res, ec);
        socket.shutdown(tcp::socket::shutdown_send, ec);
        return;
    }
    if (ec) {
        spdlog::debug("http read error: {}", ec.message());
        return;
    }

    Request req = parser.release();
    std::string peer;
    if (auto remote = socket.remote_endpoint(ec); !ec) {
        peer = remote.address().to_string();
    }

    if (boost::beast::websocket::is_upgrade(req)) {
        runWebSocket(socket, std::move(req), translator_, auth_);
        return;
    }

    auto res = handleRequest(req, peer);
    res.keep_alive(false);
    http::write(socket, res, ec);
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

Response HttpGateway::handleRequest(const Request& req, const std::string& peer) {
    const auto started = std::chrono::steady_clock::now();
    const std::string target(req.target());
    const std::string path = stripQuery(target);

    Response res = [&]() -> Response {
        try {
            return dispatch(req, path, peer);
        } catch (const std::exception& e) {
            spdlog::error("Gateway handler for {} failed: {}", path, e.what());
            return errorResponse(http::status::internal_server_error, e.what(), req.version());
        }
    }();

    applyCors(res);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("{} {} {} {}ms", std::string(req.method_string()), target,
                 res.result_int(), elapsed.count());
    return res;
}

Response HttpGateway::dispatch(const Request& req, const std::string& path,
                               const std::string& peer) {
    if (req.method() == http::verb::options) {
        return preflight(req);
    }
    if (McpHttpEndpoint::matches(path)) {
        return mcpEndpoint_.handle(req);
    }

    if (path.rfind("/api/", 0) == 0) {
        auto key = ApiKeyAuthenticator::extractApiKey(req);
        const std::string clientId = key ? "key:" + *key : "ip:" + peer;
        if (!limiter_.allow(clientId)) {
            auto limited = errorResponse(http::status::too_many_requests,
                                         "Too many requests, please try again later",
                                         req.version());
            limited.set(http::field::retry_after, "60");
            return limited;
        }
        if (!auth_->authenticate(req)) {
            return errorResponse(http::status::unauthorized, "Unauthorized", req.version());
        }
    }
    return route(req, path);
}

Response HttpGateway::route(const Request& req, const std::string& path) {
    const auto method = req.method();
    const auto version = req.version();
    const auto seg = pathSegments(path);

    if (method == http::verb::get && path == "/health") {
        return makeJsonResponse(http::status::ok,
                                json{{"status", "healthy"}, {"mcpd", cfg_.daemonUrl}}, version);
    }
    if (method == http::verb::get && (path == "/api" || path == "/api/")) {
        return apiIndex(req);
    }
    if (seg.empty() || seg[0] != "api") {
        return errorResponse(http::status::not_found, "Not found", version);
    }

    // /api/servers[/:name[/tools]]
    if (method == http::verb::get && seg.size() >= 2 && seg[1] == "servers") {
        if (seg.size() == 2) {
            auto servers = translator_->serversRaw();
            if (!servers)
                return errorResponse(statusFor(servers.error()), servers.error().message,
                                     version);
            return makeJsonResponse(http::status::ok, servers.value(), version);
        }
        if (seg.size() == 3) {
            auto servers = translator_->serversRaw();
            if (!servers)
                return errorResponse(statusFor(servers.error()), servers.error().message,
                                     version);
            for (const auto& entry : serverEntries(servers.value())) {
                if (entryName(entry) == seg[2])
                    return makeJsonResponse(http::status::ok, entry, version);
            }
            return errorResponse(http::status::not_found, "Server not found", version);
        }
        if (seg.size() == 4 && seg[3] == "tools") {
            auto tools = translator_->serverToolsRaw(seg[2]);
            if (!tools)
                return errorResponse(statusFor(tools.error()), tools.error().message, version);
            return makeJsonResponse(http::status::ok, tools.value(), version);
        }
    }

    if (method == http::verb::get && seg.size() == 2 && seg[1] == "tools") {
        return listAllTools(req);
    }

    if (method == http::verb::post && seg.size() == 3 && seg[1] == "tools" &&
        seg[2] == "call") {
        auto body = parseBody(req);
        if (!body)
            return errorResponse(http::status::bad_request, body.error().message, version);
        const json& b = body.value();
        const std::string server =
            b.is_object() && b.contains("server") && b["server"].is_string()
                ? b["server"].get<std::string>()
                : std::string();
        const std::string tool = b.is_object() && b.contains("tool") && b["tool"].is_string()
                                     ? b["tool"].get<std::string>()
                                     : std::string();
        if (server.empty() || tool.empty()) {
            return errorResponse(http::status::bad_request, "Server and tool are required",
                                 version);
        }
        json params = b.contains("params") && !b["params"].is_null() ? b["params"]
                                                                     : json::object();
        return callTool(req, server, tool, params);
    }

    // /api/servers/:server/tools/:tool/call
    if (method == http::verb::post && seg.size() == 6 && seg[1] == "servers" &&
        seg[3] == "tools" && seg[5] == "call") {
        auto body = parseBody(req);
        if (!body)
            return errorResponse(http::status::bad_request, body.error().message, version);
        return callTool(req, seg[2], seg[4], body.value());
    }

    if (method == http::verb::post && seg.size() == 2 && seg[1] == "mcp") {
        return mcpCompat(req);
    }

    return errorResponse(http::status::not_found, "Not found", version);
}

Response HttpGateway::apiIndex(const Request& req) const {
    const std::string wsUrl = "ws://localhost:" + std::to_string(cfg_.port) + "/ws";
    json index = {
        {"version", "1.0.0"},
        {"endpoints",
         {{"servers",
           {{"list", "GET /api/servers"},
            {"get", "GET /api/servers/:name"},
            {"tools", "GET /api/servers/:name/tools"}}},
          {"tools",
           {{"list", "GET /api/tools"},
            {"call", "POST /api/tools/call"},
            {"callDirect", "POST /api/servers/:server/tools/:tool/call"}}},
          {"mcp",
           {{"compat", "POST /api/mcp"},
            {"unified", "POST /mcp"},
            {"server", "POST /partner/:partner/:server/mcp"}}},
          {"websocket",
           {{"connect", wsUrl},
            {"protocol", "Send JSON messages with {type, server, tool, params}"}}}}},
        {"authentication", "Use X-API-Key header or Authorization: Bearer <key>"}};
    return makeJsonResponse(http::status::ok, index, req.version());
}

Response HttpGateway::listAllTools(const Request& req) {
    auto servers = translator_->listServers();
    if (!servers) {
        return errorResponse(statusFor(servers.error()), servers.error().message, req.version());
    }

    json all = json::array();
    for (const auto& server : servers.value()) {
        auto tools = translator_->serverToolsRaw(server.name);
        if (!tools) {
            spdlog::warn("Failed to fetch tools for {}: {}", server.name, tools.error().message);
            continue;
        }
        const json& body = tools.value();
        if (!body.is_object() || !body.contains("tools") || !body["tools"].is_array())
            continue;
        for (const auto& tool : body["tools"]) {
            json entry = tool.is_object() ? tool : json{{"name", tool}};
            entry["server"] = server.name;
            entry["fullName"] = bridge::encodeToolName(server.name, entryName(entry),
                                                       bridge::BridgeMode::Unified, true);
            all.push_back(std::move(entry));
        }
    }
    return makeJsonResponse(http::status::ok, json{{"tools", all}}, req.version());
}

Response HttpGateway::callTool(const Request& req, const std::string& server,
                               const std::string& tool, const json& params) {
    auto result = translator_->forwardCall(server, tool, params);
    if (!result) {
        return errorResponse(statusFor(result.error()), result.error().message, req.version());
    }
    return makeJsonResponse(http::status::ok, result.value(), req.version());
}

Response HttpGateway::mcpCompat(const Request& req) {
    const auto version = req.version();
    auto body = parseBody(req);
    if (!body)
        return errorResponse(http::status::bad_request, body.error().message, version);
    const json& b = body.value();

    const std::string server = headerValue(req, "X-MCP-Server");
    if (server.empty()) {
        return errorResponse(http::status::bad_request, "X-MCP-Server header required", version);
    }

    const std::string method =
        b.is_object() && b.contains("method") && b["method"].is_string()
            ? b["method"].get<std::string>()
            : std::string();
    const json params =
        b.is_object() && b.contains("params") && b["params"].is_object() ? b["params"]
                                                                         : json::object();

    if (method == "tools/list") {
        auto tools = translator_->serverToolsRaw(server);
        if (!tools)
            return errorResponse(statusFor(tools.error()), tools.error().message, version);
        const json& t = tools.value();
        json list = t.is_object() && t.contains("tools") ? t["tools"] : json::array();
        return makeJsonResponse(http::status::ok, json{{"tools", list}}, version);
    }

    if (method == "tools/call") {
        if (!params.contains("name") || !params["name"].is_string() ||
            params["name"].get<std::string>().empty()) {
            return errorResponse(http::status::bad_request, "Tool name required", version);
        }
        json args = params.contains("arguments") && !params["arguments"].is_null()
                        ? params["arguments"]
                        : json::object();
        return callTool(req, server, params["name"].get<std::string>(), args);
    }

    return errorResponse(http::status::bad_request, "Unknown method: " + method, version);
}

Response HttpGateway::preflight(const Request& req) const {
    Response res{http::status::no_content, req.version()};
    res.set(http::field::server, "mcpd-gateway");
    if (cfg_.enableCors) {
        res.set(http::field::access_control_max_age, "86400");
    }
    return res;
}

void HttpGateway::applyCors(Response& res) const {
    if (!cfg_.enableCors)
        return;
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, kAllowedMethods);
    res.set(http::field::access_control_allow_headers, kAllowedHeaders);
}

} // namespace mcpbridge::gateway
