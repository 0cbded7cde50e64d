#include <mcpbridge/gateway/mcp_http_endpoint.h>
#include <mcpbridge/mcp/mcp_dispatcher.h>

#include <boost/algorithm/string.hpp>
#include <spdlog/spdlog.h>

#include <vector>

namespace mcpbridge::gateway {

namespace {

mcp::DispatcherOptions endpointOptions(const bridge::SessionOptions& session) {
    mcp::DispatcherOptions opts;
    opts.session = session;
    opts.serverName = session.targetServer ? "mcpd-" + *session.targetServer : "mcpd-gateway";
    opts.advertiseResourcesAndPrompts = true;
    opts.answerNotifications = true;
    return opts;
}

} // namespace

McpHttpEndpoint::McpHttpEndpoint(std::shared_ptr<bridge::ProtocolTranslator> translator)
    : translator_(std::move(translator)) {}

bool McpHttpEndpoint::matches(const std::string& path) {
    return sessionFor(path).has_value();
}

std::optional<bridge::SessionOptions> McpHttpEndpoint::sessionFor(const std::string& path) {
    if (path == "/mcp") {
        return bridge::SessionOptions::unified();
    }
    if (path.rfind("/partner/", 0) != 0) {
        return std::nullopt;
    }

    // "/partner/<partner>/<server>/mcp" splits into "", partner, <p>, <server>, mcp
    std::vector<std::string> parts;
    boost::split(parts, path, boost::is_any_of("/"));
    if (parts.size() != 5 || parts[4] != "mcp" || parts[2].empty() || parts[3].empty()) {
        return std::nullopt;
    }
    return bridge::SessionOptions::individual(decodePathSegment(parts[3]), false);
}

Response McpHttpEndpoint::handle(const Request& req) {
    const auto session = sessionFor(stripQuery(std::string(req.target())));
    if (!session || req.method() != http::verb::post) {
        return makeJsonResponse(http::status::not_found, json{{"error", "Not found"}},
                                req.version());
    }
    return makeJsonResponse(http::status::ok, handleBody(req.body(), *session), req.version());
}

json McpHttpEndpoint::handleBody(const std::string& body, const bridge::SessionOptions& session) {
    auto parsed = mcp::json_utils::parse_json(body);
    if (!parsed) {
        spdlog::debug("MCP-over-HTTP parse failure: {}", parsed.error().message);
        return mcp::jsonrpc::make_error(json(), mcp::protocol::PARSE_ERROR,
                                        parsed.error().message);
    }

    mcp::McpDispatcher dispatcher(translator_, endpointOptions(session));
    const json& message = parsed.value();
    auto response = dispatcher.handle(message);
    if (!response) {
        const json id = message.is_object() ? message.value("id", json()) : json();
        return mcp::jsonrpc::make_response(id, json::object());
    }
    return *response;
}

} // namespace mcpbridge::gateway
