#include <mcpbridge/mcp/mcp_dispatcher.h>

#include <spdlog/spdlog.h>

namespace mcpbridge::mcp {

std::string bridgeServerName(const bridge::SessionOptions& session) {
    if (session.mode == bridge::BridgeMode::Individual && session.targetServer) {
        return "mcpd-" + *session.targetServer;
    }
    return "mcpd-bridge";
}

McpDispatcher::McpDispatcher(std::shared_ptr<bridge::ProtocolTranslator> translator,
                             DispatcherOptions options)
    : translator_(std::move(translator)), options_(std::move(options)) {}

std::optional<json> McpDispatcher::handle(const json& message) {
    const bool isNotification = !message.is_object() || !message.contains("id");
    const json id = message.is_object() ? message.value("id", json()) : json();

    auto valid = json_utils::validate_jsonrpc_message(message);
    if (!valid) {
        spdlog::warn("MCP invalid request: {}", valid.error().message);
        return jsonrpc::make_error(id, protocol::INVALID_REQUEST, valid.error().message);
    }

    const std::string method = message["method"].get<std::string>();
    const json params = message.value("params", json::object());

    std::optional<json> response;
    try {
        response = dispatch(id, method, params);
    } catch (const std::exception& e) {
        spdlog::error("MCP handler for '{}' failed: {}", method, e.what());
        response = jsonrpc::make_error(id, protocol::INTERNAL_ERROR, e.what());
    }

    if (isNotification && !options_.answerNotifications) {
        return std::nullopt;
    }
    return response;
}

std::optional<json> McpDispatcher::dispatch(const json& id, const std::string& method,
                                            const json& params) {
    if (method == protocol::METHOD_INITIALIZE) {
        spdlog::debug("MCP handling initialize request with params: {}", params.dump());
        return jsonrpc::make_response(id, initialize(params));
    }

    if (method == protocol::METHOD_INITIALIZED ||
        method == protocol::METHOD_NOTIFICATIONS_INITIALIZED) {
        spdlog::debug("MCP client initialized");
        return jsonrpc::make_response(id, json::object());
    }

    if (method == protocol::METHOD_PING) {
        return jsonrpc::make_response(id, json::object());
    }

    if (method == protocol::METHOD_TOOLS_LIST) {
        return jsonrpc::make_response(id, listTools());
    }

    if (method == protocol::METHOD_TOOLS_CALL) {
        if (!params.contains("name") || !params["name"].is_string()) {
            return jsonrpc::make_error(id, protocol::INVALID_PARAMS, "Missing tool name");
        }
        return jsonrpc::make_response(id, callTool(params));
    }

    if (method == protocol::METHOD_RESOURCES_LIST) {
        return jsonrpc::make_response(id, json{{"resources", json::array()}});
    }

    if (method == protocol::METHOD_PROMPTS_LIST) {
        return jsonrpc::make_response(id, json{{"prompts", json::array()}});
    }

    spdlog::debug("MCP method not found: {}", method);
    return jsonrpc::make_error(id, protocol::METHOD_NOT_FOUND, "Method not found: " + method);
}

json McpDispatcher::initialize(const json& params) const {
    std::string version(protocol::DEFAULT_PROTOCOL_VERSION);
    if (params.is_object() && params.contains("protocolVersion") &&
        params["protocolVersion"].is_string()) {
        version = params["protocolVersion"].get<std::string>();
    }

    json capabilities = {{"tools", json::object()}};
    if (options_.advertiseResourcesAndPrompts) {
        capabilities["resources"] = json::object();
        capabilities["prompts"] = json::object();
    }

    return json{{"protocolVersion", version},
                {"capabilities", capabilities},
                {"serverInfo", {{"name", options_.serverName}, {"version", options_.serverVersion}}}};
}

json McpDispatcher::listTools() {
    const auto& session = options_.session;
    if (session.mode == bridge::BridgeMode::Individual) {
        spdlog::info("Fetching tools from mcpd for server '{}'...",
                     session.targetServer.value_or(""));
    } else {
        spdlog::info("Fetching tools from mcpd across all servers...");
    }

    json tools = json::array();
    auto catalog = translator_->listTools(session);
    if (!catalog) {
        spdlog::warn("Tool listing failed: {}", catalog.error().message);
        return json{{"tools", tools}};
    }
    for (const auto& entry : catalog.value()) {
        tools.push_back(entry.toJson());
    }
    spdlog::info("Found {} tools", tools.size());
    return json{{"tools", tools}};
}

json McpDispatcher::callTool(const json& params) {
    const std::string name = params.value("name", "");
    json args = params.contains("arguments") ? params["arguments"] : json::object();
    if (args.is_null()) {
        args = json::object();
    }
    return translator_->callTool(name, args, options_.session).toJson();
}

} // namespace mcpbridge::mcp
