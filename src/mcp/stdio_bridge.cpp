#include <mcpbridge/mcp/stdio_bridge.h>

#include <spdlog/spdlog.h>

namespace mcpbridge::mcp {

namespace {

DispatcherOptions stdioOptions(const bridge::SessionOptions& session) {
    DispatcherOptions opts;
    opts.session = session;
    opts.serverName = bridgeServerName(session);
    return opts;
}

} // namespace

StdioBridgeSession::StdioBridgeSession(std::shared_ptr<bridge::ProtocolTranslator> translator,
                                       bridge::SessionOptions session,
                                       std::unique_ptr<ITransport> transport)
    : translator_(translator), session_(session), transport_(std::move(transport)),
      dispatcher_(std::move(translator), stdioOptions(session)) {}

Result<void> StdioBridgeSession::preflight() {
    if (session_.mode == bridge::BridgeMode::Individual) {
        spdlog::info("Starting in INDIVIDUAL mode for server: {}",
                     session_.targetServer.value_or(""));
        spdlog::info("Namespacing: {}", session_.namespacing ? "enabled" : "disabled");
    } else {
        spdlog::info("Starting in UNIFIED mode (all servers)");
    }

    if (auto health = translator_->backend().health(); !health) {
        spdlog::warn("Could not connect to mcpd: {}", health.error().message);
        spdlog::warn("The bridge server will start, but tools may not be available");
        return {};
    }
    spdlog::info("Successfully connected to mcpd");

    if (session_.mode != bridge::BridgeMode::Individual || !session_.targetServer) {
        return {};
    }

    auto servers = translator_->listServers();
    std::string available;
    if (servers) {
        for (const auto& s : servers.value()) {
            if (s.name == *session_.targetServer) {
                return {};
            }
            if (!available.empty())
                available += ", ";
            available += s.name;
        }
    } else {
        spdlog::warn("Failed to fetch servers from mcpd: {}", servers.error().message);
    }
    spdlog::error("Server '{}' not found in mcpd", *session_.targetServer);
    spdlog::error("Available servers: {}", available);
    return Error{ErrorCode::ServerNotFound,
                 "Server '" + *session_.targetServer + "' not found in mcpd"};
}

std::optional<json> StdioBridgeSession::handleMessage(const json& message) {
    return dispatcher_.handle(message);
}

void StdioBridgeSession::run(std::atomic<bool>* shutdown) {
    if (auto* stdio = dynamic_cast<StdioTransport*>(transport_.get())) {
        stdio->setShutdownFlag(shutdown);
    }
    spdlog::info("mcpd Bridge Server started");

    while (transport_->isConnected()) {
        if (shutdown && shutdown->load()) {
            break;
        }
        auto message = transport_->receive();
        if (!message) {
            if (message.error().code == ErrorCode::InvalidData) {
                transport_->send(
                    jsonrpc::make_error(json(), protocol::PARSE_ERROR, message.error().message));
                continue;
            }
            spdlog::debug("Stdio session ending: {}", message.error().message);
            break;
        }
        if (auto response = handleMessage(message.value())) {
            transport_->send(*response);
        }
    }
    transport_->close();
    spdlog::info("mcpd Bridge Server stopped");
}

} // namespace mcpbridge::mcp
