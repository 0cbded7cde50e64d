#include <mcpbridge/bridge/protocol_translator.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace mcpbridge::bridge {

json CatalogEntry::toJson() const {
    return json{{"name", externalName},
                {"description", tool.description},
                {"inputSchema", tool.inputSchema}};
}

BackendReply classifyReply(const json& raw) {
    if (raw.is_object() && raw.contains("content") && raw["content"].is_array()) {
        const bool isError = raw.contains("isError") && raw["isError"].is_boolean() &&
                             raw["isError"].get<bool>();
        return ContentReply{raw["content"], isError};
    }
    if (raw.is_string()) {
        return TextReply{raw.get<std::string>()};
    }
    return StructuredReply{raw};
}

NormalizedResult NormalizedResult::fromReply(const BackendReply& reply) {
    if (const auto* c = std::get_if<ContentReply>(&reply)) {
        NormalizedResult out;
        out.content = c->content;
        out.isError = c->isError;
        return out;
    }
    if (const auto* t = std::get_if<TextReply>(&reply)) {
        return text(t->text);
    }
    return text(std::get<StructuredReply>(reply).value.dump(
        2, ' ', false, json::error_handler_t::replace));
}

NormalizedResult NormalizedResult::text(std::string text) {
    NormalizedResult out;
    out.content = json::array({json{{"type", "text"}, {"text", std::move(text)}}});
    return out;
}

NormalizedResult NormalizedResult::failure(const std::string& message) {
    auto out = text("Error: " + message);
    out.isError = true;
    return out;
}

json NormalizedResult::toJson() const {
    json out = {{"content", content}};
    if (isError) {
        out["isError"] = true;
    }
    return out;
}

ProtocolTranslator::ProtocolTranslator(std::shared_ptr<backend::IBackendClient> backend)
    : backend_(std::move(backend)) {}

std::string ProtocolTranslator::cacheKey(const SessionOptions& options) {
    std::string key = modeToString(options.mode);
    key += options.namespacing ? ":ns:" : ":flat:";
    key += options.targetServer.value_or("");
    return key;
}

Result<Catalog> ProtocolTranslator::listTools(const SessionOptions& options) {
    auto servers = backend_->listServers();
    if (!servers) {
        spdlog::error("Failed to fetch servers from daemon: {}", servers.error().message);
        return servers.error();
    }

    std::vector<backend::ServerDescriptor> selected;
    if (options.mode == BridgeMode::Individual) {
        if (!options.targetServer) {
            return Error{ErrorCode::InvalidArgument, "Individual mode requires a target server"};
        }
        const auto& all = servers.value();
        auto it = std::find_if(all.begin(), all.end(), [&](const backend::ServerDescriptor& s) {
            return s.name == *options.targetServer;
        });
        if (it == all.end()) {
            spdlog::error("Server '{}' not found in daemon", *options.targetServer);
            return Error{ErrorCode::ServerNotFound,
                         "Server '" + *options.targetServer + "' not found"};
        }
        selected.push_back(*it);
    } else {
        selected = servers.value();
    }

    auto fresh = std::make_shared<Catalog>();
    for (const auto& server : selected) {
        auto tools = backend_->listTools(server.name);
        if (!tools) {
            spdlog::error("Failed to fetch tools for server {}: {}", server.name,
                          tools.error().message);
            continue;
        }
        for (const auto& tool : tools.value()) {
            fresh->push_back(CatalogEntry{
                encodeToolName(server.name, tool.rawName, options.mode, options.namespacing),
                server.name, tool});
        }
    }

    {
        std::lock_guard<std::mutex> lk(cacheMutex_);
        cache_[cacheKey(options)] = fresh;
    }
    spdlog::debug("Catalog refresh ({}): {} tools from {} servers", modeToString(options.mode),
                  fresh->size(), selected.size());
    return Catalog(*fresh);
}

std::shared_ptr<const Catalog> ProtocolTranslator::cachedTools(const SessionOptions& options) const {
    std::lock_guard<std::mutex> lk(cacheMutex_);
    auto it = cache_.find(cacheKey(options));
    if (it == cache_.end()) {
        return nullptr;
    }
    return it->second;
}

NormalizedResult ProtocolTranslator::callTool(const std::string& externalName,
                                              const json& arguments,
                                              const SessionOptions& options) {
    auto resolved =
        decodeToolName(externalName, options.mode, options.namespacing, options.targetServer);
    if (!resolved) {
        spdlog::error("Error calling tool {}: {}", externalName, resolved.error().message);
        return NormalizedResult::failure(resolved.error().message);
    }
    return callToolDirect(resolved.value().server, resolved.value().tool, arguments);
}

NormalizedResult ProtocolTranslator::callToolDirect(const std::string& server,
                                                    const std::string& tool,
                                                    const json& arguments) {
    spdlog::info("Calling tool {} on server {}", tool, server);
    auto raw = forwardCall(server, tool, arguments);
    if (!raw) {
        spdlog::error("Error calling tool {} on {}: {}", tool, server, raw.error().message);
        return NormalizedResult::failure(raw.error().message);
    }
    return NormalizedResult::fromReply(classifyReply(raw.value()));
}

Result<json> ProtocolTranslator::forwardCall(const std::string& server, const std::string& tool,
                                             const json& arguments) {
    if (server.empty() || tool.empty()) {
        return Error{ErrorCode::InvalidArgument, "Server and tool are required"};
    }
    const json args = arguments.is_null() ? json::object() : arguments;
    return backend_->invokeTool(server, tool, args);
}

Result<json> ProtocolTranslator::serversRaw() {
    return backend_->getServers();
}

Result<json> ProtocolTranslator::serverToolsRaw(const std::string& server) {
    return backend_->getServerTools(server);
}

Result<std::vector<backend::ServerDescriptor>> ProtocolTranslator::listServers() {
    return backend_->listServers();
}

Result<backend::ServerDescriptor> ProtocolTranslator::getServer(const std::string& name) {
    auto servers = backend_->listServers();
    if (!servers) {
        return servers.error();
    }
    for (const auto& s : servers.value()) {
        if (s.name == name) {
            return s;
        }
    }
    return Error{ErrorCode::ServerNotFound, "Server not found"};
}

} // namespace mcpbridge::bridge
