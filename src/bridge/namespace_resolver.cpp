#include <mcpbridge/bridge/namespace_resolver.h>

namespace mcpbridge::bridge {

namespace {

size_t countDelimiters(std::string_view name) {
    size_t count = 0;
    size_t pos = name.find(kNamespaceDelimiter);
    while (pos != std::string_view::npos) {
        ++count;
        pos = name.find(kNamespaceDelimiter, pos + kNamespaceDelimiter.size());
    }
    return count;
}

Error invalidFormat(std::string_view name) {
    return Error{ErrorCode::InvalidToolNameFormat,
                 "Invalid tool name format: " + std::string(name)};
}

} // namespace

std::string encodeToolName(std::string_view server, std::string_view tool, BridgeMode mode,
                           bool namespacingEnabled) {
    if (mode == BridgeMode::Individual && !namespacingEnabled) {
        return std::string(tool);
    }
    std::string out;
    out.reserve(server.size() + kNamespaceDelimiter.size() + tool.size());
    out.append(server);
    out.append(kNamespaceDelimiter);
    out.append(tool);
    return out;
}

Result<ResolvedTool> decodeToolName(std::string_view externalName, BridgeMode mode,
                                    bool namespacingEnabled,
                                    const std::optional<std::string>& fixedTargetServer) {
    // The fallback target only exists for Individual sessions; Unified never misroutes.
    const bool haveTarget =
        mode == BridgeMode::Individual && fixedTargetServer && !fixedTargetServer->empty();

    if (mode == BridgeMode::Individual && !namespacingEnabled) {
        if (!haveTarget) {
            return Error{ErrorCode::InvalidState,
                         "Individual mode without namespacing requires a target server"};
        }
        return ResolvedTool{*fixedTargetServer, std::string(externalName)};
    }

    const size_t delimiters = countDelimiters(externalName);
    if (delimiters > 1) {
        return invalidFormat(externalName);
    }

    if (delimiters == 1) {
        const size_t pos = externalName.find(kNamespaceDelimiter);
        auto server = externalName.substr(0, pos);
        auto tool = externalName.substr(pos + kNamespaceDelimiter.size());
        if (!server.empty() && !tool.empty()) {
            return ResolvedTool{std::string(server), std::string(tool)};
        }
    }

    if (haveTarget) {
        return ResolvedTool{*fixedTargetServer, std::string(externalName)};
    }
    return invalidFormat(externalName);
}

} // namespace mcpbridge::bridge
