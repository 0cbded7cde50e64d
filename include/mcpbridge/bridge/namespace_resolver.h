#pragma once

#include <mcpbridge/core/types.h>

#include <optional>
#include <string>
#include <string_view>

namespace mcpbridge::bridge {

// Unified: every server, always namespaced. Individual: one target server, namespacing optional.
enum class BridgeMode { Unified, Individual };

inline constexpr std::string_view kNamespaceDelimiter = "__";

constexpr const char* modeToString(BridgeMode mode) {
    return mode == BridgeMode::Unified ? "unified" : "individual";
}

struct ResolvedTool {
    std::string server;
    std::string tool;

    bool operator==(const ResolvedTool&) const = default;
};

// External name for (server, tool) under the given mode and namespacing flag
std::string encodeToolName(std::string_view server, std::string_view tool, BridgeMode mode,
                           bool namespacingEnabled);

/**
 * Inverse of encodeToolName.
 *
 * Individual mode with namespacing disabled maps every name to the fixed target server.
 * Otherwise the name must split on the delimiter into two non-empty parts; when it does
 * not, Individual mode falls back to the fixed target with the whole name as the tool.
 * A name containing the delimiter more than once is rejected with InvalidToolNameFormat.
 */
Result<ResolvedTool> decodeToolName(std::string_view externalName, BridgeMode mode,
                                    bool namespacingEnabled,
                                    const std::optional<std::string>& fixedTargetServer);

} // namespace mcpbridge::bridge
