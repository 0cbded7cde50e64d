#pragma once

#include <mcpbridge/core/types.h>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace mcpbridge::mcp {

using json = nlohmann::json;

template <typename T> using MCPResult = Result<T>;

using JsonParseResult = MCPResult<json>;
using MessageResult = MCPResult<json>;

// Transport state management with atomic operations
enum class TransportState : int {
    Disconnected = 0,
    Connected = 1,
    Error = 2,
    Closing = 3
};

// Protocol constants
namespace protocol {
constexpr std::string_view JSONRPC_VERSION = "2.0";
constexpr std::string_view DEFAULT_PROTOCOL_VERSION = "2024-11-05";
constexpr std::string_view METHOD_INITIALIZE = "initialize";
constexpr std::string_view METHOD_INITIALIZED = "initialized";
constexpr std::string_view METHOD_NOTIFICATIONS_INITIALIZED = "notifications/initialized";
constexpr std::string_view METHOD_PING = "ping";
constexpr std::string_view METHOD_TOOLS_LIST = "tools/list";
constexpr std::string_view METHOD_TOOLS_CALL = "tools/call";
constexpr std::string_view METHOD_RESOURCES_LIST = "resources/list";
constexpr std::string_view METHOD_PROMPTS_LIST = "prompts/list";

// JSON-RPC 2.0 error codes
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
} // namespace protocol

namespace jsonrpc {

inline json make_response(const json& id, json result) {
    return json{{"jsonrpc", std::string(protocol::JSONRPC_VERSION)},
                {"id", id},
                {"result", std::move(result)}};
}

inline json make_error(const json& id, int code, const std::string& message) {
    return json{{"jsonrpc", std::string(protocol::JSONRPC_VERSION)},
                {"id", id},
                {"error", {{"code", code}, {"message", message}}}};
}

} // namespace jsonrpc

// JSON parsing utilities with error handling
namespace json_utils {
// Safe JSON parsing without exceptions
inline JsonParseResult parse_json(std::string_view input) noexcept {
    if (input.empty()) {
        return Error{ErrorCode::InvalidData, "Empty input string for JSON parsing"};
    }

    try {
        auto result = json::parse(input);
        return result;
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData, std::string("JSON parse error: ") + e.what() +
                                                 " at position " + std::to_string(e.byte)};
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("JSON parsing failed: ") + e.what()};
    }
}

// Validate JSON-RPC request structure: object with a string "method"
inline MCPResult<json> validate_jsonrpc_message(const json& msg) noexcept {
    if (!msg.is_object()) {
        return Error{ErrorCode::InvalidData, "Message must be a JSON object"};
    }
    if (msg.contains("jsonrpc")) {
        const auto& version = msg["jsonrpc"];
        if (!version.is_string() || version.get<std::string>() != protocol::JSONRPC_VERSION) {
            return Error{ErrorCode::InvalidData, "Invalid jsonrpc version"};
        }
    }
    if (!msg.contains("method") || !msg["method"].is_string()) {
        return Error{ErrorCode::InvalidData, "Missing 'method' field"};
    }
    return msg;
}
} // namespace json_utils

} // namespace mcpbridge::mcp
