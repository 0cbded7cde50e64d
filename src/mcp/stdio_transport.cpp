#include <mcpbridge/mcp/transport.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iostream>
#include <string>

namespace mcpbridge::mcp {

namespace {

bool is_ws(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Strip CR, surrounding whitespace, a UTF-8 BOM and stray control bytes before the JSON
void sanitizeLine(std::string& line) {
    if (!line.empty() && line.back() == '\r')
        line.pop_back();

    auto firstNonWs =
        std::find_if_not(line.begin(), line.end(), [](unsigned char c) { return is_ws(c); });
    if (firstNonWs == line.end()) {
        line.clear();
        return;
    }
    line.erase(line.begin(), firstNonWs);

    if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
        static_cast<unsigned char>(line[1]) == 0xBB &&
        static_cast<unsigned char>(line[2]) == 0xBF) {
        line.erase(0, 3);
    }
    while (!line.empty()) {
        unsigned char c = static_cast<unsigned char>(line.front());
        if (c == '{' || c == '[') {
            break;
        }
        if (is_ws(c) || c == 0x1e || c < 0x20) {
            line.erase(0, 1);
            continue;
        }
        break;
    }
}

} // namespace

StdioTransport::StdioTransport() : StdioTransport(std::cin, std::cout) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);
    // Responses must not sit in a buffer; stderr likewise for log visibility
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;
}

StdioTransport::StdioTransport(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

void StdioTransport::send(const json& message) {
    if (state_.load() != TransportState::Connected) {
        return;
    }
    try {
        // Per MCP stdio: one JSON message per line, no embedded newlines
        const std::string payload =
            message.dump(-1, ' ', false, json::error_handler_t::replace);
        std::lock_guard<std::mutex> lock(outMutex_);
        out_ << payload << "\n";
        out_.flush();
    } catch (const std::exception& e) {
        spdlog::error("StdioTransport::send exception: {}", e.what());
    }
}

MessageResult StdioTransport::receive() {
    if (state_.load() != TransportState::Connected) {
        return Error{ErrorCode::NetworkError, "Transport not connected"};
    }

    while (state_.load() != TransportState::Closing) {
        std::string line;
        if (!std::getline(in_, line)) {
            if (externalShutdown_ && externalShutdown_->load()) {
                state_.store(TransportState::Closing);
                return Error{ErrorCode::NetworkError, "External shutdown requested"};
            }
            if (in_.eof()) {
                spdlog::info("StdioTransport: EOF on stdin; treating as client disconnect");
                state_.store(TransportState::Disconnected);
                return Error{ErrorCode::NetworkError, "EOF on stdin"};
            }
            // Transient stream failure; clear and retry.
            in_.clear();
            continue;
        }

        if (externalShutdown_ && externalShutdown_->load()) {
            state_.store(TransportState::Closing);
            return Error{ErrorCode::NetworkError, "External shutdown requested"};
        }

        sanitizeLine(line);
        if (line.empty()) {
            continue;
        }

        spdlog::debug("StdioTransport: Read line: '{}'", line);

        auto parsed = json_utils::parse_json(line);
        if (!parsed) {
            spdlog::error("StdioTransport: Failed to parse JSON: {}", line);
            recordError();
            if (!shouldRetryAfterError())
                state_.store(TransportState::Error);
            return parsed.error();
        }
        resetErrorCount();
        return parsed.value();
    }

    return Error{ErrorCode::NetworkError, "Transport closed during receive"};
}

bool StdioTransport::shouldRetryAfterError() const noexcept {
    constexpr size_t MAX_CONSECUTIVE_ERRORS = 5;
    return errorCount_.load() < MAX_CONSECUTIVE_ERRORS;
}

void StdioTransport::recordError() noexcept {
    errorCount_.fetch_add(1);
}

void StdioTransport::resetErrorCount() noexcept {
    errorCount_.store(0);
}

} // namespace mcpbridge::mcp
