#pragma once

#include <mcpbridge/mcp/error_handling.h>

#include <atomic>
#include <cstddef>
#include <iosfwd>
#include <mutex>

namespace mcpbridge::mcp {

/**
 * Transport interface for MCP communication
 */
class ITransport {
public:
    virtual ~ITransport() = default;
    virtual void send(const json& message) = 0;
    virtual MessageResult receive() = 0;
    virtual bool isConnected() const = 0;
    virtual void close() = 0;
    virtual TransportState getState() const = 0;
};

/**
 * NDJSON over a pair of streams (stdin/stdout by default).
 *
 * receive() skips blank lines and returns InvalidData for a line that is not JSON, so the
 * caller can answer with a parse error and keep reading. EOF or an external shutdown
 * returns NetworkError and leaves the transport Disconnected. After too many consecutive
 * bad lines the transport goes to Error.
 */
class StdioTransport : public ITransport {
public:
    StdioTransport();
    StdioTransport(std::istream& in, std::ostream& out);

    void send(const json& message) override;
    MessageResult receive() override;
    bool isConnected() const override { return state_.load() == TransportState::Connected; }
    void close() override { state_.store(TransportState::Closing); }
    TransportState getState() const override { return state_.load(); }

    // Set external shutdown flag checked between reads
    void setShutdownFlag(std::atomic<bool>* shutdown) { externalShutdown_ = shutdown; }

private:
    bool shouldRetryAfterError() const noexcept;
    void recordError() noexcept;
    void resetErrorCount() noexcept;

    std::istream& in_;
    std::ostream& out_;
    std::atomic<TransportState> state_{TransportState::Connected};
    std::atomic<bool>* externalShutdown_{nullptr};
    std::atomic<size_t> errorCount_{0};

    // Serializes writers so frames never interleave
    mutable std::mutex outMutex_;
};

} // namespace mcpbridge::mcp
