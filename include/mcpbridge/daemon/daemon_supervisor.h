#pragma once

#include <mcpbridge/config/config.h>
#include <mcpbridge/core/types.h>
#include <mcpbridge/daemon/process_launcher.h>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcpbridge::daemon {

enum class DaemonState { Stopped, Starting, Running, Failed };

constexpr const char* stateToString(DaemonState state) {
    switch (state) {
        case DaemonState::Stopped: return "stopped";
        case DaemonState::Starting: return "starting";
        case DaemonState::Running: return "running";
        case DaemonState::Failed: return "failed";
    }
    return "unknown";
}

// Snapshot of the supervised daemon. pid is set only while this supervisor owns a running child.
struct DaemonHandle {
    DaemonState state = DaemonState::Stopped;
    std::optional<int64_t> pid;
    std::string apiBaseUrl;
    std::filesystem::path logPath;
    std::filesystem::path configPath;

    bool running() const noexcept { return state == DaemonState::Running; }
    nlohmann::json toJson() const;
};

// Succeeds when a daemon answers on the configured API
using HealthProbe = std::function<Result<void>()>;

// GET /health/servers with fallback to /servers, bounded by cfg.probeTimeout
HealthProbe makeHttpHealthProbe(const config::SupervisorConfig& cfg);

/**
 * @brief Owns the lifecycle of one mcpd process per configuration directory.
 *
 * start() races four signals against a single settlement: a port-conflict line on the
 * child's stderr, a nonzero exit, the delayed health probe and the absolute timeout.
 * Lifecycle operations (start/stop/restart/add/remove) are serialized; a second start()
 * waits for the first and then sees the Running short-circuit.
 *
 * Timers run on a private io_context with two threads so a blocking probe never delays
 * the absolute timeout.
 *
 * Thread-safe: Yes
 */
class DaemonSupervisor {
public:
    DaemonSupervisor(config::SupervisorConfig cfg, std::shared_ptr<IProcessLauncher> launcher,
                     HealthProbe probe = {});
    ~DaemonSupervisor();

    DaemonSupervisor(const DaemonSupervisor&) = delete;
    DaemonSupervisor& operator=(const DaemonSupervisor&) = delete;

    Result<DaemonHandle> start();
    Result<void> stop();
    Result<DaemonHandle> restart();

    // Probes the API; never touches the owned process
    DaemonHandle status();

    Result<void> addServer(const std::string& name, const std::string& packageRef);
    Result<void> removeServer(const std::string& name);

    // Last `lines` lines of the daemon log; empty when the log does not exist
    Result<std::vector<std::string>> logs(std::size_t lines = 100) const;

    // Writes `servers = []` when the config file is missing
    Result<void> ensureConfigFile() const;

    DaemonState state() const;
    const config::SupervisorConfig& config() const noexcept { return cfg_; }

private:
    struct StartAttempt;

    Result<DaemonHandle> startLocked();
    Result<void> stopLocked();
    Result<void> runConfigCommand(const std::vector<std::string>& args, const std::string& what);
    Result<void> restartIfRunningLocked();

    void onChildExit(uint64_t generation, std::optional<int> code);
    void scheduleAfter(std::chrono::milliseconds delay, std::function<void()> fn,
                       const std::shared_ptr<StartAttempt>& attempt);

    DaemonHandle makeHandle(DaemonState state, std::optional<int64_t> pid) const;
    void setState(DaemonState state, std::optional<int64_t> pid);
    bool probeHealthy();

    config::SupervisorConfig cfg_;
    std::shared_ptr<IProcessLauncher> launcher_;
    HealthProbe probe_;

    boost::asio::io_context io_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        workGuard_;
    std::vector<std::thread> ioThreads_;

    // Serializes lifecycle operations; never taken from child or timer callbacks
    std::mutex lifecycleMutex_;
    std::unique_ptr<IChildProcess> child_;

    mutable std::mutex stateMutex_;
    DaemonState state_ = DaemonState::Stopped;
    std::optional<int64_t> pid_;
    uint64_t generation_ = 0;
};

} // namespace mcpbridge::daemon
