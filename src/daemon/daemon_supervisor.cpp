#include <mcpbridge/backend/backend_client.h>
#include <mcpbridge/config/config_helpers.h>
#include <mcpbridge/core/settle_once.h>
#include <mcpbridge/daemon/binary_locator.h>
#include <mcpbridge/daemon/daemon_supervisor.h>

#include <spdlog/spdlog.h>

#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <deque>
#include <fstream>

namespace mcpbridge::daemon {

namespace {

constexpr std::chrono::seconds kPkillTimeout{5};
constexpr std::chrono::seconds kConfigCommandTimeout{60};
constexpr std::size_t kIoThreads = 2;

bool isAddressInUse(std::string_view line) {
    std::string lower(line);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("address already in use") != std::string::npos;
}

std::string trimmed(std::string s) {
    config::trim(s);
    return s;
}

} // namespace

// In-flight state of one start() call
struct DaemonSupervisor::StartAttempt {
    core::SettleOnce<DaemonHandle> slot;
    std::atomic<bool> portConflict{false};

    std::mutex mutex;
    std::string stderrText;
    IChildProcess* child = nullptr; // cleared before the child is destroyed
    bool terminateRequested = false;

    std::string capturedStderr() {
        std::lock_guard<std::mutex> lk(mutex);
        return stderrText;
    }
};

nlohmann::json DaemonHandle::toJson() const {
    nlohmann::json j = {{"state", stateToString(state)},
                        {"running", running()},
                        {"apiUrl", apiBaseUrl},
                        {"logPath", logPath.string()},
                        {"configPath", configPath.string()}};
    if (pid) {
        j["pid"] = *pid;
    }
    return j;
}

HealthProbe makeHttpHealthProbe(const config::SupervisorConfig& cfg) {
    backend::BackendClientConfig bc;
    bc.baseUrl = cfg.apiBaseUrl;
    bc.timeout = cfg.probeTimeout;
    bc.connectTimeout = std::min(cfg.probeTimeout, std::chrono::milliseconds{1000});
    auto client = std::make_shared<backend::BackendClient>(std::move(bc));
    return [client] { return client->serversHealth(); };
}

DaemonSupervisor::DaemonSupervisor(config::SupervisorConfig cfg,
                                   std::shared_ptr<IProcessLauncher> launcher, HealthProbe probe)
    : cfg_(std::move(cfg)), launcher_(std::move(launcher)), probe_(std::move(probe)) {
    cfg_.resolvePaths();
    if (!probe_) {
        probe_ = makeHttpHealthProbe(cfg_);
    }
    workGuard_.emplace(boost::asio::make_work_guard(io_));
    for (std::size_t i = 0; i < kIoThreads; ++i) {
        ioThreads_.emplace_back([this] { io_.run(); });
    }
    spdlog::debug("DaemonSupervisor: config dir {}, api {}", cfg_.configDir.string(),
                  cfg_.apiBaseUrl);
}

DaemonSupervisor::~DaemonSupervisor() {
    {
        std::lock_guard<std::mutex> lk(lifecycleMutex_);
        if (child_ && child_->isAlive()) {
            spdlog::info("Supervisor shutting down, terminating mcpd (pid={})", child_->pid());
        }
        child_.reset();
    }
    workGuard_.reset();
    io_.stop();
    for (auto& t : ioThreads_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

DaemonState DaemonSupervisor::state() const {
    std::lock_guard<std::mutex> lk(stateMutex_);
    return state_;
}

DaemonHandle DaemonSupervisor::makeHandle(DaemonState state, std::optional<int64_t> pid) const {
    DaemonHandle h;
    h.state = state;
    h.pid = state == DaemonState::Running ? pid : std::nullopt;
    h.apiBaseUrl = cfg_.apiBaseUrl;
    h.logPath = cfg_.logPath;
    h.configPath = cfg_.configPath;
    return h;
}

void DaemonSupervisor::setState(DaemonState state, std::optional<int64_t> pid) {
    std::lock_guard<std::mutex> lk(stateMutex_);
    if (state_ != state) {
        spdlog::debug("mcpd state {} -> {}", stateToString(state_), stateToString(state));
    }
    state_ = state;
    pid_ = state == DaemonState::Running ? pid : std::nullopt;
}

bool DaemonSupervisor::probeHealthy() {
    auto r = probe_();
    if (!r) {
        spdlog::debug("mcpd health probe failed: {}", r.error().message);
    }
    return r.has_value();
}

DaemonHandle DaemonSupervisor::status() {
    const bool healthy = probeHealthy();
    std::lock_guard<std::mutex> lk(stateMutex_);
    if (healthy) {
        return makeHandle(DaemonState::Running, pid_);
    }
    if (state_ == DaemonState::Starting || state_ == DaemonState::Failed) {
        return makeHandle(state_, std::nullopt);
    }
    return makeHandle(DaemonState::Stopped, std::nullopt);
}

void DaemonSupervisor::scheduleAfter(std::chrono::milliseconds delay, std::function<void()> fn,
                                     const std::shared_ptr<StartAttempt>& attempt) {
    auto timer = std::make_shared<boost::asio::steady_timer>(io_, delay);
    timer->async_wait(
        [timer, attempt, fn = std::move(fn)](const boost::system::error_code& ec) {
            if (ec || attempt->slot.settled()) {
                return;
            }
            fn();
        });
}

void DaemonSupervisor::onChildExit(uint64_t generation, std::optional<int> code) {
    std::lock_guard<std::mutex> lk(stateMutex_);
    if (generation != generation_ || state_ != DaemonState::Running) {
        return;
    }
    spdlog::warn("mcpd exited unexpectedly ({})",
                 code ? "code " + std::to_string(*code) : std::string("signal"));
    state_ = DaemonState::Stopped;
    pid_.reset();
}

Result<void> DaemonSupervisor::ensureConfigFile() const {
    std::error_code ec;
    if (std::filesystem::exists(cfg_.configPath, ec)) {
        return {};
    }
    std::filesystem::create_directories(cfg_.configPath.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::InternalError, "Cannot create config directory " +
                                                   cfg_.configPath.parent_path().string() + ": " +
                                                   ec.message()};
    }
    std::ofstream out(cfg_.configPath);
    out << "servers = []";
    if (!out) {
        return Error{ErrorCode::InternalError,
                     "Cannot write config file " + cfg_.configPath.string()};
    }
    spdlog::info("Created initial mcpd config at {}", cfg_.configPath.string());
    return {};
}

Result<DaemonHandle> DaemonSupervisor::start() {
    std::lock_guard<std::mutex> lk(lifecycleMutex_);
    return startLocked();
}

Result<DaemonHandle> DaemonSupervisor::startLocked() {
    if (probeHealthy()) {
        std::optional<int64_t> pid;
        if (child_ && child_->isAlive()) {
            pid = child_->pid();
        }
        spdlog::info("mcpd already running at {}", cfg_.apiBaseUrl);
        setState(DaemonState::Running, pid);
        return makeHandle(DaemonState::Running, pid);
    }

    // Reap whatever is left of a previous child before spawning a new one
    child_.reset();

    uint64_t generation;
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        generation = ++generation_;
        state_ = DaemonState::Starting;
        pid_.reset();
    }

    const std::string inherited = inheritedSearchPath();
    auto binary = locateDaemonBinary(cfg_, *launcher_, inherited);
    if (!binary) {
        spdlog::error("{}", binary.error().message);
        setState(DaemonState::Failed, std::nullopt);
        return binary.error();
    }
    spdlog::info("mcpd binary found at: {}", binary.value().string());

    if (auto r = ensureConfigFile(); !r) {
        setState(DaemonState::Failed, std::nullopt);
        return r.error();
    }

    std::optional<std::filesystem::path> nodeDir;
    if (auto node = launcher_->findInPath("node", inherited)) {
        nodeDir = node->parent_path();
    }

    ProcessSpec spec;
    spec.executable = binary.value();
    spec.args = {"daemon", "--dev", "--log-level=DEBUG", "--log-path=" + cfg_.logPath.string(),
                 "--config-file=" + cfg_.configPath.string()};
    spec.with_env("PATH", buildDaemonSearchPath(inherited, config::env_value("HOME"), nodeDir))
        .with_env("NODE_PATH", daemonNodePath())
        .in_directory(cfg_.configDir);

    auto attempt = std::make_shared<StartAttempt>();

    ProcessCallbacks callbacks;
    callbacks.onStdoutLine = [](std::string_view line) { spdlog::debug("mcpd stdout: {}", line); };
    callbacks.onStderrLine = [this, attempt](std::string_view line) {
        spdlog::debug("mcpd stderr: {}", line);
        {
            std::lock_guard<std::mutex> lk(attempt->mutex);
            attempt->stderrText.append(line);
            attempt->stderrText.push_back('\n');
        }
        if (attempt->slot.settled() || !isAddressInUse(line) ||
            attempt->portConflict.exchange(true)) {
            return;
        }
        spdlog::warn("mcpd reports its port is already in use; checking for an existing daemon");
        {
            std::lock_guard<std::mutex> lk(attempt->mutex);
            if (attempt->child) {
                if (auto r = attempt->child->terminate(); !r) {
                    spdlog::warn("{}", r.error().message);
                }
            } else {
                attempt->terminateRequested = true;
            }
        }
        scheduleAfter(
            cfg_.portConflictProbeDelay,
            [this, attempt] {
                if (probeHealthy()) {
                    spdlog::info("Connected to existing daemon instance");
                    attempt->slot.settle(makeHandle(DaemonState::Running, std::nullopt),
                                         "port-conflict");
                } else {
                    attempt->slot.settle(Error{ErrorCode::PortConflict,
                                               "Port is in use but cannot connect to daemon at " +
                                                   cfg_.apiBaseUrl},
                                         "port-conflict");
                }
            },
            attempt);
    };
    callbacks.onExit = [this, attempt, generation](std::optional<int> code) {
        if (attempt->portConflict.load()) {
            spdlog::debug("mcpd exit after port conflict, already handled");
        } else if (code && *code != 0) {
            attempt->slot.settle(Error{ErrorCode::DaemonExitedNonZero,
                                       "Daemon exited with code " + std::to_string(*code) + ": " +
                                           attempt->capturedStderr()},
                                 "exit");
        }
        onChildExit(generation, code);
    };

    spdlog::info("Spawning mcpd: {} {}", spec.executable.string(), spec.args.front());
    auto spawned = launcher_->spawn(spec, std::move(callbacks));
    if (!spawned) {
        spdlog::error("Failed to spawn daemon: {}", spawned.error().message);
        setState(DaemonState::Failed, std::nullopt);
        if (spawned.error().code == ErrorCode::NotFound) {
            return Error{ErrorCode::BinaryNotFound, spawned.error().message};
        }
        return spawned.error();
    }
    child_ = std::move(spawned).value();
    const int64_t pid = child_->pid();
    spdlog::info("mcpd spawned, pid: {}", pid);

    {
        std::lock_guard<std::mutex> lk(attempt->mutex);
        attempt->child = child_.get();
        if (attempt->terminateRequested) {
            if (auto r = child_->terminate(); !r) {
                spdlog::warn("{}", r.error().message);
            }
        }
    }

    scheduleAfter(
        cfg_.healthProbeDelay,
        [this, attempt, pid] {
            if (probeHealthy()) {
                std::optional<int64_t> owned;
                if (!attempt->portConflict.load()) {
                    owned = pid;
                }
                attempt->slot.settle(makeHandle(DaemonState::Running, owned), "health-probe");
                return;
            }
            if (attempt->capturedStderr().empty()) {
                attempt->slot.settle(
                    Error{ErrorCode::DaemonStartTimeout,
                          "Daemon failed to start - not running after " +
                              std::to_string(cfg_.healthProbeDelay.count()) + " ms"},
                    "health-probe");
            } else {
                spdlog::debug("Health probe failed with stderr output; waiting for timeout");
            }
        },
        attempt);

    const std::string exePath = binary.value().string();
    scheduleAfter(
        cfg_.absoluteTimeout,
        [this, attempt, exePath] {
            spdlog::error("Daemon start absolute timeout reached");
            const std::string err = trimmed(attempt->capturedStderr());
            attempt->slot.settle(
                Error{ErrorCode::DaemonStartTimeout,
                      "Daemon failed to start within " +
                          std::to_string(cfg_.absoluteTimeout.count()) + " ms. Path: " + exePath +
                          ", Config: " + cfg_.configPath.string() +
                          ", Error output: " + (err.empty() ? std::string("none") : err)},
                "absolute-timeout");
        },
        attempt);

    auto outcome = attempt->slot.wait();
    {
        std::lock_guard<std::mutex> lk(attempt->mutex);
        attempt->child = nullptr;
    }
    spdlog::info("mcpd start settled by {}", attempt->slot.source());

    if (!outcome) {
        spdlog::error("Failed to start mcpd: {}", outcome.error().message);
        // A failed start leaves no process behind
        child_.reset();
        setState(DaemonState::Failed, std::nullopt);
        return outcome.error();
    }

    std::optional<int64_t> ownedPid;
    if (child_ && child_->isAlive() && outcome.value().pid) {
        ownedPid = child_->pid();
    } else {
        child_.reset();
    }
    setState(DaemonState::Running, ownedPid);
    spdlog::info("mcpd running at {}{}", cfg_.apiBaseUrl,
                 ownedPid ? " (pid " + std::to_string(*ownedPid) + ")" : std::string(" (external)"));
    return makeHandle(DaemonState::Running, ownedPid);
}

Result<void> DaemonSupervisor::stop() {
    std::lock_guard<std::mutex> lk(lifecycleMutex_);
    return stopLocked();
}

Result<void> DaemonSupervisor::stopLocked() {
    {
        // Exit events from the child being stopped are expected
        std::lock_guard<std::mutex> lk(stateMutex_);
        ++generation_;
    }

    if (child_ && child_->isAlive()) {
        spdlog::info("Stopping mcpd (pid={})", child_->pid());
        if (auto r = child_->terminate(); !r) {
            return r.error();
        }
        if (!child_->waitForExit(cfg_.stopTimeout)) {
            spdlog::warn("mcpd did not exit within {} ms, sending SIGKILL",
                         cfg_.stopTimeout.count());
            if (auto r = child_->kill(); !r) {
                return r.error();
            }
            if (!child_->waitForExit(std::chrono::seconds{1})) {
                return Error{ErrorCode::InternalError,
                             "mcpd (pid " + std::to_string(child_->pid()) +
                                 ") did not exit after SIGKILL"};
            }
        }
        child_.reset();
        setState(DaemonState::Stopped, std::nullopt);
        spdlog::info("mcpd stopped");
        return {};
    }

    child_.reset();
    spdlog::info("No owned mcpd process; stopping external daemon with pkill");
    ProcessSpec spec;
    spec.executable = "pkill";
    spec.args = {"-f", "mcpd daemon"};
    auto r = launcher_->run(spec, kPkillTimeout);
    if (!r) {
        if (r.error().code == ErrorCode::NotFound) {
            spdlog::warn("Failed to execute pkill: {}", r.error().message);
            setState(DaemonState::Stopped, std::nullopt);
            return {};
        }
        return r.error();
    }
    const auto& code = r.value().exitCode;
    // pkill: 0 = matched and signalled, 1 = nothing matched
    if (code && (*code == 0 || *code == 1)) {
        spdlog::info(*code == 0 ? "External mcpd stopped" : "No running mcpd found");
        setState(DaemonState::Stopped, std::nullopt);
        return {};
    }
    return Error{ErrorCode::InternalError,
                 "Failed to stop daemon, exit code: " +
                     (code ? std::to_string(*code) : std::string("signal"))};
}

Result<DaemonHandle> DaemonSupervisor::restart() {
    std::lock_guard<std::mutex> lk(lifecycleMutex_);
    spdlog::info("Restarting mcpd");
    if (auto r = stopLocked(); !r) {
        return r.error();
    }
    std::this_thread::sleep_for(cfg_.restartGrace);
    return startLocked();
}

Result<void> DaemonSupervisor::restartIfRunningLocked() {
    if (!probeHealthy()) {
        return {};
    }
    spdlog::info("Restarting daemon to load new configuration");
    if (auto r = stopLocked(); !r) {
        return r;
    }
    std::this_thread::sleep_for(cfg_.restartGrace);
    auto started = startLocked();
    if (!started) {
        return started.error();
    }
    spdlog::info("Daemon restarted successfully");
    return {};
}

Result<void> DaemonSupervisor::runConfigCommand(const std::vector<std::string>& args,
                                                const std::string& what) {
    auto binary = locateDaemonBinary(cfg_, *launcher_, inheritedSearchPath());
    if (!binary) {
        return binary.error();
    }
    if (auto r = ensureConfigFile(); !r) {
        return r;
    }

    ProcessSpec spec;
    spec.executable = binary.value();
    spec.args = args;
    spec.args.push_back("--config-file=" + cfg_.configPath.string());
    spec.in_directory(cfg_.configDir);

    auto r = launcher_->run(spec, kConfigCommandTimeout);
    if (!r) {
        if (r.error().code == ErrorCode::NotFound) {
            return Error{ErrorCode::BinaryNotFound, r.error().message};
        }
        return r.error();
    }
    const auto& outcome = r.value();
    if (!outcome.exitCode || *outcome.exitCode != 0) {
        std::string detail = trimmed(outcome.stderrText);
        return Error{ErrorCode::InvalidOperation,
                     "Failed to " + what + (detail.empty() ? std::string() : ": " + detail)};
    }
    return {};
}

Result<void> DaemonSupervisor::addServer(const std::string& name, const std::string& packageRef) {
    if (name.empty() || packageRef.empty()) {
        return Error{ErrorCode::InvalidArgument, "Server name and package are required"};
    }
    std::lock_guard<std::mutex> lk(lifecycleMutex_);
    spdlog::info("Adding server {} ({})", name, packageRef);
    if (auto r = runConfigCommand({"add", name, packageRef}, "add server " + name); !r) {
        return r;
    }
    return restartIfRunningLocked();
}

Result<void> DaemonSupervisor::removeServer(const std::string& name) {
    if (name.empty()) {
        return Error{ErrorCode::InvalidArgument, "Server name is required"};
    }
    std::lock_guard<std::mutex> lk(lifecycleMutex_);
    spdlog::info("Removing server {}", name);
    if (auto r = runConfigCommand({"remove", name}, "remove server " + name); !r) {
        return r;
    }
    return restartIfRunningLocked();
}

Result<std::vector<std::string>> DaemonSupervisor::logs(std::size_t lines) const {
    std::error_code ec;
    if (!std::filesystem::exists(cfg_.logPath, ec)) {
        return std::vector<std::string>{};
    }
    std::ifstream in(cfg_.logPath);
    if (!in) {
        return Error{ErrorCode::InternalError, "Cannot open log file " + cfg_.logPath.string()};
    }
    std::deque<std::string> tail;
    std::string line;
    while (std::getline(in, line)) {
        tail.push_back(std::move(line));
        if (tail.size() > lines) {
            tail.pop_front();
        }
    }
    return std::vector<std::string>(tail.begin(), tail.end());
}

} // namespace mcpbridge::daemon
