#pragma once

#include <mcpbridge/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mcpbridge::daemon {

/**
 * @brief What to run. The child inherits the parent environment with `env` applied on top.
 *
 * Example:
 * @code
 * ProcessSpec spec{.executable = "/usr/local/bin/mcpd", .args = {"daemon", "--dev"}};
 * spec.with_env("PATH", searchPath).in_directory(configDir);
 * @endcode
 */
struct ProcessSpec {
    std::filesystem::path executable;
    std::vector<std::string> args;
    std::unordered_map<std::string, std::string> env;
    std::optional<std::filesystem::path> workdir;

    auto& with_env(std::string key, std::string value) {
        env[std::move(key)] = std::move(value);
        return *this;
    }

    auto& in_directory(std::filesystem::path dir) {
        workdir = std::move(dir);
        return *this;
    }
};

/**
 * @brief Child process event hooks.
 *
 * Called from the launcher's I/O threads. Output arrives one line at a time without the
 * trailing newline. onExit fires once, after the output pipes drained, with the exit status
 * or std::nullopt when the child was killed by a signal.
 */
struct ProcessCallbacks {
    std::function<void(std::string_view)> onStdoutLine;
    std::function<void(std::string_view)> onStderrLine;
    std::function<void(std::optional<int>)> onExit;
};

class IChildProcess {
public:
    virtual ~IChildProcess() = default;

    [[nodiscard]] virtual int64_t pid() const noexcept = 0;
    [[nodiscard]] virtual bool isAlive() const noexcept = 0;

    // SIGTERM
    virtual Result<void> terminate() = 0;
    // SIGKILL
    virtual Result<void> kill() = 0;

    // True once the child exited and onExit has run
    [[nodiscard]] virtual bool waitForExit(std::chrono::milliseconds timeout) = 0;
    [[nodiscard]] virtual std::optional<int> exitCode() const noexcept = 0;
};

struct RunOutcome {
    std::optional<int> exitCode;
    std::string stdoutText;
    std::string stderrText;
};

// Process-spawning seam used by the supervisor; tests substitute a fake
class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;

    // Start a child. Fails with NotFound when the executable cannot be resolved or executed.
    virtual Result<std::unique_ptr<IChildProcess>> spawn(const ProcessSpec& spec,
                                                         ProcessCallbacks callbacks) = 0;

    // Run to completion and collect output; Timeout (after killing the child) when it overruns
    virtual Result<RunOutcome> run(const ProcessSpec& spec, std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual bool isExecutable(const std::filesystem::path& path) const = 0;

    // Resolve a bare command name against a colon-separated search path
    [[nodiscard]] virtual std::optional<std::filesystem::path>
    findInPath(const std::string& name, const std::string& searchPath) const = 0;
};

// fork/exec implementation with pipe readers for stdout and stderr
class PosixProcessLauncher : public IProcessLauncher {
public:
    Result<std::unique_ptr<IChildProcess>> spawn(const ProcessSpec& spec,
                                                 ProcessCallbacks callbacks) override;
    Result<RunOutcome> run(const ProcessSpec& spec, std::chrono::milliseconds timeout) override;
    bool isExecutable(const std::filesystem::path& path) const override;
    std::optional<std::filesystem::path> findInPath(const std::string& name,
                                                    const std::string& searchPath) const override;
};

// Current process PATH, empty when unset
std::string inheritedSearchPath();

} // namespace mcpbridge::daemon
