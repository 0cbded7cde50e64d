#include <mcpbridge/daemon/process_launcher.h>

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcpbridge::daemon {

namespace {

constexpr auto kReaderPollMs = 100;
// How long onExit waits for the pipes to drain; grandchildren may keep them open
constexpr std::chrono::milliseconds kDrainGrace{250};

bool makePipe(int fds[2]) {
    if (::pipe(fds) < 0) {
        return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::vector<std::string>
buildEnvironment(const std::unordered_map<std::string, std::string>& overrides) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        std::string_view kv(*e);
        auto eq = kv.find('=');
        if (eq != std::string_view::npos && overrides.count(std::string(kv.substr(0, eq)))) {
            continue;
        }
        out.emplace_back(kv);
    }
    for (const auto& [key, value] : overrides) {
        out.push_back(key + "=" + value);
    }
    return out;
}

/**
 * @brief POSIX child owned through pipes and a waiter thread.
 *
 * The waiter blocks in waitid(WNOWAIT) so the pid stays reserved until the reap happens
 * under mutex_; signals sent under the same lock can never hit a recycled pid.
 */
class PosixChildProcess final : public IChildProcess {
public:
    PosixChildProcess(pid_t pid, int stdoutFd, int stderrFd, ProcessCallbacks callbacks)
        : pid_(pid), stdoutFd_(stdoutFd), stderrFd_(stderrFd), callbacks_(std::move(callbacks)) {
        stdoutThread_ = std::thread([this] { readLoop(stdoutFd_, callbacks_.onStdoutLine); });
        stderrThread_ = std::thread([this] { readLoop(stderrFd_, callbacks_.onStderrLine); });
        waiterThread_ = std::thread([this] { waitLoop(); });
    }

    ~PosixChildProcess() override {
        if (isAlive()) {
            spdlog::debug("Child {} still alive at teardown, terminating", pid_);
            if (auto r = terminate(); !r) {
                spdlog::warn("{}", r.error().message);
            }
            if (!waitForExit(std::chrono::seconds{5})) {
                spdlog::warn("Child {} ignored SIGTERM, killing", pid_);
                if (auto r = kill(); !r) {
                    spdlog::warn("{}", r.error().message);
                }
            }
        }
        stopReaders_.store(true, std::memory_order_release);
        if (stdoutThread_.joinable())
            stdoutThread_.join();
        if (stderrThread_.joinable())
            stderrThread_.join();
        if (waiterThread_.joinable())
            waiterThread_.join();
        closeFd(stdoutFd_);
        closeFd(stderrFd_);
    }

    PosixChildProcess(const PosixChildProcess&) = delete;
    PosixChildProcess& operator=(const PosixChildProcess&) = delete;

    int64_t pid() const noexcept override { return static_cast<int64_t>(pid_); }

    bool isAlive() const noexcept override {
        std::lock_guard<std::mutex> lk(mutex_);
        return !reaped_;
    }

    Result<void> terminate() override { return sendSignal(SIGTERM, "SIGTERM"); }

    Result<void> kill() override { return sendSignal(SIGKILL, "SIGKILL"); }

    bool waitForExit(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lk(mutex_);
        return cv_.wait_for(lk, timeout, [this] { return finished_; });
    }

    std::optional<int> exitCode() const noexcept override {
        std::lock_guard<std::mutex> lk(mutex_);
        return exitCode_;
    }

private:
    Result<void> sendSignal(int sig, const char* name) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (reaped_) {
            return {};
        }
        if (::kill(pid_, sig) != 0 && errno != ESRCH) {
            return Error{ErrorCode::InternalError, std::string("Failed to send ") + name +
                                                       " to pid " + std::to_string(pid_) + ": " +
                                                       std::strerror(errno)};
        }
        return {};
    }

    void readLoop(int fd, const std::function<void(std::string_view)>& sink) {
        std::array<char, 4096> buffer;
        std::string pending;
        auto emit = [&sink](std::string_view line) {
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            if (sink) {
                sink(line);
            }
        };

        while (!stopReaders_.load(std::memory_order_acquire)) {
            pollfd pfd{fd, POLLIN, 0};
            int rc = ::poll(&pfd, 1, kReaderPollMs);
            if (rc < 0) {
                if (errno == EINTR)
                    continue;
                break;
            }
            if (rc == 0) {
                continue;
            }
            ssize_t n = ::read(fd, buffer.data(), buffer.size());
            if (n > 0) {
                pending.append(buffer.data(), static_cast<size_t>(n));
                size_t start = 0;
                for (auto nl = pending.find('\n'); nl != std::string::npos;
                     nl = pending.find('\n', start)) {
                    emit(std::string_view(pending).substr(start, nl - start));
                    start = nl + 1;
                }
                pending.erase(0, start);
                continue;
            }
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                continue;
            }
            break; // EOF
        }
        if (!pending.empty()) {
            emit(pending);
        }
        {
            std::lock_guard<std::mutex> lk(mutex_);
            ++readersDone_;
        }
        cv_.notify_all();
    }

    void waitLoop() {
        siginfo_t info{};
        int rc;
        do {
            rc = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT);
        } while (rc < 0 && errno == EINTR);

        std::optional<int> code;
        {
            std::unique_lock<std::mutex> lk(mutex_);
            int status = 0;
            pid_t r;
            do {
                r = ::waitpid(pid_, &status, 0);
            } while (r < 0 && errno == EINTR);
            if (r == pid_ && WIFEXITED(status)) {
                code = WEXITSTATUS(status);
            } else if (r < 0) {
                spdlog::warn("waitpid({}) failed: {}", pid_, std::strerror(errno));
            }
            reaped_ = true;
            exitCode_ = code;
            cv_.wait_for(lk, kDrainGrace, [this] { return readersDone_ == 2; });
        }

        spdlog::debug("Child {} exited ({})", pid_, code ? std::to_string(*code) : "signal");
        if (callbacks_.onExit) {
            callbacks_.onExit(code);
        }
        {
            std::lock_guard<std::mutex> lk(mutex_);
            finished_ = true;
        }
        cv_.notify_all();
    }

    pid_t pid_;
    int stdoutFd_;
    int stderrFd_;
    ProcessCallbacks callbacks_;

    std::atomic<bool> stopReaders_{false};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool reaped_ = false;
    bool finished_ = false;
    int readersDone_ = 0;
    std::optional<int> exitCode_;

    std::thread stdoutThread_;
    std::thread stderrThread_;
    std::thread waiterThread_;
};

} // namespace

std::string inheritedSearchPath() {
    const char* path = std::getenv("PATH");
    return path ? std::string(path) : std::string();
}

bool PosixProcessLauncher::isExecutable(const std::filesystem::path& path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::filesystem::path>
PosixProcessLauncher::findInPath(const std::string& name, const std::string& searchPath) const {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (isExecutable(name)) {
            return std::filesystem::path(name);
        }
        return std::nullopt;
    }
    size_t start = 0;
    while (start <= searchPath.size()) {
        auto colon = searchPath.find(':', start);
        if (colon == std::string::npos) {
            colon = searchPath.size();
        }
        if (colon > start) {
            auto candidate = std::filesystem::path(searchPath.substr(start, colon - start)) / name;
            if (isExecutable(candidate)) {
                return candidate;
            }
        }
        start = colon + 1;
    }
    return std::nullopt;
}

Result<std::unique_ptr<IChildProcess>> PosixProcessLauncher::spawn(const ProcessSpec& spec,
                                                                   ProcessCallbacks callbacks) {
    auto pathIt = spec.env.find("PATH");
    const std::string searchPath = pathIt != spec.env.end() ? pathIt->second : inheritedSearchPath();
    auto resolved = findInPath(spec.executable.string(), searchPath);
    if (!resolved) {
        return Error{ErrorCode::NotFound, "Executable not found: " + spec.executable.string()};
    }

    // A child closing its pipes must not take the parent down
    ::signal(SIGPIPE, SIG_IGN);

    // Everything the child touches is prepared before fork()
    std::string exe = resolved->string();
    std::vector<std::string> args = spec.args;
    std::vector<char*> argv;
    argv.push_back(exe.data());
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env = buildEnvironment(spec.env);
    std::vector<char*> envp;
    for (auto& e : env) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);

    const std::string workdir = spec.workdir ? spec.workdir->string() : std::string();

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    if (!makePipe(outPipe) || !makePipe(errPipe) || !makePipe(execPipe)) {
        const int e = errno;
        for (int* fd : {&outPipe[0], &outPipe[1], &errPipe[0], &errPipe[1], &execPipe[0],
                        &execPipe[1]}) {
            closeFd(*fd);
        }
        return Error{ErrorCode::InternalError,
                     std::string("Failed to create pipes: ") + std::strerror(e)};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        const int e = errno;
        for (int* fd : {&outPipe[0], &outPipe[1], &errPipe[0], &errPipe[1], &execPipe[0],
                        &execPipe[1]}) {
            closeFd(*fd);
        }
        return Error{ErrorCode::InternalError, std::string("fork() failed: ") + std::strerror(e)};
    }

    if (pid == 0) {
        // Child
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        if (!workdir.empty() && ::chdir(workdir.c_str()) < 0) {
            int e = errno;
            (void)!::write(execPipe[1], &e, sizeof(e));
            ::_exit(127);
        }
        ::execve(exe.c_str(), argv.data(), envp.data());
        int e = errno;
        (void)!::write(execPipe[1], &e, sizeof(e));
        ::_exit(127);
    }

    // Parent
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(execPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    if (n > 0) {
        ::waitpid(pid, nullptr, 0);
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        return Error{ErrorCode::NotFound,
                     "Failed to execute " + exe + ": " + std::strerror(childErrno)};
    }

    spdlog::debug("Spawned {} (pid={})", exe, pid);
    std::unique_ptr<IChildProcess> child =
        std::make_unique<PosixChildProcess>(pid, outPipe[0], errPipe[0], std::move(callbacks));
    return Result<std::unique_ptr<IChildProcess>>(std::move(child));
}

Result<RunOutcome> PosixProcessLauncher::run(const ProcessSpec& spec,
                                             std::chrono::milliseconds timeout) {
    struct Collected {
        std::mutex mutex;
        std::string out;
        std::string err;
    };
    auto collected = std::make_shared<Collected>();

    ProcessCallbacks callbacks;
    callbacks.onStdoutLine = [collected](std::string_view line) {
        std::lock_guard<std::mutex> lk(collected->mutex);
        collected->out.append(line);
        collected->out.push_back('\n');
    };
    callbacks.onStderrLine = [collected](std::string_view line) {
        std::lock_guard<std::mutex> lk(collected->mutex);
        collected->err.append(line);
        collected->err.push_back('\n');
    };

    auto spawned = spawn(spec, std::move(callbacks));
    if (!spawned) {
        return spawned.error();
    }
    auto& child = *spawned.value();
    if (!child.waitForExit(timeout)) {
        if (auto r = child.kill(); !r) {
            spdlog::warn("{}", r.error().message);
        }
        return Error{ErrorCode::Timeout, spec.executable.string() + " did not finish within " +
                                             std::to_string(timeout.count()) + " ms"};
    }

    RunOutcome outcome;
    outcome.exitCode = child.exitCode();
    std::lock_guard<std::mutex> lk(collected->mutex);
    outcome.stdoutText = std::move(collected->out);
    outcome.stderrText = std::move(collected->err);
    return outcome;
}

} // namespace mcpbridge::daemon
