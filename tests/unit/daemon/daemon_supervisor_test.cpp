#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <mcpbridge/daemon/binary_locator.h>
#include <mcpbridge/daemon/daemon_supervisor.h>

#include "../../common/fake_process.h"
#include "../../common/test_helpers.h"

#include <atomic>
#include <thread>

using namespace mcpbridge;
using namespace mcpbridge::daemon;
using mcpbridge::test::FakeChild;
using mcpbridge::test::FakeLauncher;
using ::testing::HasSubstr;

namespace {

constexpr const char* kFakeBinary = "/fake/mcpd";

class DaemonSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        launcher_ = std::make_shared<FakeLauncher>();
        launcher_->addExecutable(kFakeBinary);

        cfg_.configDir = dir_.path;
        cfg_.binaryOverride = kFakeBinary;
        cfg_.apiBaseUrl = "http://localhost:8090";
        cfg_.healthProbeDelay = std::chrono::milliseconds(100);
        cfg_.absoluteTimeout = std::chrono::milliseconds(300);
        cfg_.portConflictProbeDelay = std::chrono::milliseconds(20);
        cfg_.restartGrace = std::chrono::milliseconds(10);
        cfg_.stopTimeout = std::chrono::milliseconds(200);
    }

    std::unique_ptr<DaemonSupervisor> makeSupervisor() {
        return std::make_unique<DaemonSupervisor>(cfg_, launcher_, [this]() -> Result<void> {
            if (healthy_.load())
                return {};
            return Error{ErrorCode::NetworkError, "connect ECONNREFUSED"};
        });
    }

    // Daemon becomes healthy shortly after it is spawned
    void healthyAfterSpawn() {
        launcher_->setScript([this](const std::shared_ptr<FakeChild>&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            healthy_ = true;
        });
    }

    test::TempDir dir_;
    config::SupervisorConfig cfg_;
    std::shared_ptr<FakeLauncher> launcher_;
    std::atomic<bool> healthy_{false};
};

} // namespace

TEST_F(DaemonSupervisorTest, AlreadyHealthyDaemonIsReusedWithoutSpawning) {
    healthy_ = true;
    auto sup = makeSupervisor();

    auto r = sup->start();
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().state, DaemonState::Running);
    EXPECT_FALSE(r.value().pid.has_value());
    EXPECT_EQ(r.value().apiBaseUrl, "http://localhost:8090");
    EXPECT_EQ(launcher_->spawnCount(), 0u);
    EXPECT_EQ(sup->state(), DaemonState::Running);
}

TEST_F(DaemonSupervisorTest, HealthyProbeResolvesWithOwnedPid) {
    healthyAfterSpawn();
    auto sup = makeSupervisor();

    auto r = sup->start();
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_TRUE(r.value().running());
    ASSERT_TRUE(r.value().pid.has_value());
    EXPECT_EQ(*r.value().pid, 4242);
    EXPECT_EQ(r.value().toJson()["pid"], 4242);

    auto specs = launcher_->spawnSpecs();
    ASSERT_EQ(specs.size(), 1u);
    const auto& spec = specs[0];
    EXPECT_EQ(spec.executable, std::filesystem::path(kFakeBinary));
    EXPECT_EQ(spec.args,
              (std::vector<std::string>{"daemon", "--dev", "--log-level=DEBUG",
                                        "--log-path=" + (dir_.path / "mcpd.log").string(),
                                        "--config-file=" + (dir_.path / ".mcpd.toml").string()}));
    ASSERT_TRUE(spec.workdir.has_value());
    EXPECT_EQ(*spec.workdir, dir_.path);
    ASSERT_TRUE(spec.env.count("PATH"));
    EXPECT_THAT(spec.env.at("PATH"), HasSubstr("/usr/local/bin"));
    EXPECT_EQ(spec.env.at("NODE_PATH"), daemonNodePath());

    EXPECT_EQ(test::read_file(dir_.path / ".mcpd.toml"), "servers = []");
    EXPECT_EQ(sup->state(), DaemonState::Running);
    launcher_->joinScripts();
}

TEST_F(DaemonSupervisorTest, ExistingConfigFileIsKept) {
    test::write_file(dir_.path / ".mcpd.toml", "[[servers]]\nname = \"time\"\n");
    auto sup = makeSupervisor();
    ASSERT_TRUE(sup->ensureConfigFile());
    EXPECT_EQ(test::read_file(dir_.path / ".mcpd.toml"), "[[servers]]\nname = \"time\"\n");
}

TEST_F(DaemonSupervisorTest, NonZeroExitRejectsWithStderr) {
    launcher_->setScript([](const std::shared_ptr<FakeChild>& child) {
        child->emitStderr("error: invalid config file");
        child->exit(2);
    });
    auto sup = makeSupervisor();

    auto r = sup->start();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::DaemonExitedNonZero);
    EXPECT_THAT(r.error().message, HasSubstr("Daemon exited with code 2"));
    EXPECT_THAT(r.error().message, HasSubstr("error: invalid config file"));
    EXPECT_EQ(sup->state(), DaemonState::Failed);
    launcher_->joinScripts();
}

TEST_F(DaemonSupervisorTest, CleanExitDuringStartDoesNotReject) {
    launcher_->setScript([this](const std::shared_ptr<FakeChild>& child) {
        child->exit(0);
        healthy_ = true;
    });
    auto sup = makeSupervisor();

    auto r = sup->start();
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_TRUE(r.value().running());
    // The child is gone, so nothing is owned
    EXPECT_FALSE(r.value().pid.has_value());
    launcher_->joinScripts();
}

TEST_F(DaemonSupervisorTest, PortConflictAttachesToExistingDaemon) {
    launcher_->setScript([this](const std::shared_ptr<FakeChild>& child) {
        healthy_ = true;
        child->emitStderr("listen tcp :8090: bind: Address already in use");
    });
    auto sup = makeSupervisor();

    auto r = sup->start();
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_TRUE(r.value().running());
    EXPECT_FALSE(r.value().pid.has_value());
    launcher_->joinScripts();

    auto child = launcher_->child(0);
    ASSERT_NE(child, nullptr);
    EXPECT_GE(child->terminateCount.load(), 1);
    EXPECT_FALSE(child->isAlive());
}

TEST_F(DaemonSupervisorTest, PortConflictWithoutReachableDaemonFails) {
    launcher_->setScript([](const std::shared_ptr<FakeChild>& child) {
        child->emitStderr("bind: address already in use");
    });
    auto sup = makeSupervisor();

    auto r = sup->start();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::PortConflict);
    EXPECT_THAT(r.error().message,
                HasSubstr("Port is in use but cannot connect to daemon at http://localhost:8090"));
    EXPECT_EQ(sup->state(), DaemonState::Failed);
    launcher_->joinScripts();
}

TEST_F(DaemonSupervisorTest, SilentDaemonFailsAtHealthProbe) {
    auto sup = makeSupervisor();
    auto started = std::chrono::steady_clock::now();

    auto r = sup->start();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::DaemonStartTimeout);
    EXPECT_EQ(r.error().message, "Daemon failed to start - not running after 100 ms");
    // Settled by the probe, well before the absolute timeout
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(290));

    // A failed start leaves no process behind
    auto child = launcher_->child(0);
    ASSERT_NE(child, nullptr);
    EXPECT_FALSE(child->isAlive());
}

TEST_F(DaemonSupervisorTest, StderrWithoutHealthWaitsForAbsoluteTimeout) {
    launcher_->setScript([](const std::shared_ptr<FakeChild>& child) {
        child->emitStderr("downloading packages...");
    });
    auto sup = makeSupervisor();

    auto r = sup->start();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::DaemonStartTimeout);
    EXPECT_THAT(r.error().message, HasSubstr("within 300 ms"));
    EXPECT_THAT(r.error().message, HasSubstr("Path: /fake/mcpd"));
    EXPECT_THAT(r.error().message, HasSubstr("Error output: downloading packages..."));
    launcher_->joinScripts();
}

TEST_F(DaemonSupervisorTest, MissingBinaryFailsBeforeSpawning) {
    cfg_.binaryOverride = "/nowhere/mcpd";
    auto sup = makeSupervisor();

    auto r = sup->start();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::BinaryNotFound);
    EXPECT_EQ(launcher_->spawnCount(), 0u);
    EXPECT_EQ(sup->state(), DaemonState::Failed);
    EXPECT_EQ(sup->status().state, DaemonState::Failed);
}

TEST_F(DaemonSupervisorTest, SpawnFailureMapsToBinaryNotFound) {
    launcher_->setSpawnError(Error{ErrorCode::NotFound, "Failed to execute /fake/mcpd"});
    auto sup = makeSupervisor();

    auto r = sup->start();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::BinaryNotFound);
}

TEST_F(DaemonSupervisorTest, ConcurrentStartsSpawnOnce) {
    healthyAfterSpawn();
    auto sup = makeSupervisor();

    Result<DaemonHandle> first = Error{ErrorCode::Unknown};
    Result<DaemonHandle> second = Error{ErrorCode::Unknown};
    std::thread a([&] { first = sup->start(); });
    std::thread b([&] { second = sup->start(); });
    a.join();
    b.join();

    ASSERT_TRUE(first) << first.error().message;
    ASSERT_TRUE(second) << second.error().message;
    EXPECT_TRUE(first.value().running());
    EXPECT_TRUE(second.value().running());
    EXPECT_EQ(launcher_->spawnCount(), 1u);
    EXPECT_EQ(first.value().pid, second.value().pid);
    launcher_->joinScripts();
}

TEST_F(DaemonSupervisorTest, StopTerminatesOwnedChild) {
    healthyAfterSpawn();
    auto sup = makeSupervisor();
    ASSERT_TRUE(sup->start());
    launcher_->joinScripts();

    ASSERT_TRUE(sup->stop());
    auto child = launcher_->child(0);
    EXPECT_EQ(child->terminateCount.load(), 1);
    EXPECT_EQ(child->killCount.load(), 0);
    EXPECT_FALSE(child->isAlive());
    EXPECT_EQ(sup->state(), DaemonState::Stopped);
    // Owned child: no pkill
    EXPECT_TRUE(launcher_->runSpecs().empty());
}

TEST_F(DaemonSupervisorTest, StopEscalatesToKill) {
    healthyAfterSpawn();
    auto sup = makeSupervisor();
    ASSERT_TRUE(sup->start());
    launcher_->joinScripts();

    auto child = launcher_->child(0);
    child->exitOnTerminate = false;
    ASSERT_TRUE(sup->stop());
    EXPECT_EQ(child->terminateCount.load(), 1);
    EXPECT_EQ(child->killCount.load(), 1);
    EXPECT_EQ(sup->state(), DaemonState::Stopped);
}

TEST_F(DaemonSupervisorTest, StopWithoutChildUsesPkill) {
    auto sup = makeSupervisor();
    launcher_->setRunHandler([](const ProcessSpec&) -> Result<RunOutcome> {
        return RunOutcome{1, "", ""};
    });

    ASSERT_TRUE(sup->stop());
    auto runs = launcher_->runSpecs();
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].executable, std::filesystem::path("pkill"));
    EXPECT_EQ(runs[0].args, (std::vector<std::string>{"-f", "mcpd daemon"}));
    EXPECT_EQ(sup->state(), DaemonState::Stopped);
}

TEST_F(DaemonSupervisorTest, PkillMissingStillCountsAsStopped) {
    auto sup = makeSupervisor();
    launcher_->setRunHandler([](const ProcessSpec&) -> Result<RunOutcome> {
        return Error{ErrorCode::NotFound, "Executable not found: pkill"};
    });
    EXPECT_TRUE(sup->stop());
}

TEST_F(DaemonSupervisorTest, PkillFailureIsReported) {
    auto sup = makeSupervisor();
    launcher_->setRunHandler([](const ProcessSpec&) -> Result<RunOutcome> {
        return RunOutcome{2, "", "pkill: bad pattern\n"};
    });

    auto r = sup->stop();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InternalError);
    EXPECT_EQ(r.error().message, "Failed to stop daemon, exit code: 2");
}

TEST_F(DaemonSupervisorTest, UnexpectedExitMarksStopped) {
    healthyAfterSpawn();
    auto sup = makeSupervisor();
    ASSERT_TRUE(sup->start());
    launcher_->joinScripts();
    ASSERT_EQ(sup->state(), DaemonState::Running);

    launcher_->child(0)->exit(1);
    EXPECT_EQ(sup->state(), DaemonState::Stopped);
}

TEST_F(DaemonSupervisorTest, AddServerRunsConfigCommand) {
    auto sup = makeSupervisor();

    ASSERT_TRUE(sup->addServer("time", "npx::mcp-server-time@latest"));
    auto runs = launcher_->runSpecs();
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].executable, std::filesystem::path(kFakeBinary));
    EXPECT_EQ(runs[0].args,
              (std::vector<std::string>{"add", "time", "npx::mcp-server-time@latest",
                                        "--config-file=" + (dir_.path / ".mcpd.toml").string()}));
    ASSERT_TRUE(runs[0].workdir.has_value());
    EXPECT_EQ(*runs[0].workdir, dir_.path);
    // Not running: no restart
    EXPECT_EQ(launcher_->spawnCount(), 0u);
}

TEST_F(DaemonSupervisorTest, ConfigCommandFailureCarriesStderr) {
    auto sup = makeSupervisor();
    launcher_->setRunHandler([](const ProcessSpec&) -> Result<RunOutcome> {
        return RunOutcome{1, "", "server 'time' already exists\n"};
    });

    auto r = sup->addServer("time", "npx::time");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidOperation);
    EXPECT_EQ(r.error().message, "Failed to add server time: server 'time' already exists");

    auto removed = sup->removeServer("time");
    ASSERT_FALSE(removed);
    EXPECT_EQ(removed.error().message, "Failed to remove server time: server 'time' already exists");
}

TEST_F(DaemonSupervisorTest, AddServerValidatesArguments) {
    auto sup = makeSupervisor();
    EXPECT_EQ(sup->addServer("", "npx::time").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(sup->addServer("time", "").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(sup->removeServer("").error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(launcher_->runSpecs().empty());
}

TEST_F(DaemonSupervisorTest, ConfigChangeRestartsRunningDaemon) {
    healthy_ = true;
    launcher_->setRunHandler([this](const ProcessSpec& spec) -> Result<RunOutcome> {
        if (spec.executable == std::filesystem::path("pkill"))
            healthy_ = false;
        return RunOutcome{0, "", ""};
    });
    healthyAfterSpawn();
    auto sup = makeSupervisor();

    ASSERT_TRUE(sup->removeServer("time"));
    auto runs = launcher_->runSpecs();
    ASSERT_EQ(runs.size(), 2u);
    EXPECT_EQ(runs[0].args.front(), "remove");
    EXPECT_EQ(runs[1].executable, std::filesystem::path("pkill"));
    EXPECT_EQ(launcher_->spawnCount(), 1u);
    EXPECT_EQ(sup->state(), DaemonState::Running);
    launcher_->joinScripts();
}

TEST_F(DaemonSupervisorTest, RestartStopsThenStarts) {
    healthyAfterSpawn();
    auto sup = makeSupervisor();
    ASSERT_TRUE(sup->start());
    launcher_->joinScripts();

    // The API goes down with the old child and comes back with the new one
    healthy_ = false;
    auto r = sup->restart();

    ASSERT_TRUE(r) << r.error().message;
    EXPECT_FALSE(launcher_->child(0)->isAlive());
    EXPECT_EQ(launcher_->spawnCount(), 2u);
    ASSERT_TRUE(r.value().pid.has_value());
    EXPECT_EQ(*r.value().pid, 4243);
    launcher_->joinScripts();
}

TEST_F(DaemonSupervisorTest, StatusReflectsProbe) {
    auto sup = makeSupervisor();
    EXPECT_EQ(sup->status().state, DaemonState::Stopped);
    EXPECT_FALSE(sup->status().toJson()["running"].get<bool>());

    healthy_ = true;
    auto h = sup->status();
    EXPECT_EQ(h.state, DaemonState::Running);
    EXPECT_EQ(h.logPath, dir_.path / "mcpd.log");
    EXPECT_EQ(h.configPath, dir_.path / ".mcpd.toml");
    // status never touches the lifecycle state
    EXPECT_EQ(sup->state(), DaemonState::Stopped);
}

TEST_F(DaemonSupervisorTest, LogsReturnsTail) {
    auto sup = makeSupervisor();
    auto none = sup->logs(10);
    ASSERT_TRUE(none);
    EXPECT_TRUE(none.value().empty());

    test::write_file(dir_.path / "mcpd.log", "one\ntwo\nthree\nfour\n");
    auto tail = sup->logs(2);
    ASSERT_TRUE(tail);
    EXPECT_EQ(tail.value(), (std::vector<std::string>{"three", "four"}));

    auto all = sup->logs(100);
    ASSERT_TRUE(all);
    EXPECT_EQ(all.value().size(), 4u);
}
