#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <mcpbridge/backend/backend_client.h>
#include <mcpbridge/bridge/protocol_translator.h>
#include <mcpbridge/config/config.h>
#include <mcpbridge/core/logging.h>
#include <mcpbridge/daemon/daemon_supervisor.h>

using nlohmann::json;
namespace mb = mcpbridge;

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

namespace {

int report(const mb::Error& error) {
    spdlog::error("{}: {}", mb::errorToString(error.code), error.message);
    return 1;
}

// Keeps the owned daemon alive until SIGINT/SIGTERM, then stops it
int superviseForeground(mb::daemon::DaemonSupervisor& supervisor,
                        const mb::daemon::DaemonHandle& handle) {
    std::cout << handle.toJson().dump(2) << std::endl;
    if (!handle.pid) {
        spdlog::info("mcpd is already running outside this supervisor");
        return 0;
    }
    spdlog::info("Supervising mcpd (pid {}); press Ctrl+C to stop", *handle.pid);
    while (g_running && supervisor.state() == mb::daemon::DaemonState::Running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
    if (supervisor.state() != mb::daemon::DaemonState::Running) {
        spdlog::warn("mcpd exited on its own");
        return 1;
    }
    if (auto stopped = supervisor.stop(); !stopped) {
        return report(stopped.error());
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"mcpdctl - manage the mcpd daemon and call its tools"};
    app.require_subcommand(1);

    std::string log_level = "info";
    std::string log_file;
    std::string configDir;
    std::string mcpdUrl;

    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error)")
        ->default_val("info");
    app.add_option("--log-file", log_file, "Log file path (optional)");
    app.add_option("--config-dir", configDir, "Directory holding .mcpd.toml and mcpd.log");
    app.add_option("--mcpd-url", mcpdUrl, "mcpd API base URL (env MCPD_URL)");

    auto* startCmd = app.add_subcommand("start", "Start mcpd and supervise it in the foreground");
    auto* stopCmd = app.add_subcommand("stop", "Stop mcpd");
    auto* statusCmd = app.add_subcommand("status", "Probe mcpd and print its state");
    auto* restartCmd = app.add_subcommand("restart", "Stop, wait for the port, start again");

    std::size_t logLines = 100;
    auto* logsCmd = app.add_subcommand("logs", "Print the tail of the mcpd log");
    logsCmd->add_option("-n,--lines", logLines, "Number of lines")->default_val(100);

    std::string serverName;
    std::string packageRef;
    auto* addCmd = app.add_subcommand("add", "Add a tool server to the mcpd config");
    addCmd->add_option("name", serverName, "Server name")->required();
    addCmd->add_option("package", packageRef, "Package reference (e.g. npx::@scope/pkg@latest)")
        ->required();
    auto* removeCmd = app.add_subcommand("remove", "Remove a tool server from the mcpd config");
    removeCmd->add_option("name", serverName, "Server name")->required();

    std::string target;
    bool noNamespace = false;
    auto* toolsCmd = app.add_subcommand("tools", "List the tool catalog");
    toolsCmd->add_option("-s,--server", target, "Only this server (individual mode)");
    toolsCmd->add_flag("--no-namespace", noNamespace, "Unprefixed names with --server");

    std::string toolName;
    std::string argsText = "{}";
    auto* callCmd = app.add_subcommand("call", "Call a tool by its catalog name");
    callCmd->add_option("tool", toolName, "Tool name (server__tool in unified mode)")->required();
    callCmd->add_option("-a,--args", argsText, "Arguments as a JSON object")->default_val("{}");
    callCmd->add_option("-s,--server", target, "Resolve the name against this server");
    callCmd->add_flag("--no-namespace", noNamespace, "Name is unprefixed (requires --server)");

    CLI11_PARSE(app, argc, argv);

    try {
        mb::core::setupLogging("mcpdctl", log_level, log_file);
    } catch (const std::exception& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto supCfg = mb::config::SupervisorConfig::fromEnvironment();
    if (!configDir.empty()) {
        supCfg.configDir = configDir;
        supCfg.logPath.clear();
        supCfg.configPath.clear();
        supCfg.resolvePaths();
    }
    if (!mcpdUrl.empty()) {
        supCfg.apiBaseUrl = mcpdUrl;
    }

    try {
        if (toolsCmd->parsed() || callCmd->parsed()) {
            auto bridgeCfg = mb::config::BridgeConfig::fromEnvironment();
            mb::backend::BackendClientConfig clientCfg;
            clientCfg.baseUrl = mcpdUrl.empty() ? bridgeCfg.daemonUrl : mcpdUrl;
            clientCfg.apiKey = bridgeCfg.apiKey;
            clientCfg.timeout = bridgeCfg.requestTimeout;
            auto translator = std::make_shared<mb::bridge::ProtocolTranslator>(
                std::make_shared<mb::backend::BackendClient>(clientCfg));

            auto session = target.empty()
                               ? mb::bridge::SessionOptions::unified()
                               : mb::bridge::SessionOptions::individual(target, !noNamespace);

            if (toolsCmd->parsed()) {
                auto catalog = translator->listTools(session);
                if (!catalog) {
                    return report(catalog.error());
                }
                json tools = json::array();
                for (const auto& entry : catalog.value()) {
                    tools.push_back(entry.toJson());
                }
                std::cout << json{{"tools", tools}}.dump(2) << std::endl;
                return 0;
            }

            json args;
            try {
                args = json::parse(argsText);
            } catch (const json::parse_error& e) {
                spdlog::error("--args is not valid JSON: {}", e.what());
                return 1;
            }
            auto result = translator->callTool(toolName, args, session);
            std::cout << result.toJson().dump(2) << std::endl;
            return result.isError ? 1 : 0;
        }

        mb::daemon::DaemonSupervisor supervisor(
            supCfg, std::make_shared<mb::daemon::PosixProcessLauncher>());

        if (startCmd->parsed()) {
            auto handle = supervisor.start();
            if (!handle) {
                return report(handle.error());
            }
            return superviseForeground(supervisor, handle.value());
        }
        if (restartCmd->parsed()) {
            auto handle = supervisor.restart();
            if (!handle) {
                return report(handle.error());
            }
            return superviseForeground(supervisor, handle.value());
        }
        if (stopCmd->parsed()) {
            if (auto stopped = supervisor.stop(); !stopped) {
                return report(stopped.error());
            }
            spdlog::info("mcpd stopped");
            return 0;
        }
        if (statusCmd->parsed()) {
            auto handle = supervisor.status();
            std::cout << handle.toJson().dump(2) << std::endl;
            return handle.running() ? 0 : 3;
        }
        if (logsCmd->parsed()) {
            auto lines = supervisor.logs(logLines);
            if (!lines) {
                return report(lines.error());
            }
            for (const auto& line : lines.value()) {
                std::cout << line << '\n';
            }
            std::cout.flush();
            return 0;
        }
        if (addCmd->parsed()) {
            if (auto added = supervisor.addServer(serverName, packageRef); !added) {
                return report(added.error());
            }
            spdlog::info("Added server '{}'", serverName);
            return 0;
        }
        if (removeCmd->parsed()) {
            if (auto removed = supervisor.removeServer(serverName); !removed) {
                return report(removed.error());
            }
            spdlog::info("Removed server '{}'", serverName);
            return 0;
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
