#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include <CLI/CLI.hpp>

#include <mcpbridge/backend/backend_client.h>
#include <mcpbridge/config/config.h>
#include <mcpbridge/core/logging.h>
#include <mcpbridge/mcp/stdio_bridge.h>

std::atomic<bool> g_shutdown{false};

void signalHandler(int) {
    g_shutdown = true;
}

int main(int argc, char* argv[]) {
    CLI::App app{"mcpd Bridge Server - MCP over stdio in front of the mcpd daemon"};
    app.footer("Environment:\n"
               "  MCPD_URL      mcpd API base URL (default: http://localhost:8090)\n"
               "  MCPD_API_KEY  Optional API key for mcpd authentication\n\n"
               "Examples:\n"
               "  mcpd-bridge                        all servers, tools named server__tool\n"
               "  mcpd-bridge --server filesystem    filesystem tools only\n"
               "  mcpd-bridge -s github --no-namespace");

    std::string server;
    bool noNamespace = false;
    std::string log_level = "info";
    std::string log_file;

    app.add_option("-s,--server", server, "Expose only this mcpd server (individual mode)");
    app.add_flag("--no-namespace", noNamespace,
                 "In individual mode, expose tool names without the server prefix");
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error)")
        ->default_val("info");
    app.add_option("--log-file", log_file, "Log file path (optional)");
    CLI11_PARSE(app, argc, argv);

    try {
        mcpbridge::core::setupLogging("mcpd-bridge", log_level, log_file);
    } catch (const std::exception& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 1;
    }

    auto cfg = mcpbridge::config::BridgeConfig::fromEnvironment();
    if (!server.empty()) {
        cfg.targetServer = server;
    }
    cfg.namespacing = !noNamespace;

    mcpbridge::bridge::SessionOptions session;
    if (cfg.targetServer) {
        session = mcpbridge::bridge::SessionOptions::individual(*cfg.targetServer, cfg.namespacing);
    } else {
        if (noNamespace) {
            spdlog::warn("--no-namespace has no effect without --server");
        }
        session = mcpbridge::bridge::SessionOptions::unified();
    }

    spdlog::info("mcpd URL: {}", cfg.daemonUrl);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        mcpbridge::backend::BackendClientConfig clientCfg;
        clientCfg.baseUrl = cfg.daemonUrl;
        clientCfg.apiKey = cfg.apiKey;
        clientCfg.timeout = cfg.requestTimeout;

        auto backend = std::make_shared<mcpbridge::backend::BackendClient>(clientCfg);
        auto translator = std::make_shared<mcpbridge::bridge::ProtocolTranslator>(backend);
        auto bridge = std::make_shared<mcpbridge::mcp::StdioBridgeSession>(
            translator, session, std::make_unique<mcpbridge::mcp::StdioTransport>());

        if (auto ok = bridge->preflight(); !ok) {
            return 1;
        }

        auto sessionDone = std::make_shared<std::atomic<bool>>(false);
        std::thread server_thread([bridge, sessionDone]() {
            bridge->run(&g_shutdown);
            sessionDone->store(true);
        });

        while (!g_shutdown && !sessionDone->load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        if (sessionDone->load()) {
            server_thread.join();
        } else {
            // Still blocked reading stdin; the thread keeps its own references until exit
            spdlog::info("Received shutdown signal, stopping bridge...");
            server_thread.detach();
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
