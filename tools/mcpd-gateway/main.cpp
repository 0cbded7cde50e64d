#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include <boost/asio/io_context.hpp>

#include <CLI/CLI.hpp>

#include <mcpbridge/backend/backend_client.h>
#include <mcpbridge/config/config.h>
#include <mcpbridge/core/logging.h>
#include <mcpbridge/gateway/http_gateway.h>

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

int main(int argc, char* argv[]) {
    CLI::App app{"mcpd HTTP Gateway - REST, WebSocket and MCP-over-HTTP access to mcpd"};

    auto cfg = mcpbridge::config::GatewayConfig::fromEnvironment();
    std::string log_level = "info";
    std::string log_file;

    app.add_option("--host", cfg.bindAddress, "Bind address (env HOST)")
        ->default_val(cfg.bindAddress);
    app.add_option("-p,--port", cfg.port, "Listen port (env PORT)")->default_val(cfg.port);
    app.add_option("--mcpd-url", cfg.daemonUrl, "mcpd API base URL (env MCPD_URL)")
        ->default_val(cfg.daemonUrl);
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error)")
        ->default_val("info");
    app.add_option("--log-file", log_file, "Log file path (optional)");
    CLI11_PARSE(app, argc, argv);

    try {
        mcpbridge::core::setupLogging("mcpd-gateway", log_level, log_file);
    } catch (const std::exception& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        mcpbridge::backend::BackendClientConfig clientCfg;
        clientCfg.baseUrl = cfg.daemonUrl;
        clientCfg.timeout = cfg.requestTimeout;
        auto backend = std::make_shared<mcpbridge::backend::BackendClient>(clientCfg);

        if (auto health = backend->health(); health) {
            spdlog::info("Connected to mcpd at {}", cfg.daemonUrl);
        } else {
            spdlog::error("Could not connect to mcpd at {}: {}", cfg.daemonUrl,
                          health.error().message);
            spdlog::error("Make sure mcpd is running");
        }

        auto translator = std::make_shared<mcpbridge::bridge::ProtocolTranslator>(backend);
        boost::asio::io_context ioc;
        mcpbridge::gateway::HttpGateway gateway(ioc, translator, cfg);

        std::atomic<bool> failed{false};
        std::thread server_thread([&gateway, &failed]() {
            try {
                gateway.run();
            } catch (const std::exception& e) {
                spdlog::error("Gateway failed: {}", e.what());
                failed = true;
                g_running = false;
            }
        });

        spdlog::info("API documentation: http://localhost:{}/api", cfg.port);
        if (cfg.apiKeys.count(mcpbridge::config::kDefaultGatewayKey)) {
            spdlog::warn("Using the default development API key; set API_KEY for real use");
        }

        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("Shutting down gateway...");
        gateway.stop();
        if (server_thread.joinable()) {
            server_thread.join();
        }
        return failed ? 1 : 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
