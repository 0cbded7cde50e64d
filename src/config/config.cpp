#include <mcpbridge/config/config.h>
#include <mcpbridge/config/config_helpers.h>

#include <spdlog/spdlog.h>

namespace mcpbridge::config {

std::filesystem::path get_config_dir() {
    if (auto xdg = env_value("XDG_CONFIG_HOME")) {
        return std::filesystem::path(*xdg) / "mcpbridge";
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / ".config" / "mcpbridge";
    }
    return std::filesystem::current_path() / ".mcpbridge";
}

BridgeConfig BridgeConfig::fromEnvironment() {
    BridgeConfig cfg;
    cfg.daemonUrl = env_or("MCPD_URL", cfg.daemonUrl);
    cfg.apiKey = env_value("MCPD_API_KEY");
    if (auto t = env_value("MCPD_TIMEOUT_MS")) {
        auto ms = parse_ms(*t);
        if (ms.count() > 0) {
            cfg.requestTimeout = ms;
        } else {
            spdlog::warn("Ignoring invalid MCPD_TIMEOUT_MS '{}'", *t);
        }
    }
    return cfg;
}

GatewayConfig GatewayConfig::fromEnvironment() {
    GatewayConfig cfg;
    cfg.bindAddress = env_or("HOST", cfg.bindAddress);
    if (auto p = env_value("PORT")) {
        try {
            auto v = std::stoul(*p);
            if (v == 0 || v > 65535) {
                throw std::out_of_range("port");
            }
            cfg.port = static_cast<uint16_t>(v);
        } catch (const std::exception&) {
            spdlog::warn("Ignoring invalid PORT '{}'", *p);
        }
    }
    cfg.daemonUrl = env_or("MCPD_URL", cfg.daemonUrl);
    if (auto keys = env_value("API_KEY")) {
        auto parsed = split_csv(*keys);
        if (!parsed.empty()) {
            cfg.apiKeys = std::set<std::string>(parsed.begin(), parsed.end());
        }
    }
    if (auto cors = env_value("ENABLE_CORS")) {
        cfg.enableCors = *cors != "false";
    }
    if (auto rl = env_value("RATE_LIMIT_PER_MINUTE")) {
        try {
            cfg.rateLimitPerMinute = static_cast<unsigned>(std::stoul(*rl));
        } catch (const std::exception&) {
            spdlog::warn("Ignoring invalid RATE_LIMIT_PER_MINUTE '{}'", *rl);
        }
    }
    if (auto t = env_value("MCPD_TIMEOUT_MS")) {
        auto ms = parse_ms(*t);
        if (ms.count() > 0) {
            cfg.requestTimeout = ms;
        }
    }
    return cfg;
}

SupervisorConfig& SupervisorConfig::resolvePaths() {
    if (configDir.empty()) {
        configDir = get_config_dir();
    }
    if (logPath.empty()) {
        logPath = configDir / "mcpd.log";
    }
    if (configPath.empty()) {
        configPath = configDir / ".mcpd.toml";
    }
    return *this;
}

SupervisorConfig SupervisorConfig::fromEnvironment() {
    SupervisorConfig cfg;
    if (auto dir = env_value("MCPBRIDGE_CONFIG_DIR")) {
        cfg.configDir = expand_tilde(*dir);
    }
    if (auto bin = env_value("MCPD_BIN")) {
        cfg.binaryOverride = expand_tilde(*bin);
    }
    if (auto res = env_value("MCPBRIDGE_RESOURCES_DIR")) {
        cfg.bundledResourceDir = expand_tilde(*res);
    }
    cfg.apiBaseUrl = env_or("MCPD_URL", cfg.apiBaseUrl);
    cfg.resolvePaths();
    return cfg;
}

} // namespace mcpbridge::config
