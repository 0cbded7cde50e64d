#include <gtest/gtest.h>

#include <mcpbridge/config/config.h>
#include <mcpbridge/config/config_helpers.h>

#include "../../common/test_helpers.h"

using namespace mcpbridge::config;
using mcpbridge::test::EnvGuard;

TEST(ConfigHelpersTest, SplitCsvTrimsAndDropsEmptyEntries) {
    auto items = split_csv(" alpha, beta ,,gamma , ");
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0], "alpha");
    EXPECT_EQ(items[1], "beta");
    EXPECT_EQ(items[2], "gamma");
    EXPECT_TRUE(split_csv("").empty());
}

TEST(ConfigHelpersTest, ParseMsRejectsGarbage) {
    EXPECT_EQ(parse_ms("250").count(), 250);
    EXPECT_EQ(parse_ms("soon").count(), 0);
}

TEST(ConfigHelpersTest, ExpandTildeUsesHome) {
    EnvGuard home("HOME", std::string("/home/tester"));
    EXPECT_EQ(expand_tilde("~/mcpd"), std::filesystem::path("/home/tester/mcpd"));
    EXPECT_EQ(expand_tilde("~"), std::filesystem::path("/home/tester"));
    EXPECT_EQ(expand_tilde("/abs/path"), std::filesystem::path("/abs/path"));
}

TEST(ConfigHelpersTest, EmptyEnvironmentValueCountsAsUnset) {
    EnvGuard g("MCPBRIDGE_TEST_EMPTY", std::string(""));
    EXPECT_FALSE(env_value("MCPBRIDGE_TEST_EMPTY").has_value());
    EXPECT_EQ(env_or("MCPBRIDGE_TEST_EMPTY", "fallback"), "fallback");
}

TEST(BridgeConfigTest, DefaultsWithoutEnvironment) {
    EnvGuard url("MCPD_URL", std::nullopt);
    EnvGuard key("MCPD_API_KEY", std::nullopt);
    EnvGuard timeout("MCPD_TIMEOUT_MS", std::nullopt);

    auto cfg = BridgeConfig::fromEnvironment();
    EXPECT_EQ(cfg.daemonUrl, "http://localhost:8090");
    EXPECT_FALSE(cfg.apiKey.has_value());
    EXPECT_FALSE(cfg.targetServer.has_value());
    EXPECT_TRUE(cfg.namespacing);
    EXPECT_EQ(cfg.requestTimeout.count(), 10'000);
}

TEST(BridgeConfigTest, ReadsEnvironmentOverrides) {
    EnvGuard url("MCPD_URL", std::string("http://127.0.0.1:9999"));
    EnvGuard key("MCPD_API_KEY", std::string("secret"));
    EnvGuard timeout("MCPD_TIMEOUT_MS", std::string("2500"));

    auto cfg = BridgeConfig::fromEnvironment();
    EXPECT_EQ(cfg.daemonUrl, "http://127.0.0.1:9999");
    ASSERT_TRUE(cfg.apiKey.has_value());
    EXPECT_EQ(*cfg.apiKey, "secret");
    EXPECT_EQ(cfg.requestTimeout.count(), 2500);
}

TEST(BridgeConfigTest, InvalidTimeoutKeepsDefault) {
    EnvGuard timeout("MCPD_TIMEOUT_MS", std::string("abc"));
    auto cfg = BridgeConfig::fromEnvironment();
    EXPECT_EQ(cfg.requestTimeout.count(), 10'000);
}

TEST(GatewayConfigTest, ParsesKeysPortAndCors) {
    EnvGuard host("HOST", std::string("127.0.0.1"));
    EnvGuard port("PORT", std::string("4100"));
    EnvGuard keys("API_KEY", std::string("k1, k2"));
    EnvGuard cors("ENABLE_CORS", std::string("false"));
    EnvGuard rl("RATE_LIMIT_PER_MINUTE", std::string("5"));

    auto cfg = GatewayConfig::fromEnvironment();
    EXPECT_EQ(cfg.bindAddress, "127.0.0.1");
    EXPECT_EQ(cfg.port, 4100);
    EXPECT_EQ(cfg.apiKeys, (std::set<std::string>{"k1", "k2"}));
    EXPECT_FALSE(cfg.enableCors);
    EXPECT_EQ(cfg.rateLimitPerMinute, 5u);
}

TEST(GatewayConfigTest, OutOfRangePortAndEmptyKeysFallBack) {
    EnvGuard port("PORT", std::string("70000"));
    EnvGuard keys("API_KEY", std::string(" , "));
    EnvGuard cors("ENABLE_CORS", std::nullopt);

    auto cfg = GatewayConfig::fromEnvironment();
    EXPECT_EQ(cfg.port, 3000);
    EXPECT_EQ(cfg.apiKeys, (std::set<std::string>{kDefaultGatewayKey}));
    EXPECT_TRUE(cfg.enableCors);
}

TEST(SupervisorConfigTest, ResolvePathsDerivesFromConfigDir) {
    SupervisorConfig cfg;
    cfg.configDir = "/tmp/mcpbridge-cfg";
    cfg.resolvePaths();
    EXPECT_EQ(cfg.logPath, std::filesystem::path("/tmp/mcpbridge-cfg/mcpd.log"));
    EXPECT_EQ(cfg.configPath, std::filesystem::path("/tmp/mcpbridge-cfg/.mcpd.toml"));

    SupervisorConfig explicitPaths;
    explicitPaths.configDir = "/tmp/a";
    explicitPaths.logPath = "/var/log/mcpd.log";
    explicitPaths.resolvePaths();
    EXPECT_EQ(explicitPaths.logPath, std::filesystem::path("/var/log/mcpd.log"));
}

TEST(SupervisorConfigTest, DefaultConfigDirFollowsXdg) {
    EnvGuard xdg("XDG_CONFIG_HOME", std::string("/tmp/xdg-home"));
    EnvGuard dir("MCPBRIDGE_CONFIG_DIR", std::nullopt);
    EnvGuard bin("MCPD_BIN", std::string("/opt/mcpd/bin/mcpd"));

    auto cfg = SupervisorConfig::fromEnvironment();
    EXPECT_EQ(cfg.configDir, std::filesystem::path("/tmp/xdg-home/mcpbridge"));
    ASSERT_TRUE(cfg.binaryOverride.has_value());
    EXPECT_EQ(*cfg.binaryOverride, std::filesystem::path("/opt/mcpd/bin/mcpd"));
}
