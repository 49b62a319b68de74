#include "application/config/ConfigManager.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>

using core::config::ConfigManager;
namespace fs = std::filesystem;

class ConfigManagerTest : public ::testing::Test {
protected:
    fs::path file;

    void SetUp() override {
        std::random_device rd;
        file = fs::temp_directory_path() / ("pos_config_" + std::to_string(rd()) + ".json");
        ConfigManager::getInstance().loadFromFile(file.string()); // missing file resets to defaults
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(file, ec);
        ConfigManager::getInstance().loadFromFile(file.string());
    }

    void write(const std::string &content) {
        std::ofstream(file) << content;
    }
};

TEST_F(ConfigManagerTest, DefaultsAreValid) {
    auto &config = ConfigManager::getInstance();

    EXPECT_TRUE(config.validate().isValid);
    EXPECT_EQ(config.getDiscoveryConfig().timeoutMs, 10000);
    EXPECT_TRUE(config.getDiscoveryConfig().serialEnabled);
    EXPECT_FALSE(config.getDiscoveryConfig().networkEnabled);
    EXPECT_EQ(config.getConnectionConfig().printersFile, "printers.json");
    EXPECT_EQ(config.getPrintConfig().timeoutMs, 30000);
    EXPECT_EQ(config.getNetworkConfig().defaultPort, 9100);
    EXPECT_EQ(config.getSerialConfig().defaultBaudRate, 9600u);
    EXPECT_TRUE(config.getMonitorConfig().reconnectEnabled);
}

TEST_F(ConfigManagerTest, FileOverridesNestedKeysAndLists) {
    write(R"({
        "discovery": {
            "timeout": {"ms": 4000},
            "network": {"enabled": true, "hosts": ["192.168.1.20", "192.168.1.21"], "subnet": "10.1.2"}
        },
        "print": {"timeout": {"ms": 1500}},
        "connection": {"printers": {"file": "/etc/pos/printers.json"}}
    })");

    auto &config = ConfigManager::getInstance();
    config.loadFromFile(file.string());

    auto discovery = config.getDiscoveryConfig();
    EXPECT_EQ(discovery.timeoutMs, 4000);
    EXPECT_TRUE(discovery.networkEnabled);
    EXPECT_EQ(discovery.networkHosts, (std::vector<std::string>{"192.168.1.20", "192.168.1.21"}));
    EXPECT_EQ(discovery.networkSubnet, "10.1.2");
    EXPECT_EQ(config.getPrintConfig().timeoutMs, 1500);
    EXPECT_EQ(config.getConnectionConfig().printersFile, "/etc/pos/printers.json");
    // Untouched keys keep their defaults
    EXPECT_EQ(config.getConnectionConfig().timeoutMs, 15000);
}

TEST_F(ConfigManagerTest, MalformedFileFallsBackToDefaults) {
    write("{ not json");

    auto &config = ConfigManager::getInstance();
    config.set("print.timeout.ms", "5");
    config.loadFromFile(file.string());

    EXPECT_EQ(config.getPrintConfig().timeoutMs, 30000);
    EXPECT_TRUE(config.validate().isValid);
}

TEST_F(ConfigManagerTest, EnvironmentOverridesFile) {
    write(R"({"print": {"timeout": {"ms": 1500}}})");
    auto &config = ConfigManager::getInstance();
    config.loadFromFile(file.string());

    setenv("PRINT_TIMEOUT_MS", "2500", 1);
    setenv("DISCOVERY_NETWORK_HOSTS", "10.0.0.1, 10.0.0.2", 1);
    config.loadFromEnv();
    unsetenv("PRINT_TIMEOUT_MS");
    unsetenv("DISCOVERY_NETWORK_HOSTS");

    EXPECT_EQ(config.getPrintConfig().timeoutMs, 2500);
    EXPECT_EQ(config.getDiscoveryConfig().networkHosts, (std::vector<std::string>{"10.0.0.1", "10.0.0.2"}));
}

TEST_F(ConfigManagerTest, ValidationReportsEveryProblem) {
    auto &config = ConfigManager::getInstance();
    config.set("discovery.timeout.ms", "50");
    config.set("network.default.port", "70000");
    config.set("monitor.reconnect.base.ms", "5000");
    config.set("monitor.reconnect.max.ms", "1000");

    auto result = config.validate();
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.errors.size(), 3u);
}

TEST_F(ConfigManagerTest, TypedGettersFallBackOnGarbage) {
    auto &config = ConfigManager::getInstance();
    config.set("print.timeout.ms", "soon");
    config.set("monitor.reconnect.enabled", "1");

    EXPECT_EQ(config.get<int>("print.timeout.ms", 42), 42);
    EXPECT_TRUE(config.get<bool>("monitor.reconnect.enabled", false));
    EXPECT_EQ(config.get<std::string>("no.such.key", "fallback"), "fallback");
}

TEST_F(ConfigManagerTest, LogLevelComesFromFileOrEnvironment) {
    auto &config = ConfigManager::getInstance();
    EXPECT_EQ(config.getLogLevel(), "info");

    write(R"({"log": {"level": "warning"}})");
    config.loadFromFile(file.string());
    EXPECT_EQ(config.getLogLevel(), "warning");

    setenv("LOG_LEVEL", "error", 1);
    config.loadFromEnv();
    unsetenv("LOG_LEVEL");
    EXPECT_EQ(config.getLogLevel(), "error");
}
