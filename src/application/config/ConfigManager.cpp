//
// Created by Andrea on 27/08/2025.
//

#include "application/config/ConfigManager.hpp"
#include "logger/Logger.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace core::config {
    namespace {
        struct Setting {
            const char *key;
            const char *env;
            const char *fallback;
        };

        const Setting kSettings[] = {
            {"discovery.timeout.ms", "DISCOVERY_TIMEOUT_MS", "10000"},
            {"discovery.serial.enabled", "DISCOVERY_SERIAL_ENABLED", "true"},
            {"discovery.network.enabled", "DISCOVERY_NETWORK_ENABLED", "false"},
            {"discovery.device.directory", "DISCOVERY_DEVICE_DIRECTORY", "/dev"},
            {"discovery.network.hosts", "DISCOVERY_NETWORK_HOSTS", ""},
            {"discovery.network.subnet", "DISCOVERY_NETWORK_SUBNET", ""},
            {"discovery.probe.timeout.ms", "DISCOVERY_PROBE_TIMEOUT_MS", "1500"},
            {"discovery.max.probes", "DISCOVERY_MAX_PROBES", "64"},
            {"connection.timeout.ms", "CONNECTION_TIMEOUT_MS", "15000"},
            {"connection.on.startup", "CONNECTION_ON_STARTUP", "true"},
            {"connection.printers.file", "CONNECTION_PRINTERS_FILE", "printers.json"},
            {"print.timeout.ms", "PRINT_TIMEOUT_MS", "30000"},
            {"serial.write.timeout.ms", "SERIAL_WRITE_TIMEOUT_MS", "5000"},
            {"serial.default.baud", "SERIAL_DEFAULT_BAUD", "9600"},
            {"network.connect.timeout.ms", "NETWORK_CONNECT_TIMEOUT_MS", "10000"},
            {"network.write.timeout.ms", "NETWORK_WRITE_TIMEOUT_MS", "5000"},
            {"network.default.port", "NETWORK_DEFAULT_PORT", "9100"},
            {"monitor.interval.ms", "MONITOR_INTERVAL_MS", "60000"},
            {"monitor.reconnect.enabled", "MONITOR_RECONNECT_ENABLED", "true"},
            {"monitor.reconnect.base.ms", "MONITOR_RECONNECT_BASE_MS", "2000"},
            {"monitor.reconnect.max.ms", "MONITOR_RECONNECT_MAX_MS", "60000"},
            {"log.level", "LOG_LEVEL", "info"},
        };

        std::vector<std::string> splitList(const std::string &value) {
            std::vector<std::string> items;
            std::stringstream stream(value);
            std::string item;
            while (std::getline(stream, item, ',')) {
                auto first = item.find_first_not_of(" \t");
                if (first == std::string::npos) continue;
                auto last = item.find_last_not_of(" \t");
                items.push_back(item.substr(first, last - first + 1));
            }
            return items;
        }

        std::string scalarText(const nlohmann::json &value) {
            return value.is_string() ? value.get<std::string>() : value.dump();
        }

        // {"print": {"timeout": {"ms": 5}}} becomes "print.timeout.ms" = "5";
        // arrays are joined with commas like the environment form.
        void collect(const nlohmann::json &node, const std::string &path,
                     std::unordered_map<std::string, std::string> &out) {
            if (node.is_object()) {
                for (auto it = node.begin(); it != node.end(); ++it) {
                    collect(it.value(), path.empty() ? it.key() : path + "." + it.key(), out);
                }
                return;
            }
            if (node.is_array()) {
                std::string joined;
                for (const auto &item: node) {
                    if (!joined.empty()) joined += ',';
                    joined += scalarText(item);
                }
                out[path] = joined;
                return;
            }
            out[path] = scalarText(node);
        }
    }

    ConfigManager &ConfigManager::getInstance() {
        static ConfigManager instance;
        return instance;
    }

    ConfigManager::ConfigManager() {
        resetLocked();
    }

    void ConfigManager::resetLocked() {
        values_.clear();
        for (const auto &setting: kSettings) {
            values_[setting.key] = setting.fallback;
        }
    }

    void ConfigManager::loadFromFile(const std::string &configPath) {
        std::lock_guard<std::mutex> lock(mutex_);
        resetLocked();

        std::error_code ec;
        if (!std::filesystem::exists(configPath, ec)) {
            Logger::logWarning("[ConfigManager] " + configPath + " not found, running on defaults");
            return;
        }

        std::unordered_map<std::string, std::string> parsed;
        try {
            std::ifstream input(configPath);
            collect(nlohmann::json::parse(input), "", parsed);
        } catch (const nlohmann::json::exception &e) {
            Logger::logError("[ConfigManager] " + configPath + " is not valid JSON: " + e.what());
            return;
        }

        for (auto &[key, value]: parsed) {
            values_[key] = std::move(value);
        }
        Logger::logInfo("[ConfigManager] Applied " + std::to_string(parsed.size()) + " value(s) from " + configPath);
    }

    void ConfigManager::loadFromEnv() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t applied = 0;
        for (const auto &setting: kSettings) {
            if (const char *value = std::getenv(setting.env)) {
                values_[setting.key] = value;
                ++applied;
            }
        }
        if (applied > 0) {
            Logger::logInfo("[ConfigManager] Applied " + std::to_string(applied) + " value(s) from environment");
        }
    }

    void ConfigManager::set(const std::string &key, const std::string &value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    std::optional<std::string> ConfigManager::lookup(const std::string &key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = values_.find(key);
        if (found == values_.end()) return std::nullopt;
        return found->second;
    }

    DiscoveryConfig ConfigManager::getDiscoveryConfig() const {
        DiscoveryConfig out;
        out.timeoutMs = get<int>("discovery.timeout.ms", out.timeoutMs);
        out.serialEnabled = get<bool>("discovery.serial.enabled", out.serialEnabled);
        out.networkEnabled = get<bool>("discovery.network.enabled", out.networkEnabled);
        out.deviceDirectory = get<std::string>("discovery.device.directory", out.deviceDirectory);
        out.networkHosts = splitList(get<std::string>("discovery.network.hosts", ""));
        out.networkSubnet = get<std::string>("discovery.network.subnet", "");
        out.probeTimeoutMs = get<int>("discovery.probe.timeout.ms", out.probeTimeoutMs);
        out.maxConcurrentProbes = get<int>("discovery.max.probes", out.maxConcurrentProbes);
        return out;
    }

    ConnectionConfig ConfigManager::getConnectionConfig() const {
        ConnectionConfig out;
        out.timeoutMs = get<int>("connection.timeout.ms", out.timeoutMs);
        out.connectOnStartup = get<bool>("connection.on.startup", out.connectOnStartup);
        out.printersFile = get<std::string>("connection.printers.file", out.printersFile);
        return out;
    }

    PrintConfig ConfigManager::getPrintConfig() const {
        PrintConfig out;
        out.timeoutMs = get<int>("print.timeout.ms", out.timeoutMs);
        return out;
    }

    SerialConfig ConfigManager::getSerialConfig() const {
        SerialConfig out;
        out.writeTimeoutMs = get<int>("serial.write.timeout.ms", out.writeTimeoutMs);
        out.defaultBaudRate = static_cast<uint32_t>(get<int>("serial.default.baud",
                                                             static_cast<int>(out.defaultBaudRate)));
        return out;
    }

    NetworkConfig ConfigManager::getNetworkConfig() const {
        NetworkConfig out;
        out.connectTimeoutMs = get<int>("network.connect.timeout.ms", out.connectTimeoutMs);
        out.writeTimeoutMs = get<int>("network.write.timeout.ms", out.writeTimeoutMs);
        out.defaultPort = static_cast<uint16_t>(get<int>("network.default.port", out.defaultPort));
        return out;
    }

    MonitorConfig ConfigManager::getMonitorConfig() const {
        MonitorConfig out;
        out.intervalMs = get<int>("monitor.interval.ms", out.intervalMs);
        out.reconnectEnabled = get<bool>("monitor.reconnect.enabled", out.reconnectEnabled);
        out.reconnectBaseMs = get<int>("monitor.reconnect.base.ms", out.reconnectBaseMs);
        out.reconnectMaxMs = get<int>("monitor.reconnect.max.ms", out.reconnectMaxMs);
        return out;
    }

    std::string ConfigManager::getLogLevel() const {
        return get<std::string>("log.level", "info");
    }

    ConfigManager::ValidationResult ConfigManager::validate() const {
        ValidationResult result;
        auto require = [&result](bool condition, const char *message) {
            if (!condition) result.errors.emplace_back(message);
        };

        require(get<int>("discovery.timeout.ms", -1) >= 100, "discovery.timeout.ms must be >= 100");
        require(get<int>("connection.timeout.ms", -1) >= 0, "connection.timeout.ms must be >= 0");
        require(get<int>("print.timeout.ms", -1) >= 0, "print.timeout.ms must be >= 0");
        require(get<int>("serial.default.baud", -1) > 0, "serial.default.baud must be > 0");

        int port = get<int>("network.default.port", -1);
        require(port >= 1 && port <= 65535, "network.default.port must be in 1-65535");

        require(get<int>("monitor.interval.ms", -1) >= 1000, "monitor.interval.ms must be >= 1000");
        require(get<int>("monitor.reconnect.max.ms", -1) >= get<int>("monitor.reconnect.base.ms", 0),
                "monitor.reconnect.max.ms must be >= monitor.reconnect.base.ms");

        result.isValid = result.errors.empty();
        return result;
    }
} // namespace core::config
