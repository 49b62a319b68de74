//
// Created by Andrea on 27/08/2025.
//

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace core::config {
    struct DiscoveryConfig {
        int timeoutMs = 10000;
        bool serialEnabled = true;
        bool networkEnabled = false;
        std::string deviceDirectory = "/dev";
        std::vector<std::string> networkHosts;
        std::string networkSubnet;   // "192.168.1" probes .1 - .254
        int probeTimeoutMs = 1500;
        int maxConcurrentProbes = 64;
    };

    struct ConnectionConfig {
        int timeoutMs = 15000;
        bool connectOnStartup = true;
        std::string printersFile = "printers.json";
    };

    struct PrintConfig {
        int timeoutMs = 30000;
    };

    struct SerialConfig {
        int writeTimeoutMs = 5000;
        uint32_t defaultBaudRate = 9600;
    };

    struct NetworkConfig {
        int connectTimeoutMs = 10000;
        int writeTimeoutMs = 5000;
        uint16_t defaultPort = 9100;
    };

    struct MonitorConfig {
        int intervalMs = 60000;
        bool reconnectEnabled = true;
        int reconnectBaseMs = 2000;
        int reconnectMaxMs = 60000;
    };

    /**
     * Process-wide settings, addressed by dotted keys ("print.timeout.ms").
     * Layering: built-in defaults, then config.json, then environment
     * variables (PRINT_TIMEOUT_MS).
     */
    class ConfigManager {
    public:
        struct ValidationResult {
            bool isValid = true;
            std::vector<std::string> errors;
        };

        static ConfigManager &getInstance();

        /// Resets every key to its default before applying the file.
        void loadFromFile(const std::string &configPath = "config.json");

        void loadFromEnv();

        DiscoveryConfig getDiscoveryConfig() const;

        ConnectionConfig getConnectionConfig() const;

        PrintConfig getPrintConfig() const;

        SerialConfig getSerialConfig() const;

        NetworkConfig getNetworkConfig() const;

        MonitorConfig getMonitorConfig() const;

        std::string getLogLevel() const;

        template<typename T>
        T get(const std::string &key, const T &defaultValue) const;

        void set(const std::string &key, const std::string &value);

        ValidationResult validate() const;

    private:
        ConfigManager();

        std::optional<std::string> lookup(const std::string &key) const;

        void resetLocked();

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::string> values_;
    };

    template<>
    inline std::string ConfigManager::get<std::string>(const std::string &key, const std::string &defaultValue) const {
        return lookup(key).value_or(defaultValue);
    }

    template<>
    inline int ConfigManager::get<int>(const std::string &key, const int &defaultValue) const {
        auto raw = lookup(key);
        if (!raw) return defaultValue;
        try {
            size_t used = 0;
            int parsed = std::stoi(*raw, &used);
            return used == raw->size() ? parsed : defaultValue;
        } catch (const std::exception &) {
            return defaultValue;
        }
    }

    template<>
    inline bool ConfigManager::get<bool>(const std::string &key, const bool &defaultValue) const {
        auto raw = lookup(key);
        if (!raw) return defaultValue;
        if (*raw == "true" || *raw == "1" || *raw == "yes") return true;
        if (*raw == "false" || *raw == "0" || *raw == "no") return false;
        return defaultValue;
    }
} // namespace core::config
