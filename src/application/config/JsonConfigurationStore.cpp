//
// Created by Andrea on 17/10/2025.
//

#include "application/config/JsonConfigurationStore.hpp"
#include "logger/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>

namespace core::config {

    JsonConfigurationStore::JsonConfigurationStore(std::string path, uint16_t defaultPort, uint32_t defaultBaudRate)
            : path_(std::move(path)), defaultPort_(defaultPort), defaultBaudRate_(defaultBaudRate) {
    }

    bool JsonConfigurationStore::load() {
        if (!std::filesystem::exists(path_)) {
            Logger::logWarning("[JsonConfigurationStore] " + path_ + " not found, no printers configured");
            std::lock_guard<std::mutex> lock(mutex_);
            printers_.clear();
            return true;
        }

        std::ifstream file(path_);
        std::stringstream buffer;
        buffer << file.rdbuf();

        try {
            auto printers = parse(buffer.str(), defaultPort_, defaultBaudRate_);
            Logger::logInfo("[JsonConfigurationStore] Loaded " + std::to_string(printers.size()) +
                            " printer(s) from " + path_);
            std::lock_guard<std::mutex> lock(mutex_);
            printers_ = std::move(printers);
            return true;
        } catch (const nlohmann::json::exception &e) {
            Logger::logError("[JsonConfigurationStore] Cannot parse " + path_ + ": " + e.what());
            return false;
        }
    }

    std::vector<types::PrinterConfiguration> JsonConfigurationStore::list() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return printers_;
    }

    std::vector<types::PrinterConfiguration> JsonConfigurationStore::parse(const std::string &jsonText,
                                                                           uint16_t defaultPort,
                                                                           uint32_t defaultBaudRate) {
        auto json = nlohmann::json::parse(jsonText);

        std::vector<types::PrinterConfiguration> printers;
        if (!json.contains("printers") || !json["printers"].is_array()) {
            Logger::logWarning("[JsonConfigurationStore] No \"printers\" array found");
            return printers;
        }

        std::set<types::PrinterId> seen;
        size_t index = 0;
        for (const auto &entry: json["printers"]) {
            index++;
            if (!entry.is_object()) {
                Logger::logWarning("[JsonConfigurationStore] Entry #" + std::to_string(index) + " is not an object");
                continue;
            }

            try {
                types::PrinterConfiguration config;
                config.id = entry.value("id", "");
                config.name = entry.value("name", config.id);
                config.kind = types::transportKindFromString(entry.value("type", ""));
                config.address = entry.value("address", "");
                config.model = types::printerModelFromString(entry.value("model", ""));
                config.active = entry.value("active", true);
                config.port = entry.value("port", defaultPort);
                config.baudRate = entry.value("baudRate", defaultBaudRate);

                if (!config.isValid()) {
                    Logger::logWarning("[JsonConfigurationStore] Entry #" + std::to_string(index) +
                                       " skipped: id, address and a known type are required");
                    continue;
                }
                if (!seen.insert(config.id).second) {
                    Logger::logWarning("[JsonConfigurationStore] Duplicate printer id " + config.id + " skipped");
                    continue;
                }
                printers.push_back(std::move(config));
            } catch (const nlohmann::json::type_error &e) {
                Logger::logWarning("[JsonConfigurationStore] Entry #" + std::to_string(index) + " skipped: " +
                                   e.what());
            }
        }
        return printers;
    }

} // namespace core::config
