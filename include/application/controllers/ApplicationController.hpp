//
// Created by Andrea on 23/08/2025.
//

#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "application/config/JsonConfigurationStore.hpp"
#include "application/monitor/SystemMonitor.hpp"
#include "connector/controllers/PrintJobController.hpp"
#include "connector/kafka/KafkaConfig.hpp"
#include "core/PrinterHub.hpp"
#include "core/discovery/DiscoveryService.hpp"
#include "core/transport/TransportRouter.hpp"

/**
 * Owns every long-lived piece of the hub process and wires them together.
 *
 * start() order: configuration, engine (drivers, scanners, hub), printer
 * store and startup connections, remote print connector, monitor.
 * stop() tears down in the opposite order. The remote connector is optional;
 * when Kafka is disabled or unreachable the hub keeps printing locally.
 */
class ApplicationController {
public:
    explicit ApplicationController(std::string configPath = "config.json");

    ~ApplicationController();

    /// False when the configuration is invalid or the engine cannot be built.
    bool initialize();

    void shutdown();

    std::shared_ptr<core::PrinterHub> hub() const { return hub_; }

private:
    bool loadConfiguration();

    bool buildEngine();

    bool openPrinterStore();

    void connectStoredPrinters();

    void startRemoteConnector();

    void startMonitor();

    void reportDiscoveredDevices();

    void reportStatus() const;

    std::string configPath_;

    std::shared_ptr<core::transport::TransportRouter> router_;
    std::shared_ptr<core::discovery::DiscoveryService> discovery_;
    std::shared_ptr<core::PrinterHub> hub_;
    std::shared_ptr<core::config::JsonConfigurationStore> store_;

    connector::kafka::KafkaConfig kafkaConfig_;
    std::unique_ptr<connector::controllers::PrintJobController> printJobController_;

    std::unique_ptr<SystemMonitor> monitor_;

    std::atomic<bool> started_{false};
};
