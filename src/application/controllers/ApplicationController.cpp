//
// Created by Andrea on 23/08/2025.
//

#include "application/controllers/ApplicationController.hpp"
#include "application/config/ConfigManager.hpp"
#include "core/discovery/impl/NetworkDeviceScanner.hpp"
#include "core/discovery/impl/SerialDeviceScanner.hpp"
#include "core/transport/impl/NetworkTransportDriver.hpp"
#include "core/transport/impl/SerialTransportDriver.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <algorithm>
#include <chrono>

using core::config::ConfigManager;

ApplicationController::ApplicationController(std::string configPath)
        : configPath_(std::move(configPath)) {
}

ApplicationController::~ApplicationController() {
    shutdown();
}

bool ApplicationController::initialize() {
    Logger::logInfo("[ApplicationController] POS printer hub starting (config: " + configPath_ + ")");

    if (!loadConfiguration() || !buildEngine() || !openPrinterStore()) {
        return false;
    }

    connectStoredPrinters();
    startRemoteConnector();
    startMonitor();

    started_ = true;
    reportStatus();
    return true;
}

void ApplicationController::shutdown() {
    if (!started_.exchange(false)) {
        return;
    }
    Logger::logInfo("[ApplicationController] Stopping");

    if (monitor_) {
        monitor_->stop();
        monitor_.reset();
    }
    if (printJobController_) {
        printJobController_->stop();
        printJobController_.reset();
    }
    if (hub_) {
        hub_->shutdown();
    }

    Logger::logInfo("[ApplicationController] Stopped");
}

bool ApplicationController::loadConfiguration() {
    auto &config = ConfigManager::getInstance();
    config.loadFromFile(configPath_);
    config.loadFromEnv();

    Logger::setMinimumLevel(Logger::levelFromString(config.getLogLevel()));

    auto validation = config.validate();
    for (const auto &problem: validation.errors) {
        Logger::logError("[ApplicationController] Invalid configuration: " + problem);
    }
    if (!validation.isValid) {
        return false;
    }

    kafkaConfig_.resolveFromEnvironment();
    kafkaConfig_.printConfig();
    return true;
}

bool ApplicationController::buildEngine() {
    const auto &config = ConfigManager::getInstance();
    auto serial = config.getSerialConfig();
    auto network = config.getNetworkConfig();
    auto discovery = config.getDiscoveryConfig();

    try {
        router_ = std::make_shared<core::transport::TransportRouter>();
        router_->addDriver(std::make_shared<core::transport::SerialTransportDriver>(
                std::chrono::milliseconds(serial.writeTimeoutMs)));
        router_->addDriver(std::make_shared<core::transport::NetworkTransportDriver>(
                std::chrono::milliseconds(network.connectTimeoutMs),
                std::chrono::milliseconds(network.writeTimeoutMs)));

        discovery_ = std::make_shared<core::discovery::DiscoveryService>();
        if (discovery.serialEnabled) {
            core::discovery::SerialScanConfig scan;
            scan.deviceDirectory = discovery.deviceDirectory;
            discovery_->addScanner(std::make_shared<core::discovery::SerialDeviceScanner>(scan));
        }
        if (discovery.networkEnabled) {
            core::discovery::NetworkScanConfig scan;
            scan.hosts = discovery.networkHosts;
            scan.subnetPrefix = discovery.networkSubnet;
            if (!scan.subnetPrefix.empty() && scan.subnetPrefix.back() != '.') {
                scan.subnetPrefix.push_back('.');
            }
            scan.port = network.defaultPort;
            scan.probeTimeout = std::chrono::milliseconds(discovery.probeTimeoutMs);
            scan.maxConcurrentProbes = static_cast<size_t>(std::max(1, discovery.maxConcurrentProbes));
            discovery_->addScanner(std::make_shared<core::discovery::NetworkDeviceScanner>(scan));
        }

        hub_ = std::make_shared<core::PrinterHub>(router_, discovery_);
    } catch (const std::exception &e) {
        Logger::logError("[ApplicationController] Could not build the printer engine: " + std::string(e.what()));
        return false;
    }

    reportDiscoveredDevices();
    return true;
}

void ApplicationController::reportDiscoveredDevices() {
    auto timeout = std::chrono::milliseconds(ConfigManager::getInstance().getDiscoveryConfig().timeoutMs);
    try {
        auto devices = hub_->discover(timeout);
        Logger::logInfo("[ApplicationController] " + std::to_string(devices.size()) + " device(s) visible");
        for (const auto &device: devices) {
            Logger::logInfo("[ApplicationController]   " + device.address + " (" + device.name + ", " +
                            core::types::transportKindToString(device.kind) + ")");
        }
    } catch (const core::types::DiscoveryUnavailableException &e) {
        Logger::logWarning("[ApplicationController] Discovery skipped: " + std::string(e.what()));
    }
}

bool ApplicationController::openPrinterStore() {
    const auto &config = ConfigManager::getInstance();
    store_ = std::make_shared<core::config::JsonConfigurationStore>(
            config.getConnectionConfig().printersFile,
            config.getNetworkConfig().defaultPort,
            config.getSerialConfig().defaultBaudRate);
    if (!store_->load()) {
        Logger::logError("[ApplicationController] Printer store could not be loaded");
        return false;
    }
    return true;
}

void ApplicationController::connectStoredPrinters() {
    auto connection = ConfigManager::getInstance().getConnectionConfig();
    if (!connection.connectOnStartup) {
        Logger::logInfo("[ApplicationController] connection.on.startup is off, not connecting");
        return;
    }

    core::connection::ConnectOptions options;
    options.timeout = std::chrono::milliseconds(connection.timeoutMs);
    for (const auto &[printerId, result]: hub_->connectConfigured(*store_, options)) {
        if (result.isSuccess()) {
            Logger::logInfo("[ApplicationController] " + printerId + " connected");
        } else {
            Logger::logWarning("[ApplicationController] " + printerId + " not connected: " +
                               core::types::resultCodeToString(result.code) + " (" + result.message + ")");
        }
    }
}

void ApplicationController::startRemoteConnector() {
    if (!kafkaConfig_.isEnabled()) {
        Logger::logInfo("[ApplicationController] Remote printing disabled");
        return;
    }

    auto printTimeout = std::chrono::milliseconds(ConfigManager::getInstance().getPrintConfig().timeoutMs);
    try {
        printJobController_ = std::make_unique<connector::controllers::PrintJobController>(
                kafkaConfig_, hub_, printTimeout);
        printJobController_->start();
    } catch (const std::exception &e) {
        Logger::logError("[ApplicationController] Remote connector failed: " + std::string(e.what()));
    }

    if (!printJobController_ || !printJobController_->isRunning()) {
        Logger::logWarning("[ApplicationController] Remote printing offline, local printing unaffected");
    }
}

void ApplicationController::startMonitor() {
    const auto &config = ConfigManager::getInstance();
    monitor_ = std::make_unique<SystemMonitor>(
            hub_, store_, printJobController_, config.getMonitorConfig(),
            std::chrono::milliseconds(config.getConnectionConfig().timeoutMs));
    monitor_->start();
}

void ApplicationController::reportStatus() const {
    auto states = hub_->connectionStates();
    auto connected = std::count_if(states.begin(), states.end(),
                                   [](const auto &snapshot) { return snapshot.isConnected(); });

    Logger::logInfo("[ApplicationController] Ready: " + std::to_string(connected) + "/" +
                    std::to_string(store_->list().size()) + " configured printer(s) connected, remote printing " +
                    (printJobController_ && printJobController_->isRunning() ? "online" : "offline"));
}
