//
// Created by Andrea on 17/10/2025.
//

#include "core/PrinterHub.hpp"
#include "logger/Logger.hpp"

namespace core {

    PrinterHub::PrinterHub(std::shared_ptr<transport::TransportDriver> driver,
                           std::shared_ptr<discovery::DiscoveryService> discovery)
            : registry_(std::make_shared<registry::ConnectionRegistry>()),
              discovery_(std::move(discovery)) {
        if (!discovery_) {
            throw std::invalid_argument("DiscoveryService cannot be null");
        }
        connectionManager_ = std::make_unique<connection::ConnectionManager>(registry_, driver);
        dispatcher_ = std::make_unique<dispatch::PrintDispatcher>(registry_, driver);
        Logger::logInfo("[PrinterHub] Initialized with driver " + driver->getDriverName());
    }

    PrinterHub::~PrinterHub() {
        shutdown();
    }

    std::vector<types::DiscoveredDevice> PrinterHub::discover(std::chrono::milliseconds timeout) {
        return discovery_->discover(timeout);
    }

    types::Result PrinterHub::connect(const types::PrinterConfiguration &config,
                                      const connection::ConnectOptions &options) {
        return connectionManager_->connect(config, options);
    }

    std::map<types::PrinterId, bool> PrinterHub::connectMany(const std::vector<types::PrinterConfiguration> &configs,
                                                             const connection::ConnectOptions &options) {
        return connectionManager_->connectMany(configs, options);
    }

    std::map<types::PrinterId, types::Result> PrinterHub::connectManyDetailed(
            const std::vector<types::PrinterConfiguration> &configs, const connection::ConnectOptions &options) {
        return connectionManager_->connectManyDetailed(configs, options);
    }

    std::map<types::PrinterId, types::Result> PrinterHub::connectConfigured(const store::ConfigurationStore &store,
                                                                            const connection::ConnectOptions &options) {
        std::vector<types::PrinterConfiguration> active;
        for (const auto &config: store.list()) {
            if (config.active) active.push_back(config);
        }
        Logger::logInfo("[PrinterHub] Connecting " + std::to_string(active.size()) + " active configured printer(s)");
        return connectionManager_->connectManyDetailed(active, options);
    }

    bool PrinterHub::disconnect(const types::PrinterId &printerId) {
        bool closed = connectionManager_->disconnect(printerId);
        dispatcher_->releaseIdleQueues();
        return closed;
    }

    size_t PrinterHub::disconnectAll() {
        return connectionManager_->disconnectAll();
    }

    types::Result PrinterHub::printTo(const types::PrinterId &printerId, const types::Payload &payload,
                                      const dispatch::PrintOptions &options) {
        return dispatcher_->printTo(printerId, payload, options);
    }

    std::future<types::Result> PrinterHub::submit(const types::PrinterId &printerId, const types::Payload &payload,
                                                  const dispatch::PrintOptions &options) {
        return dispatcher_->submit(printerId, payload, options);
    }

    std::map<types::PrinterId, types::Result> PrinterHub::printToAll(const types::Payload &payload,
                                                                     const dispatch::PrintOptions &options) {
        return dispatcher_->printToAll(payload, options);
    }

    std::map<types::PrinterId, types::Result> PrinterHub::print(const types::PrintJob &job,
                                                                const dispatch::PrintOptions &options) {
        return dispatcher_->print(job, options);
    }

    std::vector<registry::ConnectionSnapshot> PrinterHub::connectionStates() const {
        return registry_->snapshotAll();
    }

    registry::ConnectionSnapshot PrinterHub::connectionState(const types::PrinterId &printerId) const {
        return registry_->get(printerId);
    }

    dispatch::PrintDispatcher::Statistics PrinterHub::getDispatchStatistics() const {
        return dispatcher_->getStatistics();
    }

    void PrinterHub::shutdown() {
        if (shutdown_.exchange(true)) return;

        Logger::logInfo("[PrinterHub] Shutting down");
        dispatcher_->shutdown();
        size_t closed = connectionManager_->disconnectAll();
        Logger::logInfo("[PrinterHub] Closed " + std::to_string(closed) + " connection(s)");
    }

} // namespace core
