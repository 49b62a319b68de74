//
// Created by Andrea on 17/10/2025.
//

#pragma once

#include "core/connection/ConnectionManager.hpp"
#include "core/discovery/DiscoveryService.hpp"
#include "core/dispatch/PrintDispatcher.hpp"
#include "core/registry/ConnectionRegistry.hpp"
#include "core/store/ConfigurationStore.hpp"
#include "core/transport/TransportDriver.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <vector>

namespace core {

    /**
     * @brief Caller-facing entry point of the engine: discovery, connection lifecycle and print
     * dispatch over one shared registry. Every method is safe to call concurrently.
     */
    class PrinterHub {
    public:
        PrinterHub(std::shared_ptr<transport::TransportDriver> driver,
                   std::shared_ptr<discovery::DiscoveryService> discovery);

        ~PrinterHub();

        PrinterHub(const PrinterHub &) = delete;

        PrinterHub &operator=(const PrinterHub &) = delete;

        std::vector<types::DiscoveredDevice> discover(std::chrono::milliseconds timeout);

        types::Result connect(const types::PrinterConfiguration &config,
                              const connection::ConnectOptions &options = {});

        std::map<types::PrinterId, bool> connectMany(const std::vector<types::PrinterConfiguration> &configs,
                                                     const connection::ConnectOptions &options = {});

        std::map<types::PrinterId, types::Result> connectManyDetailed(
                const std::vector<types::PrinterConfiguration> &configs,
                const connection::ConnectOptions &options = {});

        /**
         * @brief Connects every active configuration of store.
         */
        std::map<types::PrinterId, types::Result> connectConfigured(const store::ConfigurationStore &store,
                                                                    const connection::ConnectOptions &options = {});

        bool disconnect(const types::PrinterId &printerId);

        size_t disconnectAll();

        types::Result printTo(const types::PrinterId &printerId, const types::Payload &payload,
                              const dispatch::PrintOptions &options = {});

        std::future<types::Result> submit(const types::PrinterId &printerId, const types::Payload &payload,
                                          const dispatch::PrintOptions &options = {});

        std::map<types::PrinterId, types::Result> printToAll(const types::Payload &payload,
                                                             const dispatch::PrintOptions &options = {});

        std::map<types::PrinterId, types::Result> print(const types::PrintJob &job,
                                                        const dispatch::PrintOptions &options = {});

        std::vector<registry::ConnectionSnapshot> connectionStates() const;

        registry::ConnectionSnapshot connectionState(const types::PrinterId &printerId) const;

        dispatch::PrintDispatcher::Statistics getDispatchStatistics() const;

        /**
         * @brief Stops the print queues and closes every connection.
         */
        void shutdown();

    private:
        std::shared_ptr<registry::ConnectionRegistry> registry_;
        std::shared_ptr<discovery::DiscoveryService> discovery_;
        std::unique_ptr<connection::ConnectionManager> connectionManager_;
        std::unique_ptr<dispatch::PrintDispatcher> dispatcher_;
        std::atomic<bool> shutdown_{false};
    };

} // namespace core
