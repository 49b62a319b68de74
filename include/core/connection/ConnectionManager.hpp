//
// Created by Andrea on 16/10/2025.
//

#pragma once

#include "core/registry/ConnectionRegistry.hpp"
#include "core/transport/TransportDriver.hpp"
#include "core/types/CancellationToken.hpp"
#include "core/types/PrinterTypes.hpp"
#include "core/types/Result.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <vector>

namespace core::connection {

    struct ConnectOptions {
        std::chrono::milliseconds timeout{0}; // 0 waits for the driver without bound
        std::shared_ptr<types::CancellationToken> cancellation;
    };

    /**
     * @brief Drives connect/disconnect against the transport driver and keeps the registry
     * in step. Never retries on its own.
     */
    class ConnectionManager {
    public:
        ConnectionManager(std::shared_ptr<registry::ConnectionRegistry> registry,
                          std::shared_ptr<transport::TransportDriver> driver);

        /**
         * @brief Connects one printer. Success or AlreadyConnected when the printer is
         * Connected afterwards; ConnectFailed, Timeout or Cancelled otherwise.
         */
        types::Result connect(const types::PrinterConfiguration &config, const ConnectOptions &options = {});

        /**
         * @brief Connects every configuration concurrently and returns once all attempts have
         * resolved. One failure never affects the other attempts.
         */
        std::map<types::PrinterId, types::Result> connectManyDetailed(
                const std::vector<types::PrinterConfiguration> &configs, const ConnectOptions &options = {});

        /**
         * @brief Boolean projection of connectManyDetailed: true means Connected now.
         */
        std::map<types::PrinterId, bool> connectMany(const std::vector<types::PrinterConfiguration> &configs,
                                                     const ConnectOptions &options = {});

        /**
         * @brief Closes and releases the handle. Returns false (not an error) when the printer
         * was not Connected.
         */
        bool disconnect(const types::PrinterId &printerId);

        size_t disconnectAll();

    private:
        std::shared_ptr<registry::ConnectionRegistry> registry_;
        std::shared_ptr<transport::TransportDriver> driver_;

        types::Result awaitExistingAttempt(const types::PrinterId &printerId, const ConnectOptions &options,
                                           std::optional<std::chrono::steady_clock::time_point> deadline);
    };

} // namespace core::connection
