//
// Created by Andrea on 15/10/2025.
//

#pragma once

#include "DeviceScanner.hpp"
#include "core/types/PrinterTypes.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

namespace core::discovery {

    /**
     * @brief Runs all scanners concurrently for a bounded window and returns a deduplicated
     * snapshot of the devices seen.
     */
    class DiscoveryService {
    public:
        explicit DiscoveryService(std::vector<std::shared_ptr<DeviceScanner>> scanners = {});

        void addScanner(std::shared_ptr<DeviceScanner> scanner);

        /**
         * @brief Scans for at most timeout and returns one entry per address, in order of first
         * sighting, each carrying the most recently observed name.
         *
         * An empty result is valid.
         * @throws types::DiscoveryUnavailableException when no scanner can start.
         */
        std::vector<types::DiscoveredDevice> discover(std::chrono::milliseconds timeout);

        /**
         * @brief Result of the last completed discover() call.
         */
        std::vector<types::DiscoveredDevice> lastResults() const;

    private:
        struct ScanSession;

        mutable std::mutex mutex_;
        std::vector<std::shared_ptr<DeviceScanner>> scanners_;
        std::vector<types::DiscoveredDevice> lastResults_;
    };

} // namespace core::discovery
