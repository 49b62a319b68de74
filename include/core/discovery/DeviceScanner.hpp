//
// Created by Andrea on 15/10/2025.
//

#pragma once

#include "core/types/PrinterTypes.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <string>

namespace core::discovery {

    /**
     * @brief One discovery medium (tty enumeration, TCP probing, ...).
     */
    class DeviceScanner {
    public:
        using DeviceSink = std::function<void(const types::DiscoveredDevice &device)>;

        virtual ~DeviceScanner() = default;

        /**
         * @brief Prepares the medium for a scan.
         * @throws types::DiscoveryUnavailableException when the medium cannot scan (adapter
         *         disabled, device directory missing, nothing to probe).
         */
        virtual void startScan() = 0;

        /**
         * @brief Reports every device observed until deadline or until stopRequested is set.
         *
         * The same address may be reported more than once. Implementations should return
         * promptly at the deadline; the caller does not wait for one that overruns it.
         */
        virtual void scan(std::chrono::steady_clock::time_point deadline, const DeviceSink &sink,
                          const std::atomic<bool> &stopRequested) = 0;

        virtual std::string getScannerName() const = 0;
    };

} // namespace core::discovery
