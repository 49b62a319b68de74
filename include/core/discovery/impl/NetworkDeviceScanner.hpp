//
// Created by Andrea on 15/10/2025.
//

#pragma once

#include "core/discovery/DeviceScanner.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace core::discovery {

    struct NetworkScanConfig {
        std::vector<std::string> hosts;   // explicit IP literals
        std::string subnetPrefix;         // e.g. "192.168.1." probes .rangeStart to .rangeEnd
        int rangeStart = 1;
        int rangeEnd = 254;
        uint16_t port = 9100;
        size_t maxConcurrentProbes = 64;
        std::chrono::milliseconds probeTimeout{1500};
    };

    /**
     * @brief Finds raw ESC/POS printers by probing TCP connects on the printer port.
     */
    class NetworkDeviceScanner : public DeviceScanner {
    public:
        explicit NetworkDeviceScanner(NetworkScanConfig config);

        void startScan() override;

        void scan(std::chrono::steady_clock::time_point deadline, const DeviceSink &sink,
                  const std::atomic<bool> &stopRequested) override;

        std::string getScannerName() const override {
            return "NetworkDeviceScanner";
        }

        /**
         * @brief Host list a scan will probe: explicit hosts first, then the subnet range.
         * Entries that are not IP literals are dropped.
         */
        std::vector<std::string> targets() const;

    private:
        NetworkScanConfig config_;
    };

} // namespace core::discovery
