//
// Created by Andrea on 15/10/2025.
//

#pragma once

#include "core/discovery/DeviceScanner.hpp"
#include <optional>
#include <string>
#include <vector>

namespace core::discovery {

    struct SerialScanConfig {
        std::string deviceDirectory = "/dev";
        std::string sysfsTtyDirectory = "/sys/class/tty";
        std::vector<std::string> prefixes = {"rfcomm", "ttyUSB", "ttyACM"};
    };

    /**
     * @brief Finds tty devices that can carry a printer: bound Bluetooth RFCOMM channels and
     * USB-serial adapters. Bluetooth pairing and rfcomm binding happen outside this process.
     */
    class SerialDeviceScanner : public DeviceScanner {
    public:
        explicit SerialDeviceScanner(SerialScanConfig config = {});

        void startScan() override;

        void scan(std::chrono::steady_clock::time_point deadline, const DeviceSink &sink,
                  const std::atomic<bool> &stopRequested) override;

        std::string getScannerName() const override {
            return "SerialDeviceScanner";
        }

        static types::TransportKind kindForDevice(const std::string &deviceName);

    private:
        SerialScanConfig config_;

        std::string displayName(const std::string &deviceName, types::TransportKind kind) const;

        std::optional<std::string> readProductName(const std::string &deviceName) const;
    };

} // namespace core::discovery
