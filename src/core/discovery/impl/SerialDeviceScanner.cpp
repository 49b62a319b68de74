//
// Created by Andrea on 15/10/2025.
//

#include "core/discovery/impl/SerialDeviceScanner.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace core::discovery {

    SerialDeviceScanner::SerialDeviceScanner(SerialScanConfig config) : config_(std::move(config)) {
    }

    types::TransportKind SerialDeviceScanner::kindForDevice(const std::string &deviceName) {
        auto startsWith = [&deviceName](const std::string &prefix) {
            return deviceName.rfind(prefix, 0) == 0;
        };

        if (startsWith("rfcomm")) return types::TransportKind::Bluetooth;
        if (startsWith("ttyUSB") || startsWith("ttyACM")) return types::TransportKind::Usb;
        return types::TransportKind::Serial;
    }

    void SerialDeviceScanner::startScan() {
        std::error_code ec;
        if (!fs::is_directory(config_.deviceDirectory, ec)) {
            throw types::DiscoveryUnavailableException("device directory " + config_.deviceDirectory +
                                                       " is not accessible");
        }
        if (config_.prefixes.empty()) {
            throw types::DiscoveryUnavailableException("no device prefixes configured");
        }
    }

    void SerialDeviceScanner::scan(std::chrono::steady_clock::time_point deadline, const DeviceSink &sink,
                                   const std::atomic<bool> &stopRequested) {
        std::vector<std::string> names;

        std::error_code ec;
        for (fs::directory_iterator it(config_.deviceDirectory, ec), end; !ec && it != end; it.increment(ec)) {
            if (stopRequested || std::chrono::steady_clock::now() >= deadline) break;

            const std::string name = it->path().filename().string();
            bool matches = std::any_of(config_.prefixes.begin(), config_.prefixes.end(),
                                       [&name](const std::string &prefix) { return name.rfind(prefix, 0) == 0; });
            if (matches) {
                names.push_back(name);
            }
        }
        if (ec) {
            Logger::logWarning("[SerialDeviceScanner] Listing " + config_.deviceDirectory + " stopped: " +
                               ec.message());
        }

        // Stable order: rfcomm0, rfcomm1, ttyUSB0 ...
        std::sort(names.begin(), names.end());

        for (const auto &name: names) {
            if (stopRequested || std::chrono::steady_clock::now() >= deadline) return;

            types::DiscoveredDevice device;
            device.kind = kindForDevice(name);
            device.address = (fs::path(config_.deviceDirectory) / name).string();
            device.name = displayName(name, device.kind);
            device.lastSeen = std::chrono::steady_clock::now();
            sink(device);
        }
    }

    std::string SerialDeviceScanner::displayName(const std::string &deviceName, types::TransportKind kind) const {
        if (auto product = readProductName(deviceName)) {
            return *product + " (" + deviceName + ")";
        }
        switch (kind) {
            case types::TransportKind::Bluetooth:
                return "Bluetooth Printer (" + deviceName + ")";
            case types::TransportKind::Usb:
                return "USB Printer (" + deviceName + ")";
            default:
                return "Serial Printer (" + deviceName + ")";
        }
    }

    std::optional<std::string> SerialDeviceScanner::readProductName(const std::string &deviceName) const {
        // ttyACM: device -> interface, ttyUSB: device -> port -> interface; product sits on the usb device
        static const char *candidates[] = {"device/../product", "device/../../product"};

        for (const char *relative: candidates) {
            std::ifstream file(fs::path(config_.sysfsTtyDirectory) / deviceName / relative);
            std::string product;
            if (file && std::getline(file, product)) {
                product.erase(product.find_last_not_of(" \t\r\n") + 1);
                if (!product.empty()) {
                    return product;
                }
            }
        }
        return std::nullopt;
    }

} // namespace core::discovery
