//
// Created by Andrea on 15/10/2025.
//

#include "core/discovery/DiscoveryService.hpp"
#include "core/events/EventSystem.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <condition_variable>
#include <thread>
#include <unordered_map>

namespace core::discovery {

    // Shared between discover() and the scanner threads, which may outlive the call
    struct DiscoveryService::ScanSession {
        std::mutex mutex;
        std::condition_variable finished;
        std::unordered_map<std::string, size_t> index;
        std::vector<types::DiscoveredDevice> devices;
        size_t running = 0;
        size_t startsPending = 0;
        size_t started = 0;
        std::string failures;
        bool closed = false;
        std::atomic<bool> stopRequested{false};

        void observe(const types::DiscoveredDevice &device) {
            if (device.address.empty()) return;

            std::lock_guard<std::mutex> lock(mutex);
            if (closed) return;

            auto it = index.find(device.address);
            if (it == index.end()) {
                index.emplace(device.address, devices.size());
                devices.push_back(device);
                return;
            }

            auto &known = devices[it->second];
            if (!device.name.empty()) {
                known.name = device.name;
            }
            if (device.signalStrength) {
                known.signalStrength = device.signalStrength;
            }
            if (known.kind == types::TransportKind::Unknown) {
                known.kind = device.kind;
            }
            known.lastSeen = device.lastSeen;
        }

        void startFinished(bool ok, const std::string &failure) {
            std::lock_guard<std::mutex> lock(mutex);
            --startsPending;
            if (ok) {
                ++started;
            } else {
                failures += (failures.empty() ? "" : "; ") + failure;
            }
        }

        void scannerDone() {
            {
                std::lock_guard<std::mutex> lock(mutex);
                --running;
            }
            finished.notify_all();
        }
    };

    DiscoveryService::DiscoveryService(std::vector<std::shared_ptr<DeviceScanner>> scanners)
            : scanners_(std::move(scanners)) {
    }

    void DiscoveryService::addScanner(std::shared_ptr<DeviceScanner> scanner) {
        if (!scanner) {
            throw std::invalid_argument("DeviceScanner cannot be null");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        scanners_.push_back(std::move(scanner));
    }

    std::vector<types::DiscoveredDevice> DiscoveryService::discover(std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        std::vector<std::shared_ptr<DeviceScanner>> scanners;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            scanners = scanners_;
        }
        if (scanners.empty()) {
            throw types::DiscoveryUnavailableException("no scanner configured");
        }

        Logger::logInfo("[DiscoveryService] Starting " + std::to_string(scanners.size()) + " scanner(s) for " +
                        std::to_string(timeout.count()) + "ms");

        auto session = std::make_shared<ScanSession>();
        session->running = scanners.size();
        session->startsPending = scanners.size();

        // startScan runs on the scanner's own thread so a slow start never holds the caller
        // past the deadline
        for (const auto &scanner: scanners) {
            std::thread([session, scanner, deadline]() {
                bool ok = false;
                try {
                    scanner->startScan();
                    ok = true;
                } catch (const types::DiscoveryUnavailableException &e) {
                    Logger::logWarning("[DiscoveryService] " + scanner->getScannerName() + " unavailable: " +
                                       e.what());
                    session->startFinished(false, scanner->getScannerName() + ": " + e.what());
                } catch (const std::exception &e) {
                    Logger::logError("[DiscoveryService] " + scanner->getScannerName() + " failed to start: " +
                                     e.what());
                    session->startFinished(false, scanner->getScannerName() + ": " + e.what());
                }

                if (ok) {
                    session->startFinished(true, "");
                    try {
                        scanner->scan(deadline, [&session](const types::DiscoveredDevice &device) {
                            session->observe(device);
                        }, session->stopRequested);
                    } catch (const std::exception &e) {
                        Logger::logError("[DiscoveryService] " + scanner->getScannerName() + " failed: " + e.what());
                    }
                }
                session->scannerDone();
            }).detach();
        }

        std::vector<types::DiscoveredDevice> results;
        {
            std::unique_lock<std::mutex> lock(session->mutex);
            bool allDone = session->finished.wait_until(lock, deadline, [&session] {
                return session->running == 0;
            });
            session->closed = true;
            session->stopRequested = true;

            if (session->started == 0 && session->startsPending == 0) {
                throw types::DiscoveryUnavailableException(session->failures);
            }
            if (!allDone) {
                Logger::logInfo("[DiscoveryService] Deadline reached with " + std::to_string(session->running) +
                                " scanner(s) still running, " + std::to_string(session->startsPending) +
                                " still starting");
            }
            results = session->devices;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            lastResults_ = results;
        }

        Logger::logInfo("[DiscoveryService] Found " + std::to_string(results.size()) + " device(s)");
        events::EventBus::getInstance().publish(
                events::Event(events::EventType::DISCOVERY_COMPLETED, "DiscoveryService",
                              std::to_string(results.size()) + " device(s)"));
        return results;
    }

    std::vector<types::DiscoveredDevice> DiscoveryService::lastResults() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastResults_;
    }

} // namespace core::discovery
