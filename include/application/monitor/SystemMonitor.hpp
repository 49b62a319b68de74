//
// Created by Andrea on 23/08/2025.
//

#pragma once

#include "application/config/ConfigManager.hpp"
#include "connector/controllers/PrintJobController.hpp"
#include "core/PrinterHub.hpp"
#include "core/events/EventSystem.hpp"
#include "core/store/ConfigurationStore.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

/**
 * @brief Periodic status report plus the reconnect policy for configured printers.
 *
 * The engine never retries a failed connection; this monitor re-attempts active printers found
 * Idle, backing off exponentially per printer between failed attempts.
 */
class SystemMonitor {
public:
    SystemMonitor(std::shared_ptr<core::PrinterHub> hub,
                  std::shared_ptr<core::store::ConfigurationStore> store,
                  std::unique_ptr<connector::controllers::PrintJobController> &printJobController,
                  const core::config::MonitorConfig &config,
                  std::chrono::milliseconds connectTimeout);

    ~SystemMonitor();

    void start();

    void stop();

    bool isRunning() const;

    /**
     * @brief One reconnect sweep over the store. Returns the number of printers reconnected.
     */
    size_t runReconnectPass(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    static std::chrono::milliseconds backoffDelay(size_t failures, std::chrono::milliseconds base,
                                                  std::chrono::milliseconds cap);

    /**
     * @brief Counts engine events by type for the status report.
     */
    class EventCounter : public core::events::IEventObserver {
    public:
        void onEvent(const core::events::Event &event) override;

        std::map<core::events::EventType, size_t> counts() const;

    private:
        mutable std::mutex mutex_;
        std::map<core::events::EventType, size_t> counts_;
    };

private:
    struct ReconnectState {
        size_t failures = 0;
        std::chrono::steady_clock::time_point nextAttempt{};
    };

    std::atomic<bool> running_{false};
    std::thread monitorThread_;
    std::mutex wakeMutex_;
    std::condition_variable wakeCondition_;

    std::shared_ptr<core::PrinterHub> hub_;
    std::shared_ptr<core::store::ConfigurationStore> store_;
    std::unique_ptr<connector::controllers::PrintJobController> &printJobController_;
    core::config::MonitorConfig config_;
    std::chrono::milliseconds connectTimeout_;

    std::shared_ptr<EventCounter> eventCounter_;

    std::mutex reconnectMutex_;
    std::map<core::types::PrinterId, ReconnectState> reconnectStates_;

    void monitorLoop();

    void reportStats() const;
};
