#include "application/monitor/SystemMonitor.hpp"
#include "logger/Logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

SystemMonitor::SystemMonitor(std::shared_ptr<core::PrinterHub> hub,
                             std::shared_ptr<core::store::ConfigurationStore> store,
                             std::unique_ptr<connector::controllers::PrintJobController> &printJobController,
                             const core::config::MonitorConfig &config,
                             std::chrono::milliseconds connectTimeout)
        : hub_(std::move(hub)),
          store_(std::move(store)),
          printJobController_(printJobController),
          config_(config),
          connectTimeout_(connectTimeout),
          eventCounter_(std::make_shared<EventCounter>()) {
    if (!hub_) {
        throw std::invalid_argument("PrinterHub cannot be null");
    }
    core::events::EventBus::getInstance().subscribe(eventCounter_);
}

void SystemMonitor::EventCounter::onEvent(const core::events::Event &event) {
    std::lock_guard<std::mutex> lock(mutex_);
    counts_[event.type]++;
}

std::map<core::events::EventType, size_t> SystemMonitor::EventCounter::counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_;
}

SystemMonitor::~SystemMonitor() {
    stop();
}

void SystemMonitor::start() {
    if (running_) {
        Logger::logWarning("[SystemMonitor] Already running");
        return;
    }

    running_ = true;
    monitorThread_ = std::thread([this]() {
        try {
            monitorLoop();
        } catch (const std::exception &e) {
            Logger::logError("[SystemMonitor] Monitor thread crashed: " + std::string(e.what()));
        }
    });

    Logger::logInfo("[SystemMonitor] Started (reconnect " +
                    std::string(config_.reconnectEnabled ? "enabled" : "disabled") + ")");
}

void SystemMonitor::stop() {
    if (!running_) return;

    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        running_ = false;
    }
    wakeCondition_.notify_all();
    if (monitorThread_.joinable()) {
        monitorThread_.join();
    }

    Logger::logInfo("[SystemMonitor] Stopped");
}

bool SystemMonitor::isRunning() const {
    return running_;
}

std::chrono::milliseconds SystemMonitor::backoffDelay(size_t failures, std::chrono::milliseconds base,
                                                      std::chrono::milliseconds cap) {
    if (failures == 0) return std::chrono::milliseconds(0);

    auto delay = base;
    for (size_t i = 1; i < failures && delay < cap; ++i) {
        delay *= 2;
    }
    return std::min(delay, cap);
}

size_t SystemMonitor::runReconnectPass(std::chrono::steady_clock::time_point now) {
    if (!store_) return 0;

    std::lock_guard<std::mutex> lock(reconnectMutex_);
    size_t reconnected = 0;

    for (const auto &config: store_->list()) {
        if (!config.active) continue;

        auto snapshot = hub_->connectionState(config.id);
        if (snapshot.state != core::registry::ConnectionState::Idle) {
            reconnectStates_.erase(config.id);
            continue;
        }

        auto &state = reconnectStates_[config.id];
        if (now < state.nextAttempt) continue;

        core::connection::ConnectOptions options;
        options.timeout = connectTimeout_;
        auto result = hub_->connect(config, options);

        if (result.isSuccess()) {
            Logger::logInfo("[SystemMonitor] Reconnected " + config.id + " after " +
                            std::to_string(state.failures) + " failed attempt(s)");
            reconnectStates_.erase(config.id);
            reconnected++;
        } else {
            state.failures++;
            auto delay = backoffDelay(state.failures, std::chrono::milliseconds(config_.reconnectBaseMs),
                                      std::chrono::milliseconds(config_.reconnectMaxMs));
            state.nextAttempt = now + delay;
            Logger::logWarning("[SystemMonitor] Reconnect " + config.id + " failed (" + result.message +
                               "), next attempt in " + std::to_string(delay.count()) + "ms");
        }
    }
    return reconnected;
}

void SystemMonitor::monitorLoop() {
    Logger::logInfo("[SystemMonitor] Monitor loop started");
    auto lastReport = std::chrono::steady_clock::now();

    while (running_) {
        try {
            auto now = std::chrono::steady_clock::now();
            if (now - lastReport >= std::chrono::milliseconds(config_.intervalMs)) {
                reportStats();
                lastReport = now;
            }
            if (config_.reconnectEnabled) {
                runReconnectPass(now);
            }
        } catch (const std::exception &e) {
            Logger::logError("[SystemMonitor] Loop error: " + std::string(e.what()));
        }

        std::unique_lock<std::mutex> lock(wakeMutex_);
        wakeCondition_.wait_for(lock, std::chrono::seconds(1), [this]() { return !running_.load(); });
    }
}

void SystemMonitor::reportStats() const {
    Logger::logInfo("[SystemMonitor] ===== System Status Report =====");

    size_t connected = 0;
    auto states = hub_->connectionStates();
    Logger::logInfo("[SystemMonitor] Printers:");
    for (const auto &snapshot: states) {
        if (snapshot.isConnected()) connected++;
        std::string line = "  " + snapshot.printerId + ": " + core::registry::connectionStateToString(snapshot.state);
        if (snapshot.isConnected()) {
            line += " (" + snapshot.address + ")";
        } else if (snapshot.lastError) {
            line += " - last error: " + core::types::resultCodeToString(snapshot.lastError->code) + " " +
                    snapshot.lastError->message;
        }
        Logger::logInfo(line);
    }
    Logger::logInfo("  Connected: " + std::to_string(connected) + "/" + std::to_string(states.size()));

    auto stats = hub_->getDispatchStatistics();
    Logger::logInfo("[SystemMonitor] Print Dispatcher:");
    Logger::logInfo("  Active Queues: " + std::to_string(stats.activeQueues));
    Logger::logInfo("  Total Enqueued: " + std::to_string(stats.totalEnqueued));
    Logger::logInfo("  Total Transmitted: " + std::to_string(stats.totalTransmitted));
    Logger::logInfo("  Failed: " + std::to_string(stats.totalFailed));
    Logger::logInfo("  Expired: " + std::to_string(stats.totalExpired));
    Logger::logInfo("  Rejected (offline): " + std::to_string(stats.totalRejected));
    Logger::logInfo("  Current Queue Size: " + std::to_string(stats.currentQueueSize));

    auto events = eventCounter_->counts();
    if (!events.empty()) {
        Logger::logInfo("[SystemMonitor] Events since start:");
        for (const auto &[type, count]: events) {
            Logger::logInfo("  " + core::events::eventTypeToString(type) + ": " + std::to_string(count));
        }
    }

    if (printJobController_) {
        auto controllerStats = printJobController_->getStatistics();
        Logger::logInfo("[SystemMonitor] Remote Print Status:");
        Logger::logInfo("  Running: " + std::string(printJobController_->isRunning() ? "true" : "false"));
        Logger::logInfo("  Messages RX: " + std::to_string(controllerStats.messagesReceived));
        Logger::logInfo("  Processed: " + std::to_string(controllerStats.messagesProcessed));
        Logger::logInfo("  Ignored: " + std::to_string(controllerStats.messagesIgnored));
        Logger::logInfo("  Errors: " + std::to_string(controllerStats.processingErrors));
    } else {
        Logger::logInfo("[SystemMonitor] Remote Print Controller: NOT AVAILABLE");
    }

    Logger::logInfo("[SystemMonitor] =======================================");
}
