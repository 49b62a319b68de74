//
// Created by Andrea on 14/10/2025.
//

#include "core/events/EventSystem.hpp"
#include "logger/Logger.hpp"

namespace core::events {

    std::string eventTypeToString(EventType type) {
        static const char *const names[] = {
            "PRINTER_CONNECTED", "PRINTER_CONNECT_FAILED", "PRINTER_DISCONNECTED",
            "PRINTER_CONNECTION_LOST", "PRINT_JOB_COMPLETED", "PRINT_JOB_FAILED", "DISCOVERY_COMPLETED"
        };
        auto index = static_cast<size_t>(type);
        return index < sizeof(names) / sizeof(names[0]) ? names[index] : "UNKNOWN";
    }

    EventBus &EventBus::getInstance() {
        static EventBus instance;
        return instance;
    }

    void EventBus::subscribe(const std::shared_ptr<IEventObserver> &observer) {
        std::lock_guard<std::mutex> lock(observersMutex_);
        observers_.push_back(observer);
    }

    void EventBus::publish(const Event &event) {
        std::vector<std::shared_ptr<IEventObserver>> active;
        {
            std::lock_guard<std::mutex> lock(observersMutex_);
            auto it = observers_.begin();
            while (it != observers_.end()) {
                if (auto observer = it->lock()) {
                    active.push_back(std::move(observer));
                    ++it;
                } else {
                    it = observers_.erase(it);
                }
            }
        }

        for (const auto &observer: active) {
            try {
                observer->onEvent(event);
            } catch (const std::exception &e) {
                Logger::logError("[EventBus] Observer failed on " + eventTypeToString(event.type) + ": " + e.what());
            }
        }
    }

    size_t EventBus::observerCount() const {
        std::lock_guard<std::mutex> lock(observersMutex_);
        return observers_.size();
    }

} // namespace core::events
