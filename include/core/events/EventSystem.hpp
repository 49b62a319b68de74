//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <chrono>
#include <vector>
#include <memory>
#include <mutex>
#include <string>

namespace core::events {

    enum class EventType {
        PRINTER_CONNECTED,
        PRINTER_CONNECT_FAILED,
        PRINTER_DISCONNECTED,
        PRINTER_CONNECTION_LOST,
        PRINT_JOB_COMPLETED,
        PRINT_JOB_FAILED,
        DISCOVERY_COMPLETED
    };

    std::string eventTypeToString(EventType type);

    struct Event {
        EventType type;
        std::string source;   // printer id, or the component name for engine-wide events
        std::string message;
        std::chrono::steady_clock::time_point timestamp;

        Event(EventType t, std::string src, std::string msg = "")
                : type(t), source(std::move(src)), message(std::move(msg)),
                  timestamp(std::chrono::steady_clock::now()) {}
    };

    class IEventObserver {
    public:
        virtual ~IEventObserver() = default;

        virtual void onEvent(const Event &event) = 0;
    };

    /**
     * @brief Process-wide publish/subscribe hub for connection and job events.
     *
     * Observers are held weakly and notified outside the subscription lock, so an observer may
     * query the engine from onEvent.
     */
    class EventBus {
    public:
        static EventBus &getInstance();

        void subscribe(const std::shared_ptr<IEventObserver> &observer);

        void publish(const Event &event);

        size_t observerCount() const;

    private:
        EventBus() = default;

        mutable std::mutex observersMutex_;
        std::vector<std::weak_ptr<IEventObserver>> observers_;
    };

} // namespace core::events
