#pragma once

#include <functional>
#include <string>

namespace connector::events {

    /**
     * @brief Inbound side of one Kafka topic. Messages are handed to the installed handler on
     * the receiver's own thread, one at a time.
     */
    class BaseReceiver {
    public:
        using MessageHandler = std::function<void(const std::string &payload, const std::string &key)>;

        virtual ~BaseReceiver() = default;

        // Must be installed before startReceiving()
        virtual void setMessageHandler(MessageHandler handler) = 0;

        virtual void startReceiving() = 0;

        /**
         * @brief Blocks until the polling thread has left; no handler call runs afterwards.
         */
        virtual void stopReceiving() = 0;

        virtual bool isReceiving() const = 0;

        virtual std::string getTopicName() const = 0;

        virtual std::string getReceiverName() const = 0;
    };

}
