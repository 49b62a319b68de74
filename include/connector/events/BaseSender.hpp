#pragma once

#include <string>

namespace connector::events {

    /**
     * @brief Outbound side of one Kafka topic.
     */
    class BaseSender {
    public:
        virtual ~BaseSender() = default;

        /**
         * @brief Queues one serialized message for delivery.
         * @param key partition key, the hub id for print-job responses
         * @return false when the producer is not ready or the local queue rejected the message
         */
        virtual bool sendMessage(const std::string &message, const std::string &key = "") = 0;

        virtual bool isReady() const = 0;

        virtual std::string getTopicName() const = 0;

        virtual std::string getSenderName() const = 0;
    };

}
