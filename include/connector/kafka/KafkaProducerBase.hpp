#pragma once

#include "../events/BaseSender.hpp"
#include "KafkaConf.hpp"
#include "KafkaConfig.hpp"
#include <atomic>
#include <string>

namespace connector::kafka {

    /**
     * @brief Publishes to one topic. When the client cannot be created the producer
     * stays not-ready and sendMessage() returns false; it never throws.
     */
    class KafkaProducerBase : public events::BaseSender {
    public:
        KafkaProducerBase(const KafkaConfig &config, std::string topicName);

        ~KafkaProducerBase() override;

        bool sendMessage(const std::string &message, const std::string &key = "") override;

        bool isReady() const override { return handle_ != nullptr; }

        std::string getTopicName() const override { return topic_; }

    private:
        KafkaHandle handle_;
        std::string topic_;
    };

}
