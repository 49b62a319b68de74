#pragma once

#include "../events/BaseReceiver.hpp"
#include "KafkaConf.hpp"
#include "KafkaConfig.hpp"
#include <atomic>
#include <string>
#include <thread>

namespace connector::kafka {

    /**
     * @brief Subscribes to one topic and hands every record to the message handler
     * on a dedicated polling thread.
     *
     * The rdkafka handle only exists between startReceiving() and stopReceiving(),
     * so constructing a receiver never touches the network.
     */
    class KafkaConsumerBase : public events::BaseReceiver {
    public:
        KafkaConsumerBase(const KafkaConfig &config, std::string topicName);

        ~KafkaConsumerBase() override;

        void setMessageHandler(MessageHandler handler) override { handler_ = std::move(handler); }

        void startReceiving() override;

        void stopReceiving() override;

        bool isReceiving() const override { return receiving_; }

        std::string getTopicName() const override { return topic_; }

    private:
        void subscribe();

        void pollLoop();

        void deliver(const rd_kafka_message_t &record);

        KafkaConfig config_;
        std::string topic_;
        std::string tag_;
        KafkaHandle handle_;
        MessageHandler handler_;
        std::thread poller_;
        std::atomic<bool> receiving_{false};
    };

}
