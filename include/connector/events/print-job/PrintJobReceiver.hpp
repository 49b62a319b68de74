#pragma once

#include "../../kafka/KafkaConsumerBase.hpp"

namespace connector::events::print_job {
    class PrintJobReceiver : public kafka::KafkaConsumerBase {
    public:
        static constexpr const char *TOPIC = "print-job-request";

        explicit PrintJobReceiver(const kafka::KafkaConfig &config);

    protected:
        std::string getReceiverName() const override {
            return "PrintJobReceiver";
        }
    };
}
