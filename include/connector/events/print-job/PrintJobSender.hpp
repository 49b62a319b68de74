#pragma once

#include "../../kafka/KafkaProducerBase.hpp"

namespace connector::events::print_job {
    class PrintJobSender : public kafka::KafkaProducerBase {
    public:
        static constexpr const char *TOPIC = "print-job-response";

        explicit PrintJobSender(const kafka::KafkaConfig &config);

    protected:
        std::string getSenderName() const override {
            return "PrintJobSender";
        }
    };
}
