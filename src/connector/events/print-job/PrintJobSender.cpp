//
// Created by Andrea on 18/10/2025.
//

#include "connector/events/print-job/PrintJobSender.hpp"

namespace connector::events::print_job {
    PrintJobSender::PrintJobSender(const kafka::KafkaConfig &config)
        : kafka::KafkaProducerBase(config, TOPIC) {
    }
}
