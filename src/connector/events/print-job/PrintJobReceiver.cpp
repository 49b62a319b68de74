//
// Created by Andrea on 18/10/2025.
//

#include "connector/events/print-job/PrintJobReceiver.hpp"

namespace connector::events::print_job {
    PrintJobReceiver::PrintJobReceiver(const kafka::KafkaConfig &config)
        : kafka::KafkaConsumerBase(config, TOPIC) {
    }
}
