//
// Created by Andrea on 18/10/2025.
//

#pragma once

#include "../events/print-job/PrintJobReceiver.hpp"
#include "../events/print-job/PrintJobSender.hpp"
#include "../processors/print-job/PrintJobProcessor.hpp"
#include "../kafka/KafkaConfig.hpp"
#include "core/PrinterHub.hpp"
#include <atomic>
#include <chrono>
#include <memory>

namespace connector::controllers {
    /**
     * Remote print pipeline: print-job-request -> PrintJobProcessor -> PrinterHub,
     * with the outcome published on print-job-response.
     *
     * Construction never throws on broker problems; the controller then simply
     * fails to start and the hub stays usable locally.
     */
    class PrintJobController {
    public:
        struct Statistics {
            size_t messagesReceived = 0;
            size_t messagesProcessed = 0;
            size_t messagesIgnored = 0;
            size_t processingErrors = 0;
        };

        PrintJobController(const kafka::KafkaConfig &config,
                           std::shared_ptr<core::PrinterHub> hub,
                           std::chrono::milliseconds defaultPrintTimeout);

        ~PrintJobController();

        void start();

        void stop();

        bool isRunning() const;

        Statistics getStatistics() const;

    private:
        void handle(const std::string &message, const std::string &key);

        std::string hubId_;
        std::shared_ptr<events::print_job::PrintJobSender> sender_;
        std::unique_ptr<processors::print_job::PrintJobProcessor> processor_;
        std::unique_ptr<events::print_job::PrintJobReceiver> receiver_;

        std::atomic<size_t> received_{0};
        std::atomic<size_t> processed_{0};
        std::atomic<size_t> ignored_{0};
        std::atomic<size_t> rejected_{0};
    };
} // namespace connector::controllers
