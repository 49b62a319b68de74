//
// Created by Andrea on 18/10/2025.
//

#include "connector/controllers/PrintJobController.hpp"
#include "logger/Logger.hpp"
#include <stdexcept>

namespace connector::controllers {
    using processors::BaseProcessor;

    PrintJobController::PrintJobController(const kafka::KafkaConfig &config,
                                           std::shared_ptr<core::PrinterHub> hub,
                                           std::chrono::milliseconds defaultPrintTimeout)
        : hubId_(config.hubId) {
        if (!hub) {
            throw std::invalid_argument("PrintJobController needs a PrinterHub");
        }

        sender_ = std::make_shared<events::print_job::PrintJobSender>(config);
        processor_ = std::make_unique<processors::print_job::PrintJobProcessor>(
            sender_, std::move(hub), hubId_, defaultPrintTimeout);
        receiver_ = std::make_unique<events::print_job::PrintJobReceiver>(config);
        receiver_->setMessageHandler([this](const std::string &message, const std::string &key) {
            handle(message, key);
        });
    }

    PrintJobController::~PrintJobController() {
        stop();
    }

    void PrintJobController::start() {
        if (receiver_->isReceiving()) {
            return;
        }
        if (!sender_->isReady()) {
            Logger::logWarning("[PrintJobController] Responses cannot be published, not starting");
            return;
        }
        try {
            receiver_->startReceiving();
            Logger::logInfo("[PrintJobController] Accepting remote jobs for hub " + hubId_);
        } catch (const std::exception &e) {
            Logger::logError("[PrintJobController] Start failed: " + std::string(e.what()));
        }
    }

    void PrintJobController::stop() {
        if (receiver_->isReceiving()) {
            receiver_->stopReceiving();
            Logger::logInfo("[PrintJobController] Stopped");
        }
    }

    bool PrintJobController::isRunning() const {
        return receiver_->isReceiving();
    }

    PrintJobController::Statistics PrintJobController::getStatistics() const {
        Statistics stats;
        stats.messagesReceived = received_;
        stats.messagesProcessed = processed_;
        stats.messagesIgnored = ignored_;
        stats.processingErrors = rejected_;
        return stats;
    }

    void PrintJobController::handle(const std::string &message, const std::string &key) {
        ++received_;
        Logger::logInfo("[PrintJobController] Request (key " + (key.empty() ? std::string("-") : key) + ", " +
                        std::to_string(message.size()) + " bytes)");

        switch (processor_->processMessage(message)) {
            case BaseProcessor::Outcome::Processed:
                ++processed_;
                break;
            case BaseProcessor::Outcome::Ignored:
                ++ignored_;
                break;
            case BaseProcessor::Outcome::Rejected:
                ++rejected_;
                break;
        }
    }
} // namespace connector::controllers
