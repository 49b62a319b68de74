//
// Created by Andrea on 18/10/2025.
//

#pragma once

#include "../BaseProcessor.hpp"
#include "../../events/BaseSender.hpp"
#include "../../models/print-job/PrintJobRequest.hpp"
#include "../../models/print-job/PrintJobResponse.hpp"
#include "core/PrinterHub.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace connector::processors::print_job {
    class PrintJobProcessor : public BaseProcessor {
    public:
        PrintJobProcessor(std::shared_ptr<events::BaseSender> sender,
                          std::shared_ptr<core::PrinterHub> hub,
                          const std::string &hubId,
                          std::chrono::milliseconds defaultTimeout);

        /**
         * @brief Parses, filters and executes one raw request message.
         */
        Outcome processMessage(const std::string &message) override;

        void processPrintJobRequest(const models::print_job::PrintJobRequest &request);

        std::string getProcessorName() const override {
            return "PrintJobProcessor";
        }

        bool isReady() const override {
            return sender_ && sender_->isReady() && hub_ != nullptr;
        }

    private:
        std::shared_ptr<events::BaseSender> sender_;
        std::shared_ptr<core::PrinterHub> hub_;
        std::string hubId_;
        std::chrono::milliseconds defaultTimeout_;

        void sendResponse(const models::print_job::PrintJobResponse &response);

        void sendErrorResponse(const std::string &requestId, const std::string &error);
    };
} // namespace connector::processors::print_job
