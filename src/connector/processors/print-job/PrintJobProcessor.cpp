//
// Created by Andrea on 18/10/2025.
//

#include "connector/processors/print-job/PrintJobProcessor.hpp"
#include "logger/Logger.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace connector::processors::print_job {
    namespace {
        long long epochMillis() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now().time_since_epoch()).count();
        }
    }

    PrintJobProcessor::PrintJobProcessor(std::shared_ptr<events::BaseSender> sender,
                                         std::shared_ptr<core::PrinterHub> hub,
                                         const std::string &hubId,
                                         std::chrono::milliseconds defaultTimeout)
        : sender_(std::move(sender)), hub_(std::move(hub)), hubId_(hubId), defaultTimeout_(defaultTimeout) {
        if (!sender_) {
            throw std::invalid_argument("BaseSender cannot be null");
        }
        if (!hub_) {
            throw std::invalid_argument("PrinterHub cannot be null");
        }
    }

    PrintJobProcessor::Outcome PrintJobProcessor::processMessage(const std::string &message) {
        nlohmann::json json;
        try {
            json = nlohmann::json::parse(message);
        } catch (const nlohmann::json::parse_error &e) {
            // No request id to answer to
            Logger::logError("[PrintJobProcessor] JSON parse error: " + std::string(e.what()));
            return Outcome::Rejected;
        }
        if (!json.is_object()) {
            Logger::logError("[PrintJobProcessor] Request is not a JSON object");
            return Outcome::Rejected;
        }

        models::print_job::PrintJobRequest request(json);

        if (!request.hubId.empty() && request.hubId != hubId_) {
            Logger::logInfo("[PrintJobProcessor] Request " + request.requestId + " for hub " + request.hubId +
                            ", ignoring");
            return Outcome::Ignored;
        }

        std::string error = request.validationError();
        if (!error.empty()) {
            Logger::logError("[PrintJobProcessor] Invalid request '" + request.requestId + "': " + error);
            if (!request.requestId.empty()) {
                sendErrorResponse(request.requestId, "INVALID_REQUEST: " + error);
            }
            return Outcome::Rejected;
        }

        processPrintJobRequest(request);
        return Outcome::Processed;
    }

    void PrintJobProcessor::processPrintJobRequest(const models::print_job::PrintJobRequest &request) {
        auto start = std::chrono::steady_clock::now();
        Logger::logInfo("[PrintJobProcessor] Processing request " + request.requestId + " for printer " +
                        request.printerId);

        core::types::PrintJob job;
        job.jobId = request.requestId;
        job.target = request.printerId;
        try {
            job.payload = request.decodePayload();
        } catch (const std::invalid_argument &e) {
            sendErrorResponse(request.requestId, "INVALID_PAYLOAD: " + std::string(e.what()));
            return;
        }

        core::dispatch::PrintOptions options;
        options.timeout = request.timeoutMs > 0 ? std::chrono::milliseconds(request.timeoutMs) : defaultTimeout_;

        auto results = hub_->print(job, options);

        models::print_job::PrintJobResponse response;
        response.hubId = hubId_;
        response.requestId = request.requestId;
        response.processedAt = epochMillis();
        response.ok = !results.empty();
        for (const auto &[printerId, result]: results) {
            models::print_job::PrinterOutcome outcome;
            outcome.printerId = printerId;
            outcome.ok = result.isSuccess();
            outcome.code = core::types::resultCodeToString(result.code);
            outcome.message = result.message;
            response.ok = response.ok && outcome.ok;
            response.results.push_back(outcome);
        }
        if (results.empty()) {
            response.error = "NO_CONNECTED_PRINTERS";
        }

        sendResponse(response);

        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        Logger::logInfo("[PrintJobProcessor] Request " + request.requestId + " completed in " +
                        std::to_string(ms.count()) + "ms (" + (response.ok ? "ok" : "with failures") + ")");
    }

    void PrintJobProcessor::sendResponse(const models::print_job::PrintJobResponse &response) {
        if (!sender_->sendMessage(response.serialize(), hubId_)) {
            Logger::logError("[PrintJobProcessor] Failed to send response for " + response.requestId);
        }
    }

    void PrintJobProcessor::sendErrorResponse(const std::string &requestId, const std::string &error) {
        models::print_job::PrintJobResponse response;
        response.hubId = hubId_;
        response.requestId = requestId;
        response.ok = false;
        response.error = error;
        response.processedAt = epochMillis();
        sendResponse(response);
    }
} // namespace connector::processors::print_job
