#pragma once

#include <string>

namespace core::types {

    enum class ResultCode {
        Success,
        AlreadyConnected,
        NotConnected,
        ConnectFailed,
        TransmissionFailed,
        Timeout,
        Cancelled,
        DiscoveryUnavailable
    };

    std::string resultCodeToString(ResultCode code);

    /**
     * @brief Outcome of one connect or print operation against one printer.
     *
     * Batch operations return one Result per printer so a failing member never hides the
     * outcome of the others.
     */
    struct Result {
        ResultCode code = ResultCode::Success;
        std::string message;
        std::string printerId;
        std::string jobId;

        // AlreadyConnected is an informational short-circuit, not a failure
        inline bool isSuccess() const {
            return code == ResultCode::Success || code == ResultCode::AlreadyConnected;
        }

        inline bool isAlreadyConnected() const {
            return code == ResultCode::AlreadyConnected;
        }

        inline bool isNotConnected() const {
            return code == ResultCode::NotConnected;
        }

        inline bool isConnectFailed() const {
            return code == ResultCode::ConnectFailed;
        }

        inline bool isTransmissionFailed() const {
            return code == ResultCode::TransmissionFailed;
        }

        inline bool isTimeout() const {
            return code == ResultCode::Timeout;
        }

        inline bool isCancelled() const {
            return code == ResultCode::Cancelled;
        }

        Result &forPrinter(const std::string &id) {
            printerId = id;
            return *this;
        }

        Result &forJob(const std::string &id) {
            jobId = id;
            return *this;
        }

        static inline Result success(const std::string &msg = "Success") {
            return {ResultCode::Success, msg, "", ""};
        }

        static inline Result alreadyConnected() {
            return {ResultCode::AlreadyConnected, "Already connected", "", ""};
        }

        static inline Result notConnected(const std::string &msg = "Printer is not connected") {
            return {ResultCode::NotConnected, msg, "", ""};
        }

        static inline Result connectFailed(const std::string &reason) {
            return {ResultCode::ConnectFailed, reason, "", ""};
        }

        static inline Result transmissionFailed(const std::string &reason) {
            return {ResultCode::TransmissionFailed, reason, "", ""};
        }

        static inline Result timeout(const std::string &msg = "Operation timed out") {
            return {ResultCode::Timeout, msg, "", ""};
        }

        static inline Result cancelled(const std::string &msg = "Operation cancelled") {
            return {ResultCode::Cancelled, msg, "", ""};
        }

        static inline Result discoveryUnavailable(const std::string &reason) {
            return {ResultCode::DiscoveryUnavailable, reason, "", ""};
        }
    };

}
