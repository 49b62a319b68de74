#pragma once

#include "Result.hpp"
#include <stdexcept>
#include <string>

namespace core::types {

    class PrinterException : public std::runtime_error {
    public:
        PrinterException(ResultCode code, const std::string &msg)
                : std::runtime_error(msg), code_(code) {}

        ResultCode code() const { return code_; }

        Result toResult() const {
            return {code_, what(), "", ""};
        }

    private:
        ResultCode code_;
    };

    class DiscoveryUnavailableException : public PrinterException {
    public:
        explicit DiscoveryUnavailableException(const std::string &reason)
                : PrinterException(ResultCode::DiscoveryUnavailable, "Discovery unavailable: " + reason) {}
    };

    class ConnectFailedException : public PrinterException {
    public:
        explicit ConnectFailedException(const std::string &reason)
                : PrinterException(ResultCode::ConnectFailed, reason) {}
    };

    class NotConnectedException : public PrinterException {
    public:
        explicit NotConnectedException(const std::string &printerId)
                : PrinterException(ResultCode::NotConnected, "Printer not connected: " + printerId) {}
    };

    class TransmissionFailedException : public PrinterException {
    public:
        explicit TransmissionFailedException(const std::string &reason)
                : PrinterException(ResultCode::TransmissionFailed, reason) {}
    };

    class TimeoutException : public PrinterException {
    public:
        TimeoutException() : PrinterException(ResultCode::Timeout, "Timeout waiting for printer") {}
    };

}
