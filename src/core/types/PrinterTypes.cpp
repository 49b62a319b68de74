//
// Created by Andrea on 14/10/2025.
//

#include "core/types/PrinterTypes.hpp"
#include "core/types/Result.hpp"

#include <cctype>

namespace core::types {

    namespace {
        std::string normalize(const std::string &value) {
            std::string out;
            out.reserve(value.size());
            for (char c: value) {
                if (c == '_' || c == '-' || c == ' ') continue;
                out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            }
            return out;
        }
    }

    std::string transportKindToString(TransportKind kind) {
        switch (kind) {
            case TransportKind::Bluetooth:
                return "bluetooth";
            case TransportKind::Network:
                return "network";
            case TransportKind::Usb:
                return "usb";
            case TransportKind::Serial:
                return "serial";
            default:
                return "unknown";
        }
    }

    TransportKind transportKindFromString(const std::string &value) {
        const std::string key = normalize(value);
        if (key == "bluetooth" || key == "bt") return TransportKind::Bluetooth;
        if (key == "network" || key == "wifi" || key == "ethernet" || key == "lan") return TransportKind::Network;
        if (key == "usb") return TransportKind::Usb;
        if (key == "serial") return TransportKind::Serial;
        return TransportKind::Unknown;
    }

    std::string printerModelToString(PrinterModel model) {
        switch (model) {
            case PrinterModel::EpsonTmGeneric:
                return "epson_tm_generic";
            case PrinterModel::EpsonTmM30:
                return "epson_tm_m30";
            case PrinterModel::EpsonTmM30III:
                return "epson_tm_m30iii";
            case PrinterModel::EpsonTmT20:
                return "epson_tm_t20";
            case PrinterModel::EpsonTmT88:
                return "epson_tm_t88";
            case PrinterModel::StarGeneric:
                return "star_generic";
            default:
                return "generic_escpos";
        }
    }

    PrinterModel printerModelFromString(const std::string &value) {
        const std::string key = normalize(value);
        if (key == "epsontmgeneric") return PrinterModel::EpsonTmGeneric;
        if (key == "epsontmm30") return PrinterModel::EpsonTmM30;
        if (key == "epsontmm30iii") return PrinterModel::EpsonTmM30III;
        if (key == "epsontmt20") return PrinterModel::EpsonTmT20;
        if (key == "epsontmt88") return PrinterModel::EpsonTmT88;
        if (key == "stargeneric") return PrinterModel::StarGeneric;
        return PrinterModel::GenericEscPos;
    }

    std::string resultCodeToString(ResultCode code) {
        switch (code) {
            case ResultCode::Success:
                return "SUCCESS";
            case ResultCode::AlreadyConnected:
                return "ALREADY_CONNECTED";
            case ResultCode::NotConnected:
                return "NOT_CONNECTED";
            case ResultCode::ConnectFailed:
                return "CONNECT_FAILED";
            case ResultCode::TransmissionFailed:
                return "TRANSMISSION_FAILED";
            case ResultCode::Timeout:
                return "TIMEOUT";
            case ResultCode::Cancelled:
                return "CANCELLED";
            case ResultCode::DiscoveryUnavailable:
                return "DISCOVERY_UNAVAILABLE";
        }
        return "UNKNOWN";
    }

}
