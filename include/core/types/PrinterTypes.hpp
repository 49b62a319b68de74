//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace core::types {

    using PrinterId = std::string;
    using Payload = std::vector<uint8_t>;

    enum class TransportKind {
        Bluetooth,
        Network,
        Usb,
        Serial,
        Unknown
    };

    std::string transportKindToString(TransportKind kind);

    TransportKind transportKindFromString(const std::string &value);

    enum class PrinterModel {
        EpsonTmGeneric,
        EpsonTmM30,
        EpsonTmM30III,
        EpsonTmT20,
        EpsonTmT88,
        StarGeneric,
        GenericEscPos
    };

    std::string printerModelToString(PrinterModel model);

    PrinterModel printerModelFromString(const std::string &value);

    /**
     * @brief One device observed during a discovery scan. Identity is the transport address.
     */
    struct DiscoveredDevice {
        std::string address;
        std::string name;
        TransportKind kind = TransportKind::Unknown;
        std::optional<int> signalStrength; // percent, when the medium reports one
        std::chrono::steady_clock::time_point lastSeen = std::chrono::steady_clock::now();
    };

    /**
     * @brief How to reach one configured printer. Owned by the configuration store, read-only here.
     */
    struct PrinterConfiguration {
        PrinterId id;
        std::string name;
        TransportKind kind = TransportKind::Unknown;
        std::string address;
        PrinterModel model = PrinterModel::GenericEscPos;
        bool active = true;
        uint16_t port = 9100;
        uint32_t baudRate = 9600;

        bool isValid() const {
            return !id.empty() && !address.empty() && kind != TransportKind::Unknown;
        }
    };

    struct PrintJob {
        static constexpr const char *ALL_PRINTERS = "*";

        std::string jobId;
        PrinterId target;
        Payload payload;
        std::chrono::system_clock::time_point submittedAt = std::chrono::system_clock::now();

        bool isBroadcast() const {
            return target == ALL_PRINTERS;
        }
    };

    inline Payload payloadFromString(const std::string &text) {
        return Payload(text.begin(), text.end());
    }

}
