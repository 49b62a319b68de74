#pragma once

#include "../BaseModel.hpp"
#include "core/types/PrinterTypes.hpp"
#include <cctype>
#include <stdexcept>
#include <string>

namespace connector::models::print_job {

    /**
     * @brief Remote print request. printerId "*" targets every connected printer; payload is
     * plain text or, with encoding "hex", raw ESC/POS bytes as hex digits.
     */
    class PrintJobRequest : public BaseModel {
    public:
        std::string requestId;
        std::string hubId;
        std::string printerId;
        std::string payload;
        std::string encoding = "text";
        long long timeoutMs = 0; // 0 uses the hub default

        PrintJobRequest() = default;

        explicit PrintJobRequest(const nlohmann::json &json) { fromJson(json); }

        // BaseModel implementation
        nlohmann::json toJson() const override {
            return nlohmann::json{
                    {"requestId", requestId},
                    {"hubId",     hubId},
                    {"printerId", printerId},
                    {"payload",   payload},
                    {"encoding",  encoding},
                    {"timeoutMs", timeoutMs}
            };
        }

        void fromJson(const nlohmann::json &json) override {
            auto safeGetString = [&json](const std::string &key, const std::string &fallback) -> std::string {
                if (json.contains(key) && json[key].is_string()) {
                    return json[key].get<std::string>();
                }
                return fallback;
            };

            requestId = safeGetString("requestId", "");
            hubId = safeGetString("hubId", "");
            printerId = safeGetString("printerId", "");
            payload = safeGetString("payload", "");
            encoding = safeGetString("encoding", "text");
            timeoutMs = json.contains("timeoutMs") && json["timeoutMs"].is_number_integer()
                        ? json["timeoutMs"].get<long long>() : 0;
        }

        bool isValid() const override {
            return validationError().empty();
        }

        /**
         * @brief Empty when valid, otherwise the first problem found.
         */
        std::string validationError() const {
            if (requestId.empty()) return "requestId is required";
            if (hubId.empty()) return "hubId is required";
            if (printerId.empty()) return "printerId is required";
            if (payload.empty()) return "payload is empty";
            if (timeoutMs < 0) return "timeoutMs must be >= 0";
            if (encoding == "text") return "";
            if (encoding != "hex") return "unsupported encoding: " + encoding;
            if (payload.size() % 2 != 0) return "hex payload has odd length";
            for (char c: payload) {
                if (!std::isxdigit(static_cast<unsigned char>(c))) return "hex payload has non-hex characters";
            }
            return "";
        }

        bool isBroadcast() const {
            return printerId == core::types::PrintJob::ALL_PRINTERS;
        }

        /**
         * @throws std::invalid_argument when the payload does not match its encoding.
         */
        core::types::Payload decodePayload() const {
            if (encoding == "text") {
                return core::types::payloadFromString(payload);
            }
            std::string error = validationError();
            if (!error.empty()) {
                throw std::invalid_argument(error);
            }

            core::types::Payload bytes;
            bytes.reserve(payload.size() / 2);
            for (size_t i = 0; i < payload.size(); i += 2) {
                bytes.push_back(static_cast<uint8_t>(std::stoi(payload.substr(i, 2), nullptr, 16)));
            }
            return bytes;
        }
    };

}
