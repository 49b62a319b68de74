#pragma once

#include "../BaseModel.hpp"
#include <string>
#include <vector>

namespace connector::models::print_job {

    struct PrinterOutcome {
        std::string printerId;
        bool ok = false;
        std::string code;
        std::string message;
    };

    /**
     * @brief One response per request; results carries one entry per targeted printer.
     */
    class PrintJobResponse : public BaseModel {
    public:
        std::string hubId;
        std::string requestId;
        bool ok = false;
        std::string error; // request-level failure, empty otherwise
        std::vector<PrinterOutcome> results;
        long long processedAt = 0;

        PrintJobResponse() = default;

        explicit PrintJobResponse(const nlohmann::json &json) { fromJson(json); }

        // BaseModel implementation
        nlohmann::json toJson() const override {
            nlohmann::json resultsJson = nlohmann::json::array();
            for (const auto &result: results) {
                resultsJson.push_back({
                                              {"printerId", result.printerId},
                                              {"ok",        result.ok},
                                              {"code",      result.code},
                                              {"message",   result.message}
                                      });
            }

            nlohmann::json json{
                    {"hubId",       hubId},
                    {"requestId",   requestId},
                    {"ok",          ok},
                    {"results",     resultsJson},
                    {"processedAt", processedAt}
            };
            if (!error.empty()) {
                json["error"] = error;
            }
            return json;
        }

        void fromJson(const nlohmann::json &json) override {
            hubId = json.at("hubId").get<std::string>();
            requestId = json.at("requestId").get<std::string>();
            ok = json.at("ok").get<bool>();
            error = json.value("error", "");
            processedAt = json.value("processedAt", 0LL);

            results.clear();
            if (json.contains("results")) {
                for (const auto &entry: json.at("results")) {
                    PrinterOutcome outcome;
                    outcome.printerId = entry.at("printerId").get<std::string>();
                    outcome.ok = entry.at("ok").get<bool>();
                    outcome.code = entry.value("code", "");
                    outcome.message = entry.value("message", "");
                    results.push_back(outcome);
                }
            }
        }

        bool isValid() const override {
            return !hubId.empty() && !requestId.empty();
        }
    };

}
