#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace connector::models {

    /**
     * @brief JSON wire message exchanged with the backend over Kafka.
     */
    class BaseModel {
    public:
        virtual ~BaseModel() = default;

        virtual nlohmann::json toJson() const = 0;

        /**
         * @brief Reads what it can from json; missing fields keep their defaults.
         */
        virtual void fromJson(const nlohmann::json &json) = 0;

        virtual bool isValid() const = 0;

        std::string serialize() const {
            return toJson().dump();
        }
    };

} // namespace connector::models
