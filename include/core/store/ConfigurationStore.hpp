//
// Created by Andrea on 17/10/2025.
//

#pragma once

#include "core/types/PrinterTypes.hpp"
#include <optional>
#include <vector>

namespace core::store {

    /**
     * @brief Read-only source of printer configurations. The engine never writes to it.
     */
    class ConfigurationStore {
    public:
        virtual ~ConfigurationStore() = default;

        virtual std::vector<types::PrinterConfiguration> list() const = 0;

        virtual std::optional<types::PrinterConfiguration> find(const types::PrinterId &printerId) const {
            for (const auto &config: list()) {
                if (config.id == printerId) return config;
            }
            return std::nullopt;
        }
    };

} // namespace core::store
