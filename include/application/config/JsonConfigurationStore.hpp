//
// Created by Andrea on 17/10/2025.
//

#pragma once

#include "core/store/ConfigurationStore.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace core::config {

    /**
     * @brief Printer configurations read from a JSON file:
     * {"printers":[{"id","name","type","address","model","active","port","baudRate"}]}
     *
     * Invalid entries are skipped with a warning; a missing file is an empty store.
     */
    class JsonConfigurationStore : public store::ConfigurationStore {
    public:
        explicit JsonConfigurationStore(std::string path, uint16_t defaultPort = 9100,
                                        uint32_t defaultBaudRate = 9600);

        /**
         * @brief (Re)reads the file. Returns false when the file exists but cannot be parsed;
         * the previously loaded list is kept in that case.
         */
        bool load();

        std::vector<types::PrinterConfiguration> list() const override;

        const std::string &path() const { return path_; }

        static std::vector<types::PrinterConfiguration> parse(const std::string &jsonText, uint16_t defaultPort,
                                                              uint32_t defaultBaudRate);

    private:
        std::string path_;
        uint16_t defaultPort_;
        uint32_t defaultBaudRate_;

        mutable std::mutex mutex_;
        std::vector<types::PrinterConfiguration> printers_;
    };

} // namespace core::config
