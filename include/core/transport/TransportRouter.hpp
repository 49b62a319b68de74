#pragma once

#include "TransportDriver.hpp"
#include <map>
#include <memory>
#include <mutex>

namespace core::transport {

    /**
     * @brief Routes each operation to the driver registered for the transport kind:
     * open by configuration kind, write and close by handle kind.
     */
    class TransportRouter : public TransportDriver {
    public:
        TransportRouter() = default;

        /**
         * @brief Registers driver for every kind it supports that has no driver yet.
         */
        void addDriver(const std::shared_ptr<TransportDriver> &driver);

        std::unique_ptr<TransportHandle> open(const types::PrinterConfiguration &config) override;

        void write(TransportHandle &handle, const types::Payload &payload) override;

        void close(TransportHandle &handle) override;

        bool supports(types::TransportKind kind) const override;

        std::string getDriverName() const override {
            return "TransportRouter";
        }

    private:
        mutable std::mutex driversMutex_;
        std::map<types::TransportKind, std::shared_ptr<TransportDriver>> drivers_;

        std::shared_ptr<TransportDriver> driverFor(types::TransportKind kind) const;
    };

} // namespace core::transport
