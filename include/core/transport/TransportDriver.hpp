//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include "core/types/PrinterTypes.hpp"
#include <memory>
#include <string>

namespace core::transport {

    /**
     * @brief Open byte channel to one physical device. Created by a TransportDriver and only
     * ever handed back to the driver that created it.
     */
    class TransportHandle {
    public:
        TransportHandle(std::string address, types::TransportKind kind)
                : address_(std::move(address)), kind_(kind) {}

        virtual ~TransportHandle() = default;

        TransportHandle(const TransportHandle &) = delete;

        TransportHandle &operator=(const TransportHandle &) = delete;

        const std::string &address() const { return address_; }

        types::TransportKind kind() const { return kind_; }

    private:
        std::string address_;
        types::TransportKind kind_;
    };

    /**
     * @brief Raw byte I/O to printers over one medium (Bluetooth RFCOMM, TCP, serial).
     */
    class TransportDriver {
    public:
        virtual ~TransportDriver() = default;

        /**
         * @brief Opens a channel to the device described by config.
         * @throws types::ConnectFailedException when the device cannot be reached.
         */
        virtual std::unique_ptr<TransportHandle> open(const types::PrinterConfiguration &config) = 0;

        /**
         * @brief Writes the whole payload.
         * @throws types::TransmissionFailedException on any I/O error or short write.
         */
        virtual void write(TransportHandle &handle, const types::Payload &payload) = 0;

        /**
         * @brief Closes the channel. Never throws for an already broken channel.
         */
        virtual void close(TransportHandle &handle) = 0;

        virtual bool supports(types::TransportKind kind) const = 0;

        virtual std::string getDriverName() const = 0;
    };

} // namespace core::transport
