#pragma once

#include "core/transport/TransportDriver.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <string>

namespace core::transport {

    /**
     * @brief TransportDriver over tty devices using Boost.Asio serial ports.
     *
     * Covers paired Bluetooth printers exposed as RFCOMM ttys (/dev/rfcomm*), USB-serial
     * adapters (/dev/ttyUSB*, /dev/ttyACM*) and plain serial ports. Line settings are 8N1
     * without flow control at the configured baud rate.
     */
    class SerialTransportDriver : public TransportDriver {
    public:
        explicit SerialTransportDriver(std::chrono::milliseconds writeTimeout = std::chrono::milliseconds(5000));

        std::unique_ptr<TransportHandle> open(const types::PrinterConfiguration &config) override;

        void write(TransportHandle &handle, const types::Payload &payload) override;

        void close(TransportHandle &handle) override;

        bool supports(types::TransportKind kind) const override;

        std::string getDriverName() const override {
            return "SerialTransportDriver";
        }

    private:
        class SerialHandle;

        std::chrono::milliseconds writeTimeout_;

        static SerialHandle &asSerial(TransportHandle &handle);

        static void configurePort(boost::asio::serial_port &port, uint32_t baudrate, const std::string &address);
    };

} // namespace core::transport
