#include "core/transport/impl/SerialTransportDriver.hpp"
#include "core/transport/impl/AsioOperation.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <boost/system/error_code.hpp>

namespace core::transport {

    class SerialTransportDriver::SerialHandle : public TransportHandle {
    public:
        SerialHandle(const std::string &address, types::TransportKind kind)
                : TransportHandle(address, kind), port(io) {}

        boost::asio::io_context io;
        boost::asio::serial_port port;
    };

    SerialTransportDriver::SerialTransportDriver(std::chrono::milliseconds writeTimeout)
            : writeTimeout_(writeTimeout) {
    }

    bool SerialTransportDriver::supports(types::TransportKind kind) const {
        return kind == types::TransportKind::Bluetooth ||
               kind == types::TransportKind::Usb ||
               kind == types::TransportKind::Serial;
    }

    std::unique_ptr<TransportHandle> SerialTransportDriver::open(const types::PrinterConfiguration &config) {
        if (!supports(config.kind)) {
            throw types::ConnectFailedException(
                    "Serial driver cannot open " + types::transportKindToString(config.kind) + " printers");
        }

        auto handle = std::make_unique<SerialHandle>(config.address, config.kind);

        boost::system::error_code ec;
        handle->port.open(config.address, ec);
        if (ec) {
            Logger::logError("[SerialTransport] Failed to open " + config.address + ": " + ec.message());
            throw types::ConnectFailedException("Cannot open " + config.address + ": " + ec.message());
        }

        configurePort(handle->port, config.baudRate, config.address);

        Logger::logInfo("[SerialTransport] Opened " + config.address + " @ " + std::to_string(config.baudRate) +
                        " baud (" + types::transportKindToString(config.kind) + ")");
        return handle;
    }

    void SerialTransportDriver::configurePort(boost::asio::serial_port &port, uint32_t baudrate,
                                              const std::string &address) {
        boost::system::error_code ec;

        port.set_option(boost::asio::serial_port_base::baud_rate(baudrate), ec);
        if (ec) {
            // RFCOMM ttys ignore line settings; only warn
            Logger::logWarning("[SerialTransport] " + address + ": failed to set baud rate: " + ec.message());
        }

        port.set_option(boost::asio::serial_port_base::character_size(8), ec);
        if (ec) {
            Logger::logWarning("[SerialTransport] " + address + ": failed to set character size: " + ec.message());
        }

        port.set_option(boost::asio::serial_port_base::parity(boost::asio::serial_port_base::parity::none), ec);
        if (ec) {
            Logger::logWarning("[SerialTransport] " + address + ": failed to set parity: " + ec.message());
        }

        port.set_option(boost::asio::serial_port_base::stop_bits(boost::asio::serial_port_base::stop_bits::one), ec);
        if (ec) {
            Logger::logWarning("[SerialTransport] " + address + ": failed to set stop bits: " + ec.message());
        }

        port.set_option(
                boost::asio::serial_port_base::flow_control(boost::asio::serial_port_base::flow_control::none), ec);
        if (ec) {
            Logger::logWarning("[SerialTransport] " + address + ": failed to set flow control: " + ec.message());
        }
    }

    void SerialTransportDriver::write(TransportHandle &handle, const types::Payload &payload) {
        auto &serial = asSerial(handle);
        if (!serial.port.is_open()) {
            throw types::TransmissionFailedException("Serial port " + handle.address() + " is closed");
        }

        std::size_t written = 0;
        auto outcome = asio_support::runWithTimeout(
                serial.io, writeTimeout_,
                [&](auto done) {
                    boost::asio::async_write(serial.port, boost::asio::buffer(payload),
                                             [&written, done](const boost::system::error_code &ec, std::size_t n) {
                                                 written = n;
                                                 done(ec);
                                             });
                },
                [&serial]() {
                    boost::system::error_code ignored;
                    serial.port.cancel(ignored);
                });

        if (outcome.timedOut) {
            Logger::logError("[SerialTransport] Write to " + handle.address() + " timed out after " +
                             std::to_string(written) + "/" + std::to_string(payload.size()) + " bytes");
            throw types::TransmissionFailedException("Write to " + handle.address() + " timed out");
        }
        if (outcome.ec) {
            Logger::logError("[SerialTransport] Write error on " + handle.address() + ": " + outcome.ec.message());
            throw types::TransmissionFailedException("Write error on " + handle.address() + ": " +
                                                     outcome.ec.message());
        }
        if (written != payload.size()) {
            throw types::TransmissionFailedException("Short write on " + handle.address() + ": " +
                                                     std::to_string(written) + "/" +
                                                     std::to_string(payload.size()) + " bytes");
        }
    }

    void SerialTransportDriver::close(TransportHandle &handle) {
        auto *serial = dynamic_cast<SerialHandle *>(&handle);
        if (!serial || !serial->port.is_open()) return;

        boost::system::error_code ec;
        serial->port.close(ec);
        if (ec) {
            Logger::logWarning("[SerialTransport] Error closing " + handle.address() + ": " + ec.message());
            return;
        }
        Logger::logInfo("[SerialTransport] Closed " + handle.address());
    }

    SerialTransportDriver::SerialHandle &SerialTransportDriver::asSerial(TransportHandle &handle) {
        auto *serial = dynamic_cast<SerialHandle *>(&handle);
        if (!serial) {
            throw types::TransmissionFailedException("Handle for " + handle.address() +
                                                     " was not opened by the serial driver");
        }
        return *serial;
    }

} // namespace core::transport
