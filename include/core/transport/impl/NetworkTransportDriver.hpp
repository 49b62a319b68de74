#pragma once

#include "core/transport/TransportDriver.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <string>
#include <utility>

namespace core::transport {

    /**
     * @brief TransportDriver for LAN/Wi-Fi receipt printers speaking raw ESC/POS over TCP
     * (port 9100 unless the address or configuration names another).
     */
    class NetworkTransportDriver : public TransportDriver {
    public:
        NetworkTransportDriver(std::chrono::milliseconds connectTimeout = std::chrono::milliseconds(10000),
                               std::chrono::milliseconds writeTimeout = std::chrono::milliseconds(5000));

        std::unique_ptr<TransportHandle> open(const types::PrinterConfiguration &config) override;

        void write(TransportHandle &handle, const types::Payload &payload) override;

        void close(TransportHandle &handle) override;

        bool supports(types::TransportKind kind) const override {
            return kind == types::TransportKind::Network;
        }

        std::string getDriverName() const override {
            return "NetworkTransportDriver";
        }

        /**
         * @brief Splits "host", "host:port" or "[v6]:port"; defaultPort applies when none is given.
         */
        static std::pair<std::string, uint16_t> splitHostPort(const std::string &address, uint16_t defaultPort);

    private:
        class NetworkHandle;

        std::chrono::milliseconds connectTimeout_;
        std::chrono::milliseconds writeTimeout_;
    };

} // namespace core::transport
