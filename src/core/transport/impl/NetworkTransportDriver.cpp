#include "core/transport/impl/NetworkTransportDriver.hpp"
#include "core/transport/impl/AsioOperation.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

namespace core::transport {

    using boost::asio::ip::tcp;

    class NetworkTransportDriver::NetworkHandle : public TransportHandle {
    public:
        explicit NetworkHandle(const std::string &address)
                : TransportHandle(address, types::TransportKind::Network), socket(io) {}

        boost::asio::io_context io;
        tcp::socket socket;
    };

    NetworkTransportDriver::NetworkTransportDriver(std::chrono::milliseconds connectTimeout,
                                                   std::chrono::milliseconds writeTimeout)
            : connectTimeout_(connectTimeout), writeTimeout_(writeTimeout) {
    }

    std::pair<std::string, uint16_t> NetworkTransportDriver::splitHostPort(const std::string &address,
                                                                           uint16_t defaultPort) {
        std::string host = address;
        std::string port;

        if (!address.empty() && address.front() == '[') {
            auto close = address.find(']');
            if (close != std::string::npos) {
                host = address.substr(1, close - 1);
                if (close + 1 < address.size() && address[close + 1] == ':') {
                    port = address.substr(close + 2);
                }
            }
        } else {
            auto colon = address.find(':');
            // More than one colon is a bare IPv6 literal without port
            if (colon != std::string::npos && address.find(':', colon + 1) == std::string::npos) {
                host = address.substr(0, colon);
                port = address.substr(colon + 1);
            }
        }

        if (port.empty()) {
            return {host, defaultPort};
        }
        try {
            int value = std::stoi(port);
            if (value <= 0 || value > 65535) {
                throw std::out_of_range("port");
            }
            return {host, static_cast<uint16_t>(value)};
        } catch (const std::exception &) {
            throw types::ConnectFailedException("Invalid port in address: " + address);
        }
    }

    std::unique_ptr<TransportHandle> NetworkTransportDriver::open(const types::PrinterConfiguration &config) {
        if (!supports(config.kind)) {
            throw types::ConnectFailedException(
                    "Network driver cannot open " + types::transportKindToString(config.kind) + " printers");
        }

        auto [host, port] = splitHostPort(config.address, config.port);
        auto handle = std::make_unique<NetworkHandle>(config.address);

        tcp::resolver resolver(handle->io);
        boost::system::error_code ec;
        auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (ec) {
            Logger::logError("[NetworkTransport] Cannot resolve " + host + ": " + ec.message());
            throw types::ConnectFailedException("Cannot resolve " + host + ": " + ec.message());
        }

        auto &socket = handle->socket;
        auto outcome = asio_support::runWithTimeout(
                handle->io, connectTimeout_,
                [&](auto done) {
                    boost::asio::async_connect(socket, endpoints,
                                               [done](const boost::system::error_code &error, const tcp::endpoint &) {
                                                   done(error);
                                               });
                },
                [&socket]() {
                    boost::system::error_code ignored;
                    socket.close(ignored);
                });

        if (outcome.timedOut) {
            Logger::logError("[NetworkTransport] Connect to " + host + ":" + std::to_string(port) + " timed out");
            throw types::ConnectFailedException("Connect to " + host + ":" + std::to_string(port) + " timed out");
        }
        if (outcome.ec) {
            Logger::logError("[NetworkTransport] Connect to " + host + ":" + std::to_string(port) + " failed: " +
                             outcome.ec.message());
            throw types::ConnectFailedException("Connect to " + host + ":" + std::to_string(port) + " failed: " +
                                                outcome.ec.message());
        }

        socket.set_option(tcp::no_delay(true), ec);
        socket.set_option(boost::asio::socket_base::keep_alive(true), ec);

        Logger::logInfo("[NetworkTransport] Connected to " + host + ":" + std::to_string(port));
        return handle;
    }

    void NetworkTransportDriver::write(TransportHandle &handle, const types::Payload &payload) {
        auto *network = dynamic_cast<NetworkHandle *>(&handle);
        if (!network) {
            throw types::TransmissionFailedException("Handle for " + handle.address() +
                                                     " was not opened by the network driver");
        }
        if (!network->socket.is_open()) {
            throw types::TransmissionFailedException("Socket to " + handle.address() + " is closed");
        }

        std::size_t written = 0;
        auto &socket = network->socket;
        auto outcome = asio_support::runWithTimeout(
                network->io, writeTimeout_,
                [&](auto done) {
                    boost::asio::async_write(socket, boost::asio::buffer(payload),
                                             [&written, done](const boost::system::error_code &ec, std::size_t n) {
                                                 written = n;
                                                 done(ec);
                                             });
                },
                [&socket]() {
                    boost::system::error_code ignored;
                    socket.cancel(ignored);
                });

        if (outcome.timedOut) {
            Logger::logError("[NetworkTransport] Write to " + handle.address() + " timed out");
            throw types::TransmissionFailedException("Write to " + handle.address() + " timed out");
        }
        if (outcome.ec) {
            Logger::logError("[NetworkTransport] Write error on " + handle.address() + ": " + outcome.ec.message());
            throw types::TransmissionFailedException("Write error on " + handle.address() + ": " +
                                                     outcome.ec.message());
        }
        if (written != payload.size()) {
            throw types::TransmissionFailedException("Short write on " + handle.address());
        }
    }

    void NetworkTransportDriver::close(TransportHandle &handle) {
        auto *network = dynamic_cast<NetworkHandle *>(&handle);
        if (!network || !network->socket.is_open()) return;

        boost::system::error_code ec;
        network->socket.shutdown(tcp::socket::shutdown_both, ec);
        network->socket.close(ec);
        if (ec) {
            Logger::logWarning("[NetworkTransport] Error closing " + handle.address() + ": " + ec.message());
            return;
        }
        Logger::logInfo("[NetworkTransport] Closed " + handle.address());
    }

} // namespace core::transport
