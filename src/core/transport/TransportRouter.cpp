#include "core/transport/TransportRouter.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

namespace core::transport {

    void TransportRouter::addDriver(const std::shared_ptr<TransportDriver> &driver) {
        if (!driver) {
            throw std::invalid_argument("TransportDriver cannot be null");
        }

        static const types::TransportKind kinds[] = {
                types::TransportKind::Bluetooth, types::TransportKind::Network,
                types::TransportKind::Usb, types::TransportKind::Serial
        };

        std::lock_guard<std::mutex> lock(driversMutex_);
        for (auto kind: kinds) {
            if (driver->supports(kind) && drivers_.find(kind) == drivers_.end()) {
                drivers_[kind] = driver;
                Logger::logInfo("[TransportRouter] " + types::transportKindToString(kind) + " -> " +
                                driver->getDriverName());
            }
        }
    }

    std::shared_ptr<TransportDriver> TransportRouter::driverFor(types::TransportKind kind) const {
        std::lock_guard<std::mutex> lock(driversMutex_);
        auto it = drivers_.find(kind);
        return it != drivers_.end() ? it->second : nullptr;
    }

    std::unique_ptr<TransportHandle> TransportRouter::open(const types::PrinterConfiguration &config) {
        auto driver = driverFor(config.kind);
        if (!driver) {
            throw types::ConnectFailedException("No transport driver for " +
                                                types::transportKindToString(config.kind) + " printers");
        }
        return driver->open(config);
    }

    void TransportRouter::write(TransportHandle &handle, const types::Payload &payload) {
        auto driver = driverFor(handle.kind());
        if (!driver) {
            throw types::TransmissionFailedException("No transport driver for " +
                                                     types::transportKindToString(handle.kind()) + " printers");
        }
        driver->write(handle, payload);
    }

    void TransportRouter::close(TransportHandle &handle) {
        auto driver = driverFor(handle.kind());
        if (!driver) {
            Logger::logWarning("[TransportRouter] No driver to close " + handle.address());
            return;
        }
        driver->close(handle);
    }

    bool TransportRouter::supports(types::TransportKind kind) const {
        return driverFor(kind) != nullptr;
    }

} // namespace core::transport
