//
// Created by Andrea on 15/10/2025.
//

#include "core/registry/ConnectionRegistry.hpp"
#include "core/events/EventSystem.hpp"
#include "logger/Logger.hpp"

namespace core::registry {

    std::string connectionStateToString(ConnectionState state) {
        switch (state) {
            case ConnectionState::Idle:
                return "IDLE";
            case ConnectionState::Connecting:
                return "CONNECTING";
            case ConnectionState::Connected:
                return "CONNECTED";
        }
        return "UNKNOWN";
    }

    // ---------------------------------------------------------------- HandleLease

    HandleLease::HandleLease(types::PrinterId printerId, std::shared_ptr<ConnectionRecord> record,
                             std::unique_lock<std::mutex> ioLock)
            : printerId_(std::move(printerId)), record_(std::move(record)), ioLock_(std::move(ioLock)) {
    }

    HandleLease::operator bool() const {
        if (!record_ || !ioLock_.owns_lock()) return false;
        std::lock_guard<std::mutex> lock(record_->stateMutex);
        return record_->state == ConnectionState::Connected && record_->handle != nullptr;
    }

    transport::TransportHandle &HandleLease::handle() {
        if (!*this) {
            throw std::logic_error("HandleLease for " + printerId_ + " holds no connection");
        }
        // Stable while the lease holds ioMutex: only lease holders take the handle away
        return *record_->handle;
    }

    std::unique_ptr<transport::TransportHandle> HandleLease::release() {
        auto handle = takeHandle(std::nullopt);
        if (handle) {
            Logger::logInfo("[ConnectionRegistry] " + printerId_ + ": CONNECTED -> IDLE (disconnect)");
            events::EventBus::getInstance().publish(
                    events::Event(events::EventType::PRINTER_DISCONNECTED, printerId_, handle->address()));
        }
        return handle;
    }

    std::unique_ptr<transport::TransportHandle> HandleLease::degrade(const types::Result &error) {
        auto handle = takeHandle(error);
        if (handle) {
            Logger::logWarning("[ConnectionRegistry] " + printerId_ + ": CONNECTED -> IDLE (connection lost: " +
                               error.message + ")");
            events::EventBus::getInstance().publish(
                    events::Event(events::EventType::PRINTER_CONNECTION_LOST, printerId_, error.message));
        }
        return handle;
    }

    std::unique_ptr<transport::TransportHandle> HandleLease::takeHandle(const std::optional<types::Result> &error) {
        if (!record_ || !ioLock_.owns_lock()) return nullptr;

        std::unique_ptr<transport::TransportHandle> handle;
        {
            std::lock_guard<std::mutex> lock(record_->stateMutex);
            if (record_->state != ConnectionState::Connected) return nullptr;

            handle = std::move(record_->handle);
            record_->state = ConnectionState::Idle;
            record_->connectedSince.reset();
            if (error) {
                record_->lastError = error;
                record_->lastError->printerId = printerId_;
            }
        }
        record_->resolved.notify_all();
        return handle;
    }

    // ---------------------------------------------------------------- ConnectionRegistry

    ConnectionRegistry::~ConnectionRegistry() {
        size_t live = connectedPrinters().size();
        if (live > 0) {
            Logger::logWarning("[ConnectionRegistry] Destroyed with " + std::to_string(live) +
                               " live connection(s); handles released without close");
        }
    }

    std::shared_ptr<ConnectionRecord> ConnectionRegistry::find(const types::PrinterId &printerId) const {
        std::shared_lock<std::shared_mutex> lock(mapMutex_);
        auto it = records_.find(printerId);
        return it != records_.end() ? it->second : nullptr;
    }

    std::shared_ptr<ConnectionRecord> ConnectionRegistry::findOrCreate(const types::PrinterId &printerId) {
        if (auto existing = find(printerId)) {
            return existing;
        }
        std::unique_lock<std::shared_mutex> lock(mapMutex_);
        auto &slot = records_[printerId];
        if (!slot) {
            slot = std::make_shared<ConnectionRecord>();
        }
        return slot;
    }

    ConnectionSnapshot ConnectionRegistry::snapshotOf(const types::PrinterId &printerId,
                                                      const ConnectionRecord &record) {
        std::lock_guard<std::mutex> lock(record.stateMutex);
        ConnectionSnapshot snapshot;
        snapshot.printerId = printerId;
        snapshot.state = record.state;
        snapshot.lastError = record.lastError;
        snapshot.connectedSince = record.connectedSince;
        snapshot.hasHandle = record.handle != nullptr;
        if (record.handle) {
            snapshot.address = record.handle->address();
        }
        return snapshot;
    }

    ConnectionSnapshot ConnectionRegistry::get(const types::PrinterId &printerId) const {
        auto record = find(printerId);
        if (!record) {
            ConnectionSnapshot idle;
            idle.printerId = printerId;
            return idle;
        }
        return snapshotOf(printerId, *record);
    }

    std::vector<ConnectionSnapshot> ConnectionRegistry::snapshotAll() const {
        std::vector<std::pair<types::PrinterId, std::shared_ptr<ConnectionRecord>>> entries;
        {
            std::shared_lock<std::shared_mutex> lock(mapMutex_);
            entries.assign(records_.begin(), records_.end());
        }

        std::vector<ConnectionSnapshot> snapshots;
        snapshots.reserve(entries.size());
        for (const auto &[id, record]: entries) {
            snapshots.push_back(snapshotOf(id, *record));
        }
        return snapshots;
    }

    std::vector<types::PrinterId> ConnectionRegistry::connectedPrinters() const {
        std::vector<types::PrinterId> connected;
        for (const auto &snapshot: snapshotAll()) {
            if (snapshot.isConnected()) {
                connected.push_back(snapshot.printerId);
            }
        }
        return connected;
    }

    ConnectionRegistry::ConnectAttempt ConnectionRegistry::beginConnect(const types::PrinterId &printerId) {
        while (true) {
            auto record = findOrCreate(printerId);
            std::lock_guard<std::mutex> lock(record->stateMutex);
            if (record->removed) continue; // lost a race with remove(); fetch the new record

            switch (record->state) {
                case ConnectionState::Connected:
                    return {BeginOutcome::AlreadyConnected, record->attempt};
                case ConnectionState::Connecting:
                    return {BeginOutcome::InProgress, record->attempt};
                case ConnectionState::Idle:
                    record->state = ConnectionState::Connecting;
                    record->attempt++;
                    Logger::logInfo("[ConnectionRegistry] " + printerId + ": IDLE -> CONNECTING (attempt " +
                                    std::to_string(record->attempt) + ")");
                    return {BeginOutcome::Started, record->attempt};
            }
        }
    }

    bool ConnectionRegistry::completeConnect(const types::PrinterId &printerId, uint64_t attemptId,
                                             std::unique_ptr<transport::TransportHandle> &handle) {
        if (!handle) {
            throw std::invalid_argument("completeConnect requires a handle");
        }

        auto record = find(printerId);
        if (!record) return false;

        std::string address = handle->address();
        {
            std::lock_guard<std::mutex> lock(record->stateMutex);
            if (record->removed || record->state != ConnectionState::Connecting || record->attempt != attemptId) {
                return false;
            }
            record->handle = std::move(handle);
            record->state = ConnectionState::Connected;
            record->connectedSince = std::chrono::system_clock::now();
            record->lastError.reset();
        }
        record->resolved.notify_all();

        Logger::logInfo("[ConnectionRegistry] " + printerId + ": CONNECTING -> CONNECTED (" + address + ")");
        events::EventBus::getInstance().publish(
                events::Event(events::EventType::PRINTER_CONNECTED, printerId, address));
        return true;
    }

    bool ConnectionRegistry::failConnect(const types::PrinterId &printerId, uint64_t attemptId,
                                         const types::Result &error) {
        auto record = find(printerId);
        if (!record) return false;

        {
            std::lock_guard<std::mutex> lock(record->stateMutex);
            if (record->removed || record->state != ConnectionState::Connecting || record->attempt != attemptId) {
                return false;
            }
            record->state = ConnectionState::Idle;
            record->lastError = error;
            record->lastError->printerId = printerId;
        }
        record->resolved.notify_all();

        Logger::logWarning("[ConnectionRegistry] " + printerId + ": CONNECTING -> IDLE (" +
                           types::resultCodeToString(error.code) + ": " + error.message + ")");
        events::EventBus::getInstance().publish(
                events::Event(events::EventType::PRINTER_CONNECT_FAILED, printerId, error.message));
        return true;
    }

    bool ConnectionRegistry::recordFailure(const types::PrinterId &printerId, const types::Result &error) {
        if (printerId.empty()) return false;

        while (true) {
            auto record = findOrCreate(printerId);
            {
                std::lock_guard<std::mutex> lock(record->stateMutex);
                if (record->removed) continue;
                if (record->state != ConnectionState::Idle) return false;
                record->lastError = error;
                record->lastError->printerId = printerId;
            }

            Logger::logWarning("[ConnectionRegistry] " + printerId + ": IDLE (refused: " +
                               types::resultCodeToString(error.code) + ": " + error.message + ")");
            events::EventBus::getInstance().publish(
                    events::Event(events::EventType::PRINTER_CONNECT_FAILED, printerId, error.message));
            return true;
        }
    }

    ConnectionSnapshot ConnectionRegistry::waitWhileConnecting(
            const types::PrinterId &printerId, std::optional<std::chrono::steady_clock::time_point> deadline) {
        auto record = find(printerId);
        if (!record) {
            return get(printerId);
        }

        {
            std::unique_lock<std::mutex> lock(record->stateMutex);
            auto notConnecting = [&record] { return record->state != ConnectionState::Connecting; };
            if (deadline) {
                record->resolved.wait_until(lock, *deadline, notConnecting);
            } else {
                record->resolved.wait(lock, notConnecting);
            }
        }
        return snapshotOf(printerId, *record);
    }

    HandleLease ConnectionRegistry::lease(const types::PrinterId &printerId) {
        auto record = find(printerId);
        if (!record) return {};

        std::unique_lock<std::mutex> ioLock(record->ioMutex);
        {
            std::lock_guard<std::mutex> lock(record->stateMutex);
            if (record->removed || record->state != ConnectionState::Connected) {
                return {};
            }
        }
        return HandleLease(printerId, record, std::move(ioLock));
    }

    bool ConnectionRegistry::remove(const types::PrinterId &printerId) {
        std::unique_lock<std::shared_mutex> mapLock(mapMutex_);
        auto it = records_.find(printerId);
        if (it == records_.end()) return false;

        auto record = it->second;
        std::unique_lock<std::mutex> ioLock(record->ioMutex, std::try_to_lock);
        if (!ioLock.owns_lock()) return false;

        std::lock_guard<std::mutex> lock(record->stateMutex);
        if (record->state != ConnectionState::Idle) return false;

        record->removed = true;
        records_.erase(it);
        Logger::logInfo("[ConnectionRegistry] " + printerId + ": record removed");
        return true;
    }

    size_t ConnectionRegistry::size() const {
        std::shared_lock<std::shared_mutex> lock(mapMutex_);
        return records_.size();
    }

} // namespace core::registry
