//
// Created by Andrea on 15/10/2025.
//

#pragma once

#include "core/transport/TransportDriver.hpp"
#include "core/types/PrinterTypes.hpp"
#include "core/types/Result.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace core::registry {

    enum class ConnectionState {
        Idle,
        Connecting,
        Connected
    };

    std::string connectionStateToString(ConnectionState state);

    /**
     * @brief Immutable copy of one printer's connection record.
     */
    struct ConnectionSnapshot {
        types::PrinterId printerId;
        ConnectionState state = ConnectionState::Idle;
        std::optional<types::Result> lastError;
        std::optional<std::chrono::system_clock::time_point> connectedSince;
        bool hasHandle = false;
        std::string address; // address of the live handle

        bool isConnected() const {
            return state == ConnectionState::Connected;
        }
    };

    /**
     * @brief Live state of one printer identity.
     *
     * stateMutex guards the fields and is only held for short transitions. ioMutex is held for
     * the whole of a write or close so I/O on one handle never overlaps. Lock order is always
     * ioMutex before stateMutex.
     */
    struct ConnectionRecord {
        mutable std::mutex stateMutex;
        std::condition_variable resolved;
        std::mutex ioMutex;

        ConnectionState state = ConnectionState::Idle;
        std::optional<types::Result> lastError;
        std::optional<std::chrono::system_clock::time_point> connectedSince;
        std::unique_ptr<transport::TransportHandle> handle; // non-null iff Connected
        uint64_t attempt = 0;
        bool removed = false;
    };

    /**
     * @brief Exclusive I/O access to a connected printer's handle for the lifetime of the lease.
     *
     * An empty lease (operator bool false) means the printer was not Connected when the lease
     * was taken.
     */
    class HandleLease {
    public:
        HandleLease() = default;

        HandleLease(types::PrinterId printerId, std::shared_ptr<ConnectionRecord> record,
                    std::unique_lock<std::mutex> ioLock);

        HandleLease(HandleLease &&) = default;

        HandleLease &operator=(HandleLease &&) = default;

        explicit operator bool() const;

        transport::TransportHandle &handle();

        /**
         * @brief Connected -> Idle on request; returns the handle for the caller to close.
         */
        std::unique_ptr<transport::TransportHandle> release();

        /**
         * @brief Connected -> Idle after a proven transport failure; records error and returns
         * the dead handle for the caller to close.
         */
        std::unique_ptr<transport::TransportHandle> degrade(const types::Result &error);

    private:
        types::PrinterId printerId_;
        std::shared_ptr<ConnectionRecord> record_;
        std::unique_lock<std::mutex> ioLock_;

        std::unique_ptr<transport::TransportHandle> takeHandle(const std::optional<types::Result> &error);
    };

    /**
     * @brief Single source of truth for which printers are connected.
     *
     * Records are created lazily on the first connect attempt; an unknown identity reads as
     * Idle. Mutations of one identity are serialized; different identities never block each
     * other beyond the short map lookup.
     */
    class ConnectionRegistry {
    public:
        enum class BeginOutcome {
            Started,
            AlreadyConnected,
            InProgress
        };

        struct ConnectAttempt {
            BeginOutcome outcome;
            uint64_t attemptId;
        };

        ConnectionRegistry() = default;

        ~ConnectionRegistry();

        ConnectionRegistry(const ConnectionRegistry &) = delete;

        ConnectionRegistry &operator=(const ConnectionRegistry &) = delete;

        ConnectionSnapshot get(const types::PrinterId &printerId) const;

        std::vector<ConnectionSnapshot> snapshotAll() const;

        std::vector<types::PrinterId> connectedPrinters() const;

        /**
         * @brief Idle -> Connecting. Returns AlreadyConnected or InProgress without changing state
         * when the identity is not Idle.
         */
        ConnectAttempt beginConnect(const types::PrinterId &printerId);

        /**
         * @brief Connecting -> Connected, taking ownership of handle.
         *
         * Returns false and leaves handle with the caller when attemptId is no longer the
         * current attempt (it timed out or was cancelled meanwhile).
         */
        bool completeConnect(const types::PrinterId &printerId, uint64_t attemptId,
                             std::unique_ptr<transport::TransportHandle> &handle);

        /**
         * @brief Connecting -> Idle with error recorded. Returns false for a stale attempt.
         */
        bool failConnect(const types::PrinterId &printerId, uint64_t attemptId, const types::Result &error);

        /**
         * @brief Records a connect that was refused before any attempt began (invalid
         * configuration, cancelled up front). Creates the record if needed. Only an Idle record
         * is touched; returns false otherwise.
         */
        bool recordFailure(const types::PrinterId &printerId, const types::Result &error);

        /**
         * @brief Blocks while the identity is Connecting, until deadline.
         */
        ConnectionSnapshot waitWhileConnecting(const types::PrinterId &printerId,
                                               std::optional<std::chrono::steady_clock::time_point> deadline);

        /**
         * @brief Takes exclusive I/O access; blocks while another write or close is running on
         * the same identity.
         */
        HandleLease lease(const types::PrinterId &printerId);

        /**
         * @brief Deletes an Idle record. Returns false when absent or not Idle.
         */
        bool remove(const types::PrinterId &printerId);

        size_t size() const;

    private:
        mutable std::shared_mutex mapMutex_;
        std::unordered_map<types::PrinterId, std::shared_ptr<ConnectionRecord>> records_;

        std::shared_ptr<ConnectionRecord> find(const types::PrinterId &printerId) const;

        std::shared_ptr<ConnectionRecord> findOrCreate(const types::PrinterId &printerId);

        static ConnectionSnapshot snapshotOf(const types::PrinterId &printerId, const ConnectionRecord &record);
    };

} // namespace core::registry
