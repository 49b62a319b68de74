//
// Created by Andrea on 17/10/2025.
//

#pragma once

#include "core/registry/ConnectionRegistry.hpp"
#include "core/transport/TransportDriver.hpp"
#include "core/types/CancellationToken.hpp"
#include "core/types/PrinterTypes.hpp"
#include "core/types/Result.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace core::dispatch {

    /**
     * @brief One queued job. The waiter may abandon it; an abandoned job is resolved without
     * being transmitted unless transmission already started.
     */
    struct PendingJob {
        types::PrintJob job;
        std::optional<std::chrono::steady_clock::time_point> deadline;
        std::shared_ptr<types::CancellationToken> cancellation;
        std::promise<types::Result> promise;

        void abandon(const types::Result &reason);

        std::optional<types::Result> abandonReason() const;

    private:
        mutable std::mutex abandonMutex_;
        std::optional<types::Result> abandoned_;
    };

    struct QueueTicket {
        std::shared_ptr<PendingJob> pending;
        std::future<types::Result> result;
    };

    /**
     * @brief FIFO transmission queue for a single printer identity.
     *
     * Exactly one worker thread drains the queue, so writes to the same printer never overlap
     * and leave in submission order. The worker is started lazily on the first enqueue.
     */
    class PrinterQueue {
    public:
        PrinterQueue(types::PrinterId printerId, std::shared_ptr<registry::ConnectionRegistry> registry,
                     std::shared_ptr<transport::TransportDriver> driver);

        ~PrinterQueue();

        PrinterQueue(const PrinterQueue &) = delete;

        PrinterQueue &operator=(const PrinterQueue &) = delete;

        QueueTicket enqueue(types::PrintJob job,
                            std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt,
                            std::shared_ptr<types::CancellationToken> cancellation = nullptr);

        /**
         * @brief Stops the worker; jobs still queued resolve as Cancelled.
         */
        void stop();

        /**
         * @brief Stops the worker if nothing is queued or being transmitted. Returns false, and
         * leaves the queue untouched, otherwise.
         */
        bool stopIfIdle();

        bool isRunning() const {
            return running_.load() && !stopping_.load();
        }

        const types::PrinterId &printerId() const { return printerId_; }

        size_t getQueueSize() const;

        struct Statistics {
            size_t totalEnqueued = 0;
            size_t totalTransmitted = 0;
            size_t totalFailed = 0;
            size_t totalExpired = 0; // resolved without transmission (timeout / cancel)
            size_t currentQueueSize = 0;
        };

        Statistics getStatistics() const;

    private:
        types::PrinterId printerId_;
        std::shared_ptr<registry::ConnectionRegistry> registry_;
        std::shared_ptr<transport::TransportDriver> driver_;

        std::deque<std::shared_ptr<PendingJob>> jobs_;
        mutable std::mutex queueMutex_;
        std::condition_variable queueCondition_;
        std::thread workerThread_;
        std::atomic<bool> running_{false};
        std::atomic<bool> stopping_{false};
        bool busy_ = false; // guarded by queueMutex_

        mutable Statistics stats_;
        mutable std::mutex statsMutex_;

        void startWorkerLocked();

        void processingLoop();

        types::Result execute(PendingJob &pending);

        types::Result degrade(registry::HandleLease &lease, types::Result failure);

        void resolve(PendingJob &pending, types::Result result);
    };

} // namespace core::dispatch
