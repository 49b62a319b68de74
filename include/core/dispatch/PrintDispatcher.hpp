//
// Created by Andrea on 17/10/2025.
//

#pragma once

#include "core/dispatch/PrinterQueue.hpp"
#include "core/registry/ConnectionRegistry.hpp"
#include "core/transport/TransportDriver.hpp"
#include "core/types/CancellationToken.hpp"
#include "core/types/PrinterTypes.hpp"
#include "core/types/Result.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace core::dispatch {

    struct PrintOptions {
        std::chrono::milliseconds timeout{0}; // 0 waits until the job resolves
        std::shared_ptr<types::CancellationToken> cancellation;
    };

    /**
     * @brief Routes print jobs into per-printer queues and collects their outcomes.
     *
     * Jobs for offline printers are rejected up front with NotConnected rather than queued.
     * Printers never share a queue or a lock, so a slow device only delays its own jobs.
     */
    class PrintDispatcher {
    public:
        PrintDispatcher(std::shared_ptr<registry::ConnectionRegistry> registry,
                        std::shared_ptr<transport::TransportDriver> driver);

        ~PrintDispatcher();

        PrintDispatcher(const PrintDispatcher &) = delete;

        PrintDispatcher &operator=(const PrintDispatcher &) = delete;

        /**
         * @brief Transmits payload to one printer and blocks until it is written, fails, or the
         * caller's deadline/cancellation resolves it first.
         */
        types::Result printTo(const types::PrinterId &printerId, const types::Payload &payload,
                              const PrintOptions &options = {});

        /**
         * @brief Asynchronous form of printTo. The deadline in options still applies: a job not
         * yet started when it expires resolves as Timeout without being transmitted.
         */
        std::future<types::Result> submit(const types::PrinterId &printerId, const types::Payload &payload,
                                          const PrintOptions &options = {});

        /**
         * @brief Fans payload out to every printer Connected at call time. One entry per
         * snapshotted printer, failures included.
         */
        std::map<types::PrinterId, types::Result> printToAll(const types::Payload &payload,
                                                             const PrintOptions &options = {});

        /**
         * @brief Routes job by its target; the wildcard target fans out.
         */
        std::map<types::PrinterId, types::Result> print(const types::PrintJob &job, const PrintOptions &options = {});

        void shutdown();

        /**
         * @brief Stops and forgets the queue of every printer that is neither Connected nor
         * Connecting and has nothing left to transmit. Counters of released queues are kept in
         * the statistics. Returns the number released.
         */
        size_t releaseIdleQueues();

        struct Statistics {
            size_t totalEnqueued = 0;
            size_t totalTransmitted = 0;
            size_t totalFailed = 0;
            size_t totalExpired = 0;
            size_t totalRejected = 0; // NotConnected before queueing
            size_t currentQueueSize = 0;
            size_t activeQueues = 0;
        };

        Statistics getStatistics() const;

        static std::string generateJobId();

    private:
        std::shared_ptr<registry::ConnectionRegistry> registry_;
        std::shared_ptr<transport::TransportDriver> driver_;

        mutable std::mutex queuesMutex_;
        std::unordered_map<types::PrinterId, std::shared_ptr<PrinterQueue>> queues_;
        std::atomic<bool> shutdown_{false};
        std::atomic<size_t> rejected_{0};
        PrinterQueue::Statistics released_; // guarded by queuesMutex_

        QueueTicket enqueueFor(const types::PrinterId &printerId, types::PrintJob job,
                               std::optional<std::chrono::steady_clock::time_point> deadline,
                               std::shared_ptr<types::CancellationToken> cancellation);

        std::optional<types::Result> rejectEarly(const types::PrinterId &printerId, const types::PrintJob &job,
                                                 const PrintOptions &options);

        static types::Result awaitTicket(QueueTicket &ticket, const PrintOptions &options,
                                         std::optional<std::chrono::steady_clock::time_point> deadline);
    };

} // namespace core::dispatch
