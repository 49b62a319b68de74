//
// Created by Andrea on 17/10/2025.
//

#include "core/dispatch/PrinterQueue.hpp"
#include "core/events/EventSystem.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

namespace core::dispatch {

    void PendingJob::abandon(const types::Result &reason) {
        std::lock_guard<std::mutex> lock(abandonMutex_);
        if (!abandoned_) abandoned_ = reason;
    }

    std::optional<types::Result> PendingJob::abandonReason() const {
        std::lock_guard<std::mutex> lock(abandonMutex_);
        return abandoned_;
    }

    PrinterQueue::PrinterQueue(types::PrinterId printerId, std::shared_ptr<registry::ConnectionRegistry> registry,
                               std::shared_ptr<transport::TransportDriver> driver)
            : printerId_(std::move(printerId)), registry_(std::move(registry)), driver_(std::move(driver)) {
        if (!registry_) {
            throw std::invalid_argument("ConnectionRegistry cannot be null");
        }
        if (!driver_) {
            throw std::invalid_argument("TransportDriver cannot be null");
        }
    }

    PrinterQueue::~PrinterQueue() {
        stop();
    }

    QueueTicket PrinterQueue::enqueue(types::PrintJob job,
                                      std::optional<std::chrono::steady_clock::time_point> deadline,
                                      std::shared_ptr<types::CancellationToken> cancellation) {
        auto pending = std::make_shared<PendingJob>();
        pending->job = std::move(job);
        pending->deadline = deadline;
        pending->cancellation = std::move(cancellation);

        QueueTicket ticket{pending, pending->promise.get_future()};

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (stopping_) {
                pending->promise.set_value(types::Result::cancelled("Print queue is stopped")
                                                   .forPrinter(printerId_).forJob(pending->job.jobId));
                return ticket;
            }
            startWorkerLocked();
            jobs_.push_back(pending);
        }
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.totalEnqueued++;
        }
        queueCondition_.notify_one();
        return ticket;
    }

    void PrinterQueue::startWorkerLocked() {
        if (running_) return;
        if (workerThread_.joinable()) {
            // Previous worker crashed and already left its loop
            workerThread_.join();
        }

        running_ = true;
        workerThread_ = std::thread([this]() {
            try {
                processingLoop();
            } catch (const std::exception &e) {
                Logger::logError("[PrinterQueue] Worker for " + printerId_ + " crashed: " + std::string(e.what()));
                running_ = false;
            }
        });
        Logger::logInfo("[PrinterQueue] Worker started for " + printerId_);
    }

    void PrinterQueue::stop() {
        std::deque<std::shared_ptr<PendingJob>> leftover;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (stopping_) return;
            stopping_ = true;
            leftover.swap(jobs_);
        }
        queueCondition_.notify_all();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }
        running_ = false;

        for (auto &pending: leftover) {
            resolve(*pending, types::Result::cancelled("Print queue stopped before transmission"));
        }
        if (!leftover.empty()) {
            Logger::logWarning("[PrinterQueue] " + printerId_ + ": " + std::to_string(leftover.size()) +
                               " job(s) cancelled on stop");
        }
    }

    bool PrinterQueue::stopIfIdle() {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (stopping_) return true;
            if (busy_ || !jobs_.empty()) return false;
            stopping_ = true;
        }
        queueCondition_.notify_all();
        if (workerThread_.joinable()) {
            workerThread_.join();
        }
        running_ = false;
        return true;
    }

    void PrinterQueue::processingLoop() {
        while (true) {
            std::shared_ptr<PendingJob> pending;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                queueCondition_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
                if (stopping_) break;

                pending = jobs_.front();
                jobs_.pop_front();
                busy_ = true;
            }
            resolve(*pending, execute(*pending));
            {
                std::lock_guard<std::mutex> lock(queueMutex_);
                busy_ = false;
            }
        }
    }

    types::Result PrinterQueue::execute(PendingJob &pending) {
        if (auto reason = pending.abandonReason()) {
            return *reason;
        }
        if (pending.cancellation && pending.cancellation->isCancelled()) {
            return types::Result::cancelled("Print cancelled before transmission");
        }
        if (pending.deadline && std::chrono::steady_clock::now() >= *pending.deadline) {
            return types::Result::timeout("Deadline expired before transmission");
        }

        // Blocks while a disconnect is closing the same handle
        auto lease = registry_->lease(printerId_);
        if (!lease) {
            return types::Result::notConnected();
        }

        try {
            driver_->write(lease.handle(), pending.job.payload);
            return types::Result::success("Transmitted " + std::to_string(pending.job.payload.size()) + " bytes");
        } catch (const types::PrinterException &e) {
            return degrade(lease, types::Result::transmissionFailed(e.what()));
        } catch (const std::exception &e) {
            return degrade(lease, types::Result::transmissionFailed(std::string("Unexpected error: ") + e.what()));
        }
    }

    types::Result PrinterQueue::degrade(registry::HandleLease &lease, types::Result failure) {
        failure.forPrinter(printerId_);
        auto dead = lease.degrade(failure);
        if (dead) {
            try {
                driver_->close(*dead);
            } catch (const std::exception &e) {
                Logger::logWarning("[PrinterQueue] Closing dead handle for " + printerId_ + " failed: " + e.what());
            }
        }
        return failure;
    }

    void PrinterQueue::resolve(PendingJob &pending, types::Result result) {
        result.forPrinter(printerId_).forJob(pending.job.jobId);

        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            if (result.isSuccess()) {
                stats_.totalTransmitted++;
            } else if (result.isTimeout() || result.isCancelled()) {
                stats_.totalExpired++;
            } else {
                stats_.totalFailed++;
            }
        }

        if (result.isSuccess()) {
            Logger::logInfo("[PrinterQueue] Job " + pending.job.jobId + " printed on " + printerId_);
            events::EventBus::getInstance().publish(
                    events::Event(events::EventType::PRINT_JOB_COMPLETED, printerId_, pending.job.jobId));
        } else {
            Logger::logWarning("[PrinterQueue] Job " + pending.job.jobId + " on " + printerId_ + " failed: " +
                               types::resultCodeToString(result.code) + " - " + result.message);
            events::EventBus::getInstance().publish(
                    events::Event(events::EventType::PRINT_JOB_FAILED, printerId_,
                                  pending.job.jobId + ": " + result.message));
        }

        pending.promise.set_value(std::move(result));
    }

    size_t PrinterQueue::getQueueSize() const {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return jobs_.size();
    }

    PrinterQueue::Statistics PrinterQueue::getStatistics() const {
        Statistics snapshot;
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            snapshot = stats_;
        }
        snapshot.currentQueueSize = getQueueSize();
        return snapshot;
    }

} // namespace core::dispatch
