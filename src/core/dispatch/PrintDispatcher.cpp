//
// Created by Andrea on 17/10/2025.
//

#include "core/dispatch/PrintDispatcher.hpp"
#include "logger/Logger.hpp"

#include <vector>

namespace core::dispatch {

    namespace {
        constexpr std::chrono::milliseconds WAIT_SLICE{20};

        std::optional<std::chrono::steady_clock::time_point> deadlineFor(const PrintOptions &options) {
            if (options.timeout.count() <= 0) return std::nullopt;
            return std::chrono::steady_clock::now() + options.timeout;
        }

        std::future<types::Result> readyFuture(types::Result result) {
            std::promise<types::Result> promise;
            promise.set_value(std::move(result));
            return promise.get_future();
        }
    }

    PrintDispatcher::PrintDispatcher(std::shared_ptr<registry::ConnectionRegistry> registry,
                                     std::shared_ptr<transport::TransportDriver> driver)
            : registry_(std::move(registry)), driver_(std::move(driver)) {
        if (!registry_) {
            throw std::invalid_argument("ConnectionRegistry cannot be null");
        }
        if (!driver_) {
            throw std::invalid_argument("TransportDriver cannot be null");
        }
    }

    PrintDispatcher::~PrintDispatcher() {
        shutdown();
    }

    std::string PrintDispatcher::generateJobId() {
        static std::atomic<uint64_t> sequence{0};
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        return "job-" + std::to_string(millis) + "-" + std::to_string(++sequence);
    }

    QueueTicket PrintDispatcher::enqueueFor(const types::PrinterId &printerId, types::PrintJob job,
                                            std::optional<std::chrono::steady_clock::time_point> deadline,
                                            std::shared_ptr<types::CancellationToken> cancellation) {
        // Enqueued under queuesMutex_ so releaseIdleQueues never retires a queue between
        // lookup and push
        std::lock_guard<std::mutex> lock(queuesMutex_);
        auto it = queues_.find(printerId);
        if (it == queues_.end()) {
            it = queues_.emplace(printerId, std::make_shared<PrinterQueue>(printerId, registry_, driver_)).first;
        }
        return it->second->enqueue(std::move(job), deadline, std::move(cancellation));
    }

    std::optional<types::Result> PrintDispatcher::rejectEarly(const types::PrinterId &printerId,
                                                              const types::PrintJob &job,
                                                              const PrintOptions &options) {
        if (shutdown_) {
            return types::Result::cancelled("Dispatcher is shut down").forPrinter(printerId).forJob(job.jobId);
        }
        if (options.cancellation && options.cancellation->isCancelled()) {
            return types::Result::cancelled().forPrinter(printerId).forJob(job.jobId);
        }
        if (!registry_->get(printerId).isConnected()) {
            rejected_++;
            Logger::logWarning("[PrintDispatcher] Job " + job.jobId + " rejected: " + printerId + " not connected");
            releaseIdleQueues();
            return types::Result::notConnected().forPrinter(printerId).forJob(job.jobId);
        }
        return std::nullopt;
    }

    types::Result PrintDispatcher::printTo(const types::PrinterId &printerId, const types::Payload &payload,
                                           const PrintOptions &options) {
        const auto deadline = deadlineFor(options);

        types::PrintJob job;
        job.jobId = generateJobId();
        job.target = printerId;
        job.payload = payload;

        if (auto rejected = rejectEarly(printerId, job, options)) {
            return *rejected;
        }

        auto ticket = enqueueFor(printerId, std::move(job), deadline, options.cancellation);
        return awaitTicket(ticket, options, deadline);
    }

    std::future<types::Result> PrintDispatcher::submit(const types::PrinterId &printerId,
                                                       const types::Payload &payload,
                                                       const PrintOptions &options) {
        types::PrintJob job;
        job.jobId = generateJobId();
        job.target = printerId;
        job.payload = payload;

        if (auto rejected = rejectEarly(printerId, job, options)) {
            return readyFuture(*rejected);
        }

        auto ticket = enqueueFor(printerId, std::move(job), deadlineFor(options), options.cancellation);
        return std::move(ticket.result);
    }

    std::map<types::PrinterId, types::Result> PrintDispatcher::printToAll(const types::Payload &payload,
                                                                          const PrintOptions &options) {
        const auto deadline = deadlineFor(options);
        const std::string jobId = generateJobId();
        const auto targets = registry_->connectedPrinters();

        std::map<types::PrinterId, types::Result> results;
        if (targets.empty()) {
            Logger::logWarning("[PrintDispatcher] Broadcast " + jobId + ": no connected printers");
            return results;
        }

        Logger::logInfo("[PrintDispatcher] Broadcast " + jobId + " to " + std::to_string(targets.size()) +
                        " printer(s)");

        // Every snapshotted printer is enqueued before waiting on any, so a slow device never
        // delays the start of the others
        std::vector<std::pair<types::PrinterId, QueueTicket>> tickets;
        tickets.reserve(targets.size());
        for (const auto &printerId: targets) {
            if (shutdown_) {
                results[printerId] = types::Result::cancelled("Dispatcher is shut down")
                        .forPrinter(printerId).forJob(jobId);
                continue;
            }
            types::PrintJob job;
            job.jobId = jobId;
            job.target = printerId;
            job.payload = payload;
            tickets.emplace_back(printerId, enqueueFor(printerId, std::move(job), deadline, options.cancellation));
        }

        size_t succeeded = 0;
        for (auto &[printerId, ticket]: tickets) {
            auto result = awaitTicket(ticket, options, deadline);
            if (result.isSuccess()) succeeded++;
            results[printerId] = result;
        }

        Logger::logInfo("[PrintDispatcher] Broadcast " + jobId + " complete: " + std::to_string(succeeded) + "/" +
                        std::to_string(results.size()) + " succeeded");
        return results;
    }

    std::map<types::PrinterId, types::Result> PrintDispatcher::print(const types::PrintJob &job,
                                                                     const PrintOptions &options) {
        if (job.isBroadcast()) {
            return printToAll(job.payload, options);
        }
        return {{job.target, printTo(job.target, job.payload, options)}};
    }

    types::Result PrintDispatcher::awaitTicket(QueueTicket &ticket, const PrintOptions &options,
                                               std::optional<std::chrono::steady_clock::time_point> deadline) {
        const auto &job = ticket.pending->job;
        while (true) {
            if (ticket.result.wait_for(WAIT_SLICE) == std::future_status::ready) {
                return ticket.result.get();
            }

            std::optional<types::Result> abandon;
            if (options.cancellation && options.cancellation->isCancelled()) {
                abandon = types::Result::cancelled("Print cancelled");
            } else if (deadline && std::chrono::steady_clock::now() >= *deadline) {
                abandon = types::Result::timeout("Print timed out after " +
                                                 std::to_string(options.timeout.count()) + "ms");
            }
            if (!abandon) continue;

            ticket.pending->abandon(*abandon);
            // An outcome produced meanwhile is kept
            if (ticket.result.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
                return ticket.result.get();
            }
            return abandon->forPrinter(job.target).forJob(job.jobId);
        }
    }

    void PrintDispatcher::shutdown() {
        if (shutdown_.exchange(true)) return;

        std::unordered_map<types::PrinterId, std::shared_ptr<PrinterQueue>> queues;
        {
            std::lock_guard<std::mutex> lock(queuesMutex_);
            queues.swap(queues_);
        }
        for (auto &[printerId, queue]: queues) {
            queue->stop();
        }
        Logger::logInfo("[PrintDispatcher] Shut down " + std::to_string(queues.size()) + " queue(s)");
    }

    size_t PrintDispatcher::releaseIdleQueues() {
        size_t released = 0;
        std::lock_guard<std::mutex> lock(queuesMutex_);
        for (auto it = queues_.begin(); it != queues_.end();) {
            auto state = registry_->get(it->first).state;
            if (state == registry::ConnectionState::Connected || state == registry::ConnectionState::Connecting ||
                !it->second->stopIfIdle()) {
                ++it;
                continue;
            }
            auto stats = it->second->getStatistics();
            released_.totalEnqueued += stats.totalEnqueued;
            released_.totalTransmitted += stats.totalTransmitted;
            released_.totalFailed += stats.totalFailed;
            released_.totalExpired += stats.totalExpired;
            Logger::logInfo("[PrintDispatcher] Released idle queue for " + it->first);
            it = queues_.erase(it);
            ++released;
        }
        return released;
    }

    PrintDispatcher::Statistics PrintDispatcher::getStatistics() const {
        Statistics total;
        total.totalRejected = rejected_.load();

        std::lock_guard<std::mutex> lock(queuesMutex_);
        total.totalEnqueued = released_.totalEnqueued;
        total.totalTransmitted = released_.totalTransmitted;
        total.totalFailed = released_.totalFailed;
        total.totalExpired = released_.totalExpired;
        total.activeQueues = queues_.size();
        for (const auto &[printerId, queue]: queues_) {
            auto stats = queue->getStatistics();
            total.totalEnqueued += stats.totalEnqueued;
            total.totalTransmitted += stats.totalTransmitted;
            total.totalFailed += stats.totalFailed;
            total.totalExpired += stats.totalExpired;
            total.currentQueueSize += stats.currentQueueSize;
        }
        return total;
    }

} // namespace core::dispatch
