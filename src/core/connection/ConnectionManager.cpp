//
// Created by Andrea on 16/10/2025.
//

#include "core/connection/ConnectionManager.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <future>
#include <thread>

namespace core::connection {

    namespace {
        constexpr std::chrono::milliseconds WAIT_SLICE{20};

        std::optional<std::chrono::steady_clock::time_point> deadlineFor(const ConnectOptions &options) {
            if (options.timeout.count() <= 0) return std::nullopt;
            return std::chrono::steady_clock::now() + options.timeout;
        }

        bool isCancelled(const ConnectOptions &options) {
            return options.cancellation && options.cancellation->isCancelled();
        }
    }

    ConnectionManager::ConnectionManager(std::shared_ptr<registry::ConnectionRegistry> registry,
                                         std::shared_ptr<transport::TransportDriver> driver)
            : registry_(std::move(registry)), driver_(std::move(driver)) {
        if (!registry_) {
            throw std::invalid_argument("ConnectionRegistry cannot be null");
        }
        if (!driver_) {
            throw std::invalid_argument("TransportDriver cannot be null");
        }
    }

    types::Result ConnectionManager::connect(const types::PrinterConfiguration &config,
                                             const ConnectOptions &options) {
        const auto deadline = deadlineFor(options);
        const types::PrinterId printerId = config.id;

        if (!config.isValid()) {
            auto refused = types::Result::connectFailed("Invalid printer configuration").forPrinter(printerId);
            registry_->recordFailure(printerId, refused);
            return refused;
        }
        if (isCancelled(options)) {
            auto cancelled = types::Result::cancelled().forPrinter(printerId);
            if (registry_->recordFailure(printerId, cancelled)) {
                return cancelled;
            }
            // Not Idle: a live connection short-circuits below, an attempt in flight is awaited
        }

        auto attempt = registry_->beginConnect(printerId);
        if (attempt.outcome == registry::ConnectionRegistry::BeginOutcome::AlreadyConnected) {
            Logger::logInfo("[ConnectionManager] " + printerId + " already connected");
            return types::Result::alreadyConnected().forPrinter(printerId);
        }
        if (attempt.outcome == registry::ConnectionRegistry::BeginOutcome::InProgress) {
            return awaitExistingAttempt(printerId, options, deadline);
        }
        if (isCancelled(options)) {
            auto cancelled = types::Result::cancelled().forPrinter(printerId);
            registry_->failConnect(printerId, attempt.attemptId, cancelled);
            return cancelled;
        }

        Logger::logInfo("[ConnectionManager] Connecting " + printerId + " (" + config.name + ") via " +
                        types::transportKindToString(config.kind) + " at " + config.address);

        // The open runs detached so an expired deadline can return immediately; a late handle is
        // closed by the opener itself once the registry rejects the stale attempt.
        auto promise = std::make_shared<std::promise<types::Result>>();
        auto future = promise->get_future();
        const uint64_t attemptId = attempt.attemptId;

        std::thread([registry = registry_, driver = driver_, config, attemptId, promise]() {
            types::Result result;
            try {
                auto handle = driver->open(config);
                if (registry->completeConnect(config.id, attemptId, handle)) {
                    result = types::Result::success("Connected to " + config.address);
                } else {
                    Logger::logWarning("[ConnectionManager] Late connection to " + config.id +
                                       " discarded (attempt abandoned)");
                    driver->close(*handle);
                    result = types::Result::timeout("Connection completed after the attempt was abandoned");
                }
            } catch (const types::PrinterException &e) {
                result = types::Result::connectFailed(e.what());
                registry->failConnect(config.id, attemptId, result);
            } catch (const std::exception &e) {
                result = types::Result::connectFailed(std::string("Unexpected error: ") + e.what());
                registry->failConnect(config.id, attemptId, result);
            }
            promise->set_value(result.forPrinter(config.id));
        }).detach();

        while (true) {
            if (future.wait_for(WAIT_SLICE) == std::future_status::ready) {
                return future.get();
            }

            std::optional<types::Result> abandon;
            if (isCancelled(options)) {
                abandon = types::Result::cancelled("Connect cancelled");
            } else if (deadline && std::chrono::steady_clock::now() >= *deadline) {
                abandon = types::Result::timeout("Connect timed out after " +
                                                 std::to_string(options.timeout.count()) + "ms");
            }
            if (!abandon) continue;

            if (registry_->failConnect(printerId, attemptId, *abandon)) {
                return abandon->forPrinter(printerId);
            }
            // The opener resolved the attempt between our checks; its outcome stands
            return future.get();
        }
    }

    types::Result ConnectionManager::awaitExistingAttempt(
            const types::PrinterId &printerId, const ConnectOptions &options,
            std::optional<std::chrono::steady_clock::time_point> deadline) {
        Logger::logInfo("[ConnectionManager] " + printerId + " is already connecting, waiting for that attempt");

        while (true) {
            auto slice = std::chrono::steady_clock::now() + WAIT_SLICE;
            if (deadline && *deadline < slice) slice = *deadline;

            auto snapshot = registry_->waitWhileConnecting(printerId, slice);
            if (snapshot.isConnected()) {
                return types::Result::alreadyConnected().forPrinter(printerId);
            }
            if (snapshot.state == registry::ConnectionState::Idle) {
                types::Result error = snapshot.lastError.value_or(
                        types::Result::connectFailed("Concurrent connect attempt failed"));
                return error.forPrinter(printerId);
            }
            if (isCancelled(options)) {
                return types::Result::cancelled("Connect cancelled").forPrinter(printerId);
            }
            if (deadline && std::chrono::steady_clock::now() >= *deadline) {
                return types::Result::timeout("Timed out waiting for concurrent connect").forPrinter(printerId);
            }
        }
    }

    std::map<types::PrinterId, types::Result> ConnectionManager::connectManyDetailed(
            const std::vector<types::PrinterConfiguration> &configs, const ConnectOptions &options) {
        Logger::logInfo("[ConnectionManager] Connecting batch of " + std::to_string(configs.size()) + " printer(s)");

        std::vector<std::pair<types::PrinterId, std::future<types::Result>>> futures;
        futures.reserve(configs.size());
        for (const auto &config: configs) {
            futures.emplace_back(config.id, std::async(std::launch::async, [this, config, options]() {
                return connect(config, options);
            }));
        }

        std::map<types::PrinterId, types::Result> results;
        size_t connected = 0;
        for (auto &[printerId, future]: futures) {
            types::Result result;
            try {
                result = future.get();
            } catch (const std::exception &e) {
                result = types::Result::connectFailed(e.what()).forPrinter(printerId);
            }
            if (result.isSuccess()) connected++;

            auto existing = results.find(printerId);
            // Duplicate identities in one batch: a success from either attempt wins
            if (existing == results.end() || (!existing->second.isSuccess() && result.isSuccess())) {
                results[printerId] = result;
            }
        }

        Logger::logInfo("[ConnectionManager] Batch complete: " + std::to_string(connected) + "/" +
                        std::to_string(configs.size()) + " connected");
        return results;
    }

    std::map<types::PrinterId, bool> ConnectionManager::connectMany(
            const std::vector<types::PrinterConfiguration> &configs, const ConnectOptions &options) {
        std::map<types::PrinterId, bool> outcome;
        for (const auto &[printerId, result]: connectManyDetailed(configs, options)) {
            outcome[printerId] = result.isSuccess();
        }
        return outcome;
    }

    bool ConnectionManager::disconnect(const types::PrinterId &printerId) {
        auto lease = registry_->lease(printerId);
        if (!lease) {
            Logger::logInfo("[ConnectionManager] Disconnect " + printerId + ": was not connected");
            return false;
        }

        auto handle = lease.release();
        if (!handle) {
            return false;
        }

        try {
            driver_->close(*handle);
        } catch (const std::exception &e) {
            Logger::logWarning("[ConnectionManager] Error closing " + printerId + ": " + e.what());
        }
        Logger::logInfo("[ConnectionManager] Disconnected " + printerId);
        return true;
    }

    size_t ConnectionManager::disconnectAll() {
        size_t count = 0;
        for (const auto &printerId: registry_->connectedPrinters()) {
            if (disconnect(printerId)) count++;
        }
        return count;
    }

} // namespace core::connection
