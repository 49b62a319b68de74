#pragma once

#include <atomic>
#include <memory>

namespace core::types {

    /**
     * @brief Caller-owned flag shared with a batch call. Tripping it resolves every outcome
     * that is still pending as Cancelled; outcomes already produced are kept.
     */
    class CancellationToken {
    public:
        static std::shared_ptr<CancellationToken> create() {
            return std::make_shared<CancellationToken>();
        }

        void cancel() { cancelled_ = true; }

        bool isCancelled() const { return cancelled_.load(); }

    private:
        std::atomic<bool> cancelled_{false};
    };

}
