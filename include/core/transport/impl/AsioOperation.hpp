#pragma once

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>

namespace core::transport::asio_support {

    struct OperationOutcome {
        bool timedOut = false;
        boost::system::error_code ec;
    };

    /**
     * @brief Runs one asynchronous operation on a private io_context, bounded by timeout.
     *
     * initiate receives a completion callback taking the error code. On expiry cancel is
     * invoked and the aborted handler is drained before returning, so no handler outlives the
     * call. A zero timeout waits without bound.
     */
    template<typename Initiate, typename Cancel>
    OperationOutcome runWithTimeout(boost::asio::io_context &io, std::chrono::milliseconds timeout,
                                    Initiate &&initiate, Cancel &&cancel) {
        OperationOutcome outcome;
        bool completed = false;

        io.restart();
        initiate([&outcome, &completed](const boost::system::error_code &ec) {
            outcome.ec = ec;
            completed = true;
        });

        if (timeout.count() > 0) {
            io.run_for(timeout);
        } else {
            io.run();
        }

        if (!completed) {
            outcome.timedOut = true;
            cancel();
            io.restart();
            io.run();
        }
        return outcome;
    }

}
