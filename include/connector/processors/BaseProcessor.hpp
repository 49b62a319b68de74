#pragma once

#include <string>

namespace connector::processors {

    /**
     * @brief Turns one raw inbound message into engine calls and the matching response.
     */
    class BaseProcessor {
    public:
        enum class Outcome {
            Processed,  // executed, response sent
            Ignored,    // addressed to another hub
            Rejected    // malformed or invalid, error response sent when possible
        };

        virtual ~BaseProcessor() = default;

        virtual Outcome processMessage(const std::string &message) = 0;

        virtual std::string getProcessorName() const = 0;

        virtual bool isReady() const = 0;
    };

} // namespace connector::processors
