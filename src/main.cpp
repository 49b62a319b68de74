#include "application/controllers/ApplicationController.hpp"
#include "logger/Logger.hpp"
#include <chrono>
#include <csignal>
#include <thread>

namespace {
    volatile std::sig_atomic_t stopRequested = 0;

    void onStopSignal(int) {
        stopRequested = 1;
    }
}

int main(int argc, char *argv[]) {
    Logger::init("logs");
    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);

    int status = 0;
    try {
        ApplicationController app(argc > 1 ? argv[1] : "config.json");
        if (app.initialize()) {
            while (stopRequested == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(250));
            }
            Logger::logInfo("[main] Stop signal received");
            app.shutdown();
        } else {
            Logger::logError("[main] Hub could not start");
            status = 1;
        }
    } catch (const std::exception &e) {
        Logger::logError("[main] Fatal: " + std::string(e.what()));
        status = 1;
    }

    Logger::shutdown();
    return status;
}
