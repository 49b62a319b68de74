//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>

enum class LogLevel {
    Info = 0,
    Warning = 1,
    Error = 2
};

/**
 * @brief Process-wide log sink: console echo plus a size-rotated file under a logs folder.
 *
 * Messages carry their component as a "[Component] " prefix. Logging before init() goes to
 * the console only.
 */
class Logger {
public:
    /**
     * @brief Opens a fresh log file in logsFolder and starts the hourly retention sweep.
     */
    static void init(const std::string &logsFolder = "logs");

    static void shutdown();

    static void logInfo(const std::string &message);

    static void logWarning(const std::string &message);

    static void logError(const std::string &message);

    // Messages below level are dropped from every sink
    static void setMinimumLevel(LogLevel level);

    // Used by the test runners; the file sink is unaffected
    static void setConsoleEnabled(bool enabled);

    static LogLevel levelFromString(const std::string &name, LogLevel fallback = LogLevel::Info);

private:
    static std::mutex sinkMutex_;
    static std::ofstream file_;
    static std::string folder_;
    static size_t fileBytes_;
    static std::atomic<int> minimumLevel_;
    static std::atomic<bool> consoleEnabled_;

    static std::thread retentionThread_;
    static std::mutex retentionMutex_;
    static std::atomic<bool> stopping_;

    static void write(LogLevel level, const std::string &message);

    static void openNextFileLocked();

    static void retentionLoop();

    static void pruneLogs(const std::string &folder);

    static std::string formatNow(const char *pattern, bool withMillis);
};
