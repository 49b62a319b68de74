//
// Created by Andrea on 14/10/2025.
//

#include "logger/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

std::mutex Logger::sinkMutex_;
std::ofstream Logger::file_;
std::string Logger::folder_ = "logs";
size_t Logger::fileBytes_ = 0;
std::atomic<int> Logger::minimumLevel_{static_cast<int>(LogLevel::Info)};
std::atomic<bool> Logger::consoleEnabled_{true};
std::thread Logger::retentionThread_;
std::mutex Logger::retentionMutex_;
std::atomic<bool> Logger::stopping_{false};

namespace {
    constexpr size_t ROTATE_AT_BYTES = 20 * 1024 * 1024;
    constexpr size_t KEEP_FILES = 14;
    constexpr std::chrono::hours KEEP_FOR{24 * 14};
    constexpr std::chrono::hours SWEEP_EVERY{1};

    std::condition_variable retentionWake;

    const char *levelTag(LogLevel level) {
        switch (level) {
            case LogLevel::Warning:
                return "WARN ";
            case LogLevel::Error:
                return "ERROR";
            default:
                return "INFO ";
        }
    }
}

void Logger::init(const std::string &logsFolder) {
    {
        std::lock_guard<std::mutex> lock(sinkMutex_);
        folder_ = logsFolder;
        openNextFileLocked();
    }

    stopping_ = false;
    if (!retentionThread_.joinable()) {
        retentionThread_ = std::thread(&Logger::retentionLoop);
    }
    logInfo("[Logger] Writing to " + logsFolder + " (rotation at " + std::to_string(ROTATE_AT_BYTES >> 20) + "MB)");
}

void Logger::shutdown() {
    {
        std::lock_guard<std::mutex> lock(retentionMutex_);
        stopping_ = true;
    }
    retentionWake.notify_all();
    if (retentionThread_.joinable()) {
        retentionThread_.join();
    }

    std::lock_guard<std::mutex> lock(sinkMutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void Logger::logInfo(const std::string &message) {
    write(LogLevel::Info, message);
}

void Logger::logWarning(const std::string &message) {
    write(LogLevel::Warning, message);
}

void Logger::logError(const std::string &message) {
    write(LogLevel::Error, message);
}

void Logger::setMinimumLevel(LogLevel level) {
    minimumLevel_ = static_cast<int>(level);
}

void Logger::setConsoleEnabled(bool enabled) {
    consoleEnabled_ = enabled;
}

LogLevel Logger::levelFromString(const std::string &name, LogLevel fallback) {
    std::string key;
    for (char c: name) key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (key == "info" || key == "debug") return LogLevel::Info;
    if (key == "warn" || key == "warning") return LogLevel::Warning;
    if (key == "error") return LogLevel::Error;
    return fallback;
}

void Logger::write(LogLevel level, const std::string &message) {
    if (static_cast<int>(level) < minimumLevel_) return;
    if (message.find_first_not_of(" \t\r\n") == std::string::npos) return;

    const std::string line = formatNow("%Y-%m-%d %H:%M:%S", true) + " " + levelTag(level) + " " + message;

    std::lock_guard<std::mutex> lock(sinkMutex_);
    if (consoleEnabled_) {
        (level == LogLevel::Error ? std::cerr : std::cout) << line << '\n';
    }
    if (!file_.is_open()) return;

    if (fileBytes_ >= ROTATE_AT_BYTES) {
        openNextFileLocked();
        if (!file_.is_open()) return;
    }
    file_ << line << '\n';
    if (level != LogLevel::Info) file_.flush();
    fileBytes_ += line.size() + 1;
}

void Logger::openNextFileLocked() {
    if (file_.is_open()) {
        file_.close();
    }
    fileBytes_ = 0;

    std::error_code ec;
    fs::create_directories(folder_, ec);
    if (ec) {
        std::cerr << "[Logger] Cannot create " << folder_ << ": " << ec.message() << '\n';
        return;
    }

    const fs::path path = fs::path(folder_) / ("pos_printer_hub_" + formatNow("%Y%m%d_%H%M%S", false) + ".log");
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "[Logger] Cannot open " << path.string() << '\n';
    }
}

void Logger::retentionLoop() {
    std::unique_lock<std::mutex> lock(retentionMutex_);
    while (!stopping_) {
        std::string folder;
        {
            std::lock_guard<std::mutex> sinkLock(sinkMutex_);
            folder = folder_;
        }
        lock.unlock();
        pruneLogs(folder);
        lock.lock();
        retentionWake.wait_for(lock, SWEEP_EVERY, [] { return stopping_.load(); });
    }
}

void Logger::pruneLogs(const std::string &folder) {
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) return;

    struct LogFile {
        fs::path path;
        fs::file_time_type modified;
    };
    std::vector<LogFile> files;
    for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() != ".log") continue;
        std::error_code timeError;
        auto modified = fs::last_write_time(it->path(), timeError);
        if (!timeError) files.push_back({it->path(), modified});
    }

    // Newest first; everything past KEEP_FILES or older than KEEP_FOR goes
    std::sort(files.begin(), files.end(), [](const LogFile &a, const LogFile &b) {
        return a.modified > b.modified;
    });
    const auto cutoff = fs::file_time_type::clock::now() - KEEP_FOR;
    for (size_t i = 0; i < files.size(); ++i) {
        if (i >= KEEP_FILES || files[i].modified < cutoff) {
            std::error_code removeError;
            fs::remove(files[i].path, removeError);
        }
    }
}

std::string Logger::formatNow(const char *pattern, bool withMillis) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, pattern);
    if (withMillis) {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        out << '.' << std::setfill('0') << std::setw(3) << millis;
    }
    return out.str();
}
