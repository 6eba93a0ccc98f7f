#include "printfleet/logger/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace printfleet {

    std::mutex Logger::mutex_;
    std::ofstream Logger::file_;
    std::string Logger::folder_ = "logs";
    size_t Logger::fileSize_ = 0;
    std::atomic<bool> Logger::debugEnabled_{false};

    std::thread Logger::sweeper_;
    std::mutex Logger::sweeperMutex_;
    std::condition_variable Logger::sweeperWakeup_;
    bool Logger::sweeperStop_ = false;

    namespace {
        constexpr size_t ROTATE_AFTER_BYTES = 50 * 1024 * 1024;
        constexpr size_t KEEP_FILES = 10;
        constexpr auto KEEP_FOR = std::chrono::hours(24 * 7);
        constexpr auto SWEEP_EVERY = std::chrono::hours(1);
        constexpr const char *FILE_PREFIX = "printfleet_";
    }

    void Logger::init(const std::string &logsFolder) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            folder_ = logsFolder;
            openNewFile();
        }

        {
            std::lock_guard<std::mutex> lock(sweeperMutex_);
            sweeperStop_ = false;
        }
        if (!sweeper_.joinable()) {
            sweeper_ = std::thread(&Logger::sweepLoop);
        }

        logInfo("[Logger] Writing to " + folder_ + ", rotating every " +
                std::to_string(ROTATE_AFTER_BYTES / (1024 * 1024)) + " MB");
    }

    void Logger::shutdown() {
        {
            std::lock_guard<std::mutex> lock(sweeperMutex_);
            sweeperStop_ = true;
        }
        sweeperWakeup_.notify_all();
        if (sweeper_.joinable()) {
            sweeper_.join();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) {
            file_.close();
        }
    }

    void Logger::setDebugEnabled(bool enabled) {
        debugEnabled_ = enabled;
    }

    bool Logger::isDebugEnabled() {
        return debugEnabled_;
    }

    void Logger::logDebug(const std::string &message) {
        if (debugEnabled_) {
            write(LogLevel::Debug, message);
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

    const char *Logger::levelName(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warning: return "WARNING";
            case LogLevel::Error: return "ERROR";
        }
        return "UNKNOWN";
    }

    void Logger::write(LogLevel level, const std::string &message) {
        if (message.find_first_not_of(" \t\r\n") == std::string::npos) {
            return;
        }

        std::string line = std::string("[") + levelName(level) + "] [" + formatNow("%Y-%m-%d %H:%M:%S", true) +
                           "] " + message;

        std::lock_guard<std::mutex> lock(mutex_);
        (level == LogLevel::Error ? std::cerr : std::cout) << line << '\n';

        if (!file_.is_open()) {
            return;
        }
        if (fileSize_ > ROTATE_AFTER_BYTES) {
            openNewFile();
        }
        file_ << line << '\n';
        file_.flush();
        fileSize_ += line.size() + 1;
    }

    void Logger::openNewFile() {
        if (file_.is_open()) {
            file_.close();
        }
        fileSize_ = 0;

        std::error_code ec;
        fs::create_directories(folder_, ec);

        std::string path = folder_ + "/" + FILE_PREFIX + formatNow("%Y%m%d_%H%M%S", false) + ".log";
        file_.open(path, std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            std::cerr << "[Logger] Cannot open log file " << path << ", logging to console only" << std::endl;
        }
    }

    void Logger::sweepLoop() {
        std::unique_lock<std::mutex> lock(sweeperMutex_);
        while (!sweeperStop_) {
            lock.unlock();
            removeExpiredFiles();
            lock.lock();
            sweeperWakeup_.wait_for(lock, SWEEP_EVERY, [] { return sweeperStop_; });
        }
    }

    void Logger::removeExpiredFiles() {
        std::string folder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            folder = folder_;
        }

        try {
            if (!fs::is_directory(folder)) return;

            auto cutoff = fs::file_time_type::clock::now() - KEEP_FOR;
            std::vector<fs::directory_entry> kept;

            for (const auto &entry: fs::directory_iterator(folder)) {
                const auto name = entry.path().filename().string();
                if (name.rfind(FILE_PREFIX, 0) != 0 || entry.path().extension() != ".log") {
                    continue;
                }
                if (entry.last_write_time() < cutoff) {
                    fs::remove(entry.path());
                } else {
                    kept.push_back(entry);
                }
            }

            if (kept.size() <= KEEP_FILES) return;

            // Oldest first
            std::sort(kept.begin(), kept.end(), [](const fs::directory_entry &a, const fs::directory_entry &b) {
                return a.last_write_time() < b.last_write_time();
            });
            for (size_t i = 0; i + KEEP_FILES < kept.size(); ++i) {
                fs::remove(kept[i].path());
            }
        } catch (const fs::filesystem_error &e) {
            std::cerr << "[Logger] Log cleanup failed: " << e.what() << std::endl;
        }
    }

    std::string Logger::formatNow(const char *pattern, bool withMillis) {
        auto now = std::chrono::system_clock::now();
        std::time_t seconds = std::chrono::system_clock::to_time_t(now);
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

} // namespace printfleet
