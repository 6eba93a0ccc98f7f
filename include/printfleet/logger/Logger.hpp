#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>

namespace printfleet {

    enum class LogLevel {
        Debug,
        Info,
        Warning,
        Error
    };

    /**
     * @brief Process-wide logger writing to the console and to a rotating file.
     *
     * Until init() is called only the console is written, which is what the tests rely on.
     * Debug messages are dropped unless enabled at runtime.
     */
    class Logger {
    public:
        /**
         * @brief Opens a fresh log file under `logsFolder` and starts the retention sweeper.
         */
        static void init(const std::string &logsFolder = "logs");

        static void shutdown();

        static void setDebugEnabled(bool enabled);

        static bool isDebugEnabled();

        static void logDebug(const std::string &message);

        static void logInfo(const std::string &message);

        static void logWarning(const std::string &message);

        static void logError(const std::string &message);

        static const char *levelName(LogLevel level);

    private:
        static std::mutex mutex_;
        static std::ofstream file_;
        static std::string folder_;
        static size_t fileSize_;
        static std::atomic<bool> debugEnabled_;

        static std::thread sweeper_;
        static std::mutex sweeperMutex_;
        static std::condition_variable sweeperWakeup_;
        static bool sweeperStop_;

        static void write(LogLevel level, const std::string &message);

        static void openNewFile();

        static void sweepLoop();

        static void removeExpiredFiles();

        static std::string formatNow(const char *pattern, bool withMillis);
    };

} // namespace printfleet
