#pragma once

#include "printfleet/notification/INotifier.hpp"
#include "printfleet/registry/DeviceRegistry.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace printfleet::registry {

    struct WatcherSettings {
        std::chrono::milliseconds interval{std::chrono::seconds(60)};
    };

    /**
     * @brief Background poller that detects finished prints.
     *
     * Every interval (the first tick also waits one interval) each device's status and progress
     * are polled. A completed job triggers one notification per device and file, deduplicated
     * through the registry's ledger.
     */
    class PrinterWatcher {
    public:
        struct Statistics {
            uint64_t ticks = 0;
            uint64_t devicesPolled = 0;
            uint64_t devicesSkipped = 0;
            uint64_t notificationsSent = 0;
        };

        PrinterWatcher(std::shared_ptr<DeviceRegistry> registry,
                       std::shared_ptr<notification::INotifier> notifier,
                       WatcherSettings settings = {});

        ~PrinterWatcher();

        void start();

        void stop();

        bool isRunning() const;

        /**
         * @brief Runs one polling pass over every device.
         *
         * Passes are serialized: a call made while another pass is running waits for it and then
         * sees the ledger that pass committed.
         * @return Number of completion notifications dispatched
         */
        size_t tick();

        Statistics getStatistics() const;

    private:
        std::shared_ptr<DeviceRegistry> registry_;
        std::shared_ptr<notification::INotifier> notifier_;
        const WatcherSettings settings_;

        std::atomic<bool> running_{false};
        std::thread watchThread_;
        std::mutex waitMutex_;
        std::condition_variable waitCv_;

        // Held from the ledger snapshot to the commit
        std::mutex tickMutex_;

        mutable std::mutex statsMutex_;
        Statistics stats_;

        void watchLoop();

        /**
         * @brief Polls one device under its session lock.
         * @return The file of a job that has just completed, if any
         */
        std::optional<std::string> pollDevice(device::DeviceClient &device);
    };

} // namespace printfleet::registry
