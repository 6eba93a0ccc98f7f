#include "printfleet/registry/PrinterWatcher.hpp"
#include "printfleet/logger/Logger.hpp"

namespace printfleet::registry {

    PrinterWatcher::PrinterWatcher(std::shared_ptr<DeviceRegistry> registry,
                                   std::shared_ptr<notification::INotifier> notifier,
                                   WatcherSettings settings)
            : registry_(std::move(registry)), notifier_(std::move(notifier)), settings_(settings) {
    }

    PrinterWatcher::~PrinterWatcher() {
        stop();
    }

    void PrinterWatcher::start() {
        if (running_) {
            Logger::logWarning("[PrinterWatcher] Already running");
            return;
        }

        running_ = true;
        watchThread_ = std::thread([this]() {
            try {
                watchLoop();
            } catch (const std::exception &e) {
                Logger::logError("[PrinterWatcher] Watch thread crashed: " + std::string(e.what()));
            }
        });

        Logger::logInfo("[PrinterWatcher] Started, interval " + std::to_string(settings_.interval.count()) + " ms");
    }

    void PrinterWatcher::stop() {
        if (!running_) return;

        {
            std::lock_guard<std::mutex> lock(waitMutex_);
            running_ = false;
        }
        waitCv_.notify_all();

        if (watchThread_.joinable()) {
            watchThread_.join();
        }

        Logger::logInfo("[PrinterWatcher] Stopped");
    }

    bool PrinterWatcher::isRunning() const {
        return running_;
    }

    void PrinterWatcher::watchLoop() {
        while (true) {
            {
                std::unique_lock<std::mutex> lock(waitMutex_);
                if (waitCv_.wait_for(lock, settings_.interval, [this] { return !running_; })) {
                    break;
                }
            }

            try {
                tick();
            } catch (const std::exception &e) {
                Logger::logError("[PrinterWatcher] Tick error: " + std::string(e.what()));
            }
        }
    }

    size_t PrinterWatcher::tick() {
        std::lock_guard<std::mutex> tickLock(tickMutex_);

        auto devices = registry_->listDevices();
        auto ledger = registry_->ledgerSnapshot();
        size_t dispatched = 0;
        uint64_t skipped = 0;

        Logger::logDebug("[PrinterWatcher] Checking " + std::to_string(devices.size()) + " printers");

        for (const auto &device: devices) {
            auto completedFile = pollDevice(*device);
            if (!completedFile) {
                skipped++;
                continue;
            }
            if (!ledger.shouldNotify(device->id(), *completedFile)) {
                continue;
            }

            Logger::logInfo("[PrinterWatcher] " + device->id() + " finished " + *completedFile);
            if (notifier_) {
                try {
                    auto report = notifier_->notify(*device, notification::EventKind::PrintComplete,
                                                   completedFile);
                    if (report.failed() > 0) {
                        Logger::logWarning("[PrinterWatcher] " + std::to_string(report.failed()) +
                                           " destinations failed for " + device->id());
                    }
                } catch (const std::exception &e) {
                    Logger::logError("[PrinterWatcher] Notification for " + device->id() + " failed: " + e.what());
                }
            }

            // Recorded whatever the outcome, so a failed delivery is not repeated every tick
            ledger.record(device->id(), *completedFile);
            dispatched++;
        }

        registry_->commitLedger(std::move(ledger));

        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.ticks++;
        stats_.devicesPolled += devices.size();
        stats_.devicesSkipped += skipped;
        stats_.notificationsSent += dispatched;
        return dispatched;
    }

    std::optional<std::string> PrinterWatcher::pollDevice(device::DeviceClient &device) {
        auto session = device.lockSession();

        auto status = device.refreshStatus();
        if (!status.isSuccess()) {
            Logger::logDebug("[PrinterWatcher] " + device.id() + " offline: " + status.message);
            return std::nullopt;
        }
        if (!status.get().currentFile) {
            return std::nullopt;
        }

        auto progress = device.getProgress();
        if (!progress.isSuccess()) {
            Logger::logWarning("[PrinterWatcher] " + device.id() + " progress unavailable: " + progress.message);
            return std::nullopt;
        }

        if (!progress.get().isLayerComplete()) {
            return std::nullopt;
        }
        return status.get().currentFile;
    }

    PrinterWatcher::Statistics PrinterWatcher::getStatistics() const {
        std::lock_guard<std::mutex> lock(statsMutex_);
        return stats_;
    }

} // namespace printfleet::registry
