#pragma once

#include "printfleet/camera/CameraStreamSource.hpp"
#include "printfleet/notification/NotificationDispatcher.hpp"
#include "printfleet/registry/DeviceRegistry.hpp"
#include "printfleet/registry/PrinterWatcher.hpp"
#include "printfleet/service/PrinterService.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace printfleet {

    /**
     * @class ApplicationController
     * @brief Wires the printer fleet monitor together and owns its lifetime.
     *
     * Initialization sequence:
     * 1. Configuration (file, then environment overrides)
     * 2. Device registry with one client and camera per configured printer
     * 3. Notification transports and dispatcher
     * 4. Printer watcher
     *
     * Shutdown stops the components in reverse order.
     */
    class ApplicationController {
    public:
        explicit ApplicationController(std::string configPath = "config.json");

        ~ApplicationController();

        /**
         * @return true if initialization successful, false otherwise
         */
        bool initialize();

        void shutdown();

        std::shared_ptr<service::PrinterService> printerService() const { return printerService_; }

    private:
        const std::string configPath_;

        std::shared_ptr<camera::CameraStreamSource> cameraSource_;
        std::shared_ptr<registry::DeviceRegistry> registry_;
        std::shared_ptr<notification::NotificationDispatcher> dispatcher_;
        std::unique_ptr<registry::PrinterWatcher> watcher_;
        std::shared_ptr<service::PrinterService> printerService_;

        std::atomic<bool> isRunning_{false};
        bool curlInitialized_ = false;

        bool initializeConfiguration();

        bool initializeRegistry();

        bool initializeNotifications();

        void printInitializationSummary() const;
    };

} // namespace printfleet
