#include "printfleet/application/controllers/ApplicationController.hpp"
#include "printfleet/application/config/ConfigManager.hpp"
#include "printfleet/camera/impl/CurlCameraStream.hpp"
#include "printfleet/device/impl/TcpPrinterSocket.hpp"
#include "printfleet/notification/impl/CurlMailTransport.hpp"
#include "printfleet/notification/impl/CurlWebhookClient.hpp"
#include "printfleet/logger/Logger.hpp"
#include <curl/curl.h>

namespace printfleet {

    ApplicationController::ApplicationController(std::string configPath)
            : configPath_(std::move(configPath)) {
    }

    ApplicationController::~ApplicationController() {
        shutdown();
        if (curlInitialized_) {
            curl_global_cleanup();
        }
    }

    bool ApplicationController::initialize() {
        Logger::logInfo("===============================================");
        Logger::logInfo("[ApplicationController] STARTING PRINTFLEET");
        Logger::logInfo("===============================================");

        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            Logger::logError("[ApplicationController] libcurl initialization FAILED");
            return false;
        }
        curlInitialized_ = true;

        Logger::logInfo("[ApplicationController] [1/4] Loading configuration...");
        if (!initializeConfiguration()) {
            Logger::logError("[ApplicationController] Configuration FAILED");
            return false;
        }

        Logger::logInfo("[ApplicationController] [2/4] Registering printers...");
        if (!initializeRegistry()) {
            Logger::logError("[ApplicationController] Registry initialization FAILED");
            return false;
        }

        Logger::logInfo("[ApplicationController] [3/4] Setting up notifications...");
        if (!initializeNotifications()) {
            Logger::logError("[ApplicationController] Notification setup FAILED");
            return false;
        }

        Logger::logInfo("[ApplicationController] [4/4] Starting printer watcher...");
        watcher_ = std::make_unique<registry::PrinterWatcher>(
                registry_, dispatcher_, config::ConfigManager::getInstance().getWatcherConfig());
        watcher_->start();

        printerService_ = std::make_shared<service::PrinterService>(registry_);

        printInitializationSummary();
        isRunning_ = true;
        return true;
    }

    void ApplicationController::shutdown() {
        if (!isRunning_) {
            return;
        }
        isRunning_ = false;

        Logger::logInfo("[ApplicationController] Shutting down...");

        if (watcher_) {
            watcher_->stop();
            watcher_.reset();
        }

        printerService_.reset();
        dispatcher_.reset();

        // Releasing the registry drops the clients and joins their camera threads
        registry_.reset();
        cameraSource_.reset();

        Logger::logInfo("[ApplicationController] Shutdown complete");
    }

    bool ApplicationController::initializeConfiguration() {
        auto &config = config::ConfigManager::getInstance();
        config.loadFromFile(configPath_);
        config.loadFromEnv();

        Logger::setDebugEnabled(config.isDebugLoggingEnabled());

        auto validation = config.validate();
        if (!validation.isValid) {
            for (const auto &error: validation.errors) {
                Logger::logError("[ApplicationController] Config: " + error);
            }
            return false;
        }
        return true;
    }

    bool ApplicationController::initializeRegistry() {
        auto &config = config::ConfigManager::getInstance();
        auto deviceSettings = config.getDeviceConfig();
        auto cameraSettings = config.getCameraConfig();

        cameraSource_ = std::make_shared<camera::CurlCameraStream>();
        auto cameraSource = cameraSource_;

        registry_ = std::make_shared<registry::DeviceRegistry>(
                [deviceSettings, cameraSettings, cameraSource](const std::string &id, const std::string &host) {
                    auto camera = std::make_shared<camera::CameraMultiplexer>(
                            id, cameraSettings.streamUrl(host), cameraSource, cameraSettings);
                    return std::make_shared<device::DeviceClient>(
                            id, host, deviceSettings,
                            []() { return std::make_unique<device::TcpPrinterSocket>(); },
                            camera);
                });

        for (const auto &[id, host]: config.getPrinters()) {
            if (!registry_->addDevice(id, host)) {
                Logger::logWarning("[ApplicationController] Printer " + id + " not registered");
            }
        }

        return registry_->size() > 0;
    }

    bool ApplicationController::initializeNotifications() {
        auto &config = config::ConfigManager::getInstance();

        std::map<notification::EventKind, notification::NotificationDestinations> destinations;
        if (auto done = config.getNotificationDestinations(notification::EventKind::PrintComplete)) {
            destinations[notification::EventKind::PrintComplete] = *done;
        }

        std::shared_ptr<notification::IMailTransport> mailTransport;
        std::string fromAddress;
        if (auto smtp = config.getSmtpConfig()) {
            fromAddress = smtp->user;
            mailTransport = std::make_shared<notification::CurlMailTransport>(*smtp);
            Logger::logInfo("[ApplicationController] SMTP enabled via " + smtp->host);
        } else {
            Logger::logInfo("[ApplicationController] SMTP disabled");
        }

        dispatcher_ = std::make_shared<notification::NotificationDispatcher>(
                std::move(destinations), fromAddress, mailTransport,
                std::make_shared<notification::CurlWebhookClient>());
        return true;
    }

    void ApplicationController::printInitializationSummary() const {
        auto &config = config::ConfigManager::getInstance();
        auto destinations = config.getNotificationDestinations(notification::EventKind::PrintComplete);

        Logger::logInfo("===============================================");
        Logger::logInfo("[ApplicationController] INITIALIZATION SUMMARY");
        Logger::logInfo("===============================================");
        Logger::logInfo("  Printers:");
        for (const auto &summary: printerService_->listSummaries()) {
            Logger::logInfo("    " + summary.id + ": " + summary.name +
                            (summary.firmwareVersion ? " (firmware " + *summary.firmwareVersion + ")" : ""));
        }
        Logger::logInfo("  Notifications (on_done):");
        Logger::logInfo("    Emails: " + std::to_string(destinations ? destinations->emails.size() : 0));
        Logger::logInfo("    Webhooks: " + std::to_string(destinations ? destinations->webhooks.size() : 0));
        Logger::logInfo("  Watcher interval: " +
                        std::to_string(config.getWatcherConfig().interval.count() / 1000) + " s");
        Logger::logInfo("===============================================");
    }

} // namespace printfleet
