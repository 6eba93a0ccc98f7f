#pragma once

#include "printfleet/camera/CameraMultiplexer.hpp"
#include "printfleet/device/DeviceClient.hpp"
#include "printfleet/notification/EventKind.hpp"
#include "printfleet/notification/NotificationMessage.hpp"
#include "printfleet/notification/SmtpSettings.hpp"
#include "printfleet/registry/PrinterWatcher.hpp"
#include "printfleet/logger/Logger.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace printfleet::config {

    class ConfigManager {
    public:
        static ConfigManager &getInstance();

        // Load configuration
        void loadFromFile(const std::string &configPath = "config.json");

        /**
         * @brief Replaces the whole configuration with the given JSON document.
         * @throws nlohmann::json::parse_error on malformed input
         */
        void loadFromJson(const std::string &content);

        void loadFromEnv();

        // Configuration access
        device::ConnectionSettings getDeviceConfig() const;

        camera::CameraSettings getCameraConfig() const;

        registry::WatcherSettings getWatcherConfig() const;

        /**
         * @brief SMTP settings, if present and valid.
         *
         * An incomplete section (missing host or user, port 0, unknown encryption) is logged as an
         * error and email delivery stays disabled.
         */
        std::optional<notification::SmtpSettings> getSmtpConfig() const;

        /**
         * @brief Device id -> printer address, from the "printers" section.
         */
        std::map<std::string, std::string> getPrinters() const;

        std::optional<notification::NotificationDestinations>
        getNotificationDestinations(notification::EventKind kind) const;

        bool isDebugLoggingEnabled() const;

        // Generic getters with defaults
        template<typename T>
        T get(const std::string &key, const T &defaultValue) const;

        // Validation
        struct ValidationResult {
            bool isValid = true;
            std::vector<std::string> errors;
        };

        ValidationResult validate() const;

    private:
        ConfigManager() = default;

        mutable std::mutex configMutex_;
        std::unordered_map<std::string, std::string> config_;
        nlohmann::json document_ = nlohmann::json::object();
        std::string configPath_;

        void applyDocument(const nlohmann::json &json);

        void setDefaults();

        static std::optional<notification::SmtpEncryption> parseEncryption(const std::string &value);
    };

    // Template specializations
    template<>
    inline int ConfigManager::get<int>(const std::string &key, const int &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stoi(it->second);
        } catch (const std::exception &) {
            Logger::logWarning("[ConfigManager] Invalid integer for " + key + ": " + it->second);
            return defaultValue;
        }
    }

    template<>
    inline std::string ConfigManager::get<std::string>(const std::string &key, const std::string &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        return (it != config_.end()) ? it->second : defaultValue;
    }

    template<>
    inline bool ConfigManager::get<bool>(const std::string &key, const bool &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        return it->second == "true" || it->second == "1";
    }

    template<>
    inline double ConfigManager::get<double>(const std::string &key, const double &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stod(it->second);
        } catch (const std::exception &) {
            Logger::logWarning("[ConfigManager] Invalid number for " + key + ": " + it->second);
            return defaultValue;
        }
    }
} // namespace printfleet::config
