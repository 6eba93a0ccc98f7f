#include "printfleet/application/config/ConfigManager.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>

namespace printfleet::config {

    namespace {
        constexpr const char *ENV_PREFIX = "PRINTFLEET_";
    }

    ConfigManager &ConfigManager::getInstance() {
        static ConfigManager instance;
        return instance;
    }

    void ConfigManager::loadFromFile(const std::string &configPath) {
        if (!std::filesystem::exists(configPath)) {
            Logger::logWarning("[ConfigManager] Config file not found: " + configPath + ", using defaults");
            std::lock_guard<std::mutex> lock(configMutex_);
            configPath_ = configPath;
            setDefaults();
            return;
        }

        try {
            std::ifstream file(configPath);
            nlohmann::json json = nlohmann::json::parse(file);

            std::lock_guard<std::mutex> lock(configMutex_);
            configPath_ = configPath;
            applyDocument(json);

            Logger::logInfo(
                    "[ConfigManager] Loaded " + std::to_string(config_.size()) + " settings from " + configPath);
        } catch (const std::exception &e) {
            Logger::logError("[ConfigManager] Failed to load config: " + std::string(e.what()));
            std::lock_guard<std::mutex> lock(configMutex_);
            setDefaults();
        }
    }

    void ConfigManager::loadFromJson(const std::string &content) {
        nlohmann::json json = nlohmann::json::parse(content);

        std::lock_guard<std::mutex> lock(configMutex_);
        configPath_.clear();
        applyDocument(json);
    }

    void ConfigManager::applyDocument(const nlohmann::json &json) {
        setDefaults();
        document_ = json.is_object() ? json : nlohmann::json::object();

        // Flatten JSON into key-value pairs
        std::function<void(const nlohmann::json &, const std::string &)> flatten;
        flatten = [&](const nlohmann::json &obj, const std::string &prefix) {
            for (auto it = obj.begin(); it != obj.end(); ++it) {
                std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

                if (it.value().is_object()) {
                    flatten(it.value(), key);
                } else if (it.value().is_string()) {
                    config_[key] = it.value().get<std::string>();
                } else if (!it.value().is_array()) {
                    config_[key] = it.value().dump();
                }
            }
        };

        flatten(document_, "");
    }

    void ConfigManager::loadFromEnv() {
        std::lock_guard<std::mutex> lock(configMutex_);

        const char *envVars[] = {
                "PRINTFLEET_DEVICE_PORT", "PRINTFLEET_DEVICE_CONNECT_TIMEOUT_MS",
                "PRINTFLEET_DEVICE_WRITE_TIMEOUT_MS", "PRINTFLEET_DEVICE_READ_TIMEOUT_MS",
                "PRINTFLEET_CAMERA_PORT", "PRINTFLEET_CAMERA_PATH", "PRINTFLEET_CAMERA_BOUNDARY",
                "PRINTFLEET_CAMERA_CAPACITY", "PRINTFLEET_CAMERA_SNAPSHOT_TIMEOUT_MS",
                "PRINTFLEET_WATCHER_INTERVAL_SECONDS", "PRINTFLEET_LOG_DEBUG",
                "PRINTFLEET_SMTP_HOST", "PRINTFLEET_SMTP_PORT", "PRINTFLEET_SMTP_ENCRYPTION",
                "PRINTFLEET_SMTP_USER", "PRINTFLEET_SMTP_PASSWORD"
        };

        int loaded = 0;
        for (const char *envVar: envVars) {
            const char *value = std::getenv(envVar);
            if (value) {
                // PRINTFLEET_WATCHER_INTERVAL_SECONDS -> watcher.interval.seconds
                std::string key = std::string(envVar).substr(std::char_traits<char>::length(ENV_PREFIX));
                std::transform(key.begin(), key.end(), key.begin(), ::tolower);
                std::replace(key.begin(), key.end(), '_', '.');

                config_[key] = value;
                loaded++;
            }
        }

        Logger::logInfo("[ConfigManager] Loaded " + std::to_string(loaded) + " settings from environment");
    }

    device::ConnectionSettings ConfigManager::getDeviceConfig() const {
        device::ConnectionSettings config;
        config.port = static_cast<uint16_t>(get<int>("device.port", 8899));
        config.connectTimeout = std::chrono::milliseconds(get<int>("device.connect.timeout.ms", 3000));
        config.writeTimeout = std::chrono::milliseconds(get<int>("device.write.timeout.ms", 3000));
        config.readTimeout = std::chrono::milliseconds(get<int>("device.read.timeout.ms", 10000));
        return config;
    }

    camera::CameraSettings ConfigManager::getCameraConfig() const {
        camera::CameraSettings config;
        config.port = static_cast<uint16_t>(get<int>("camera.port", 8080));
        config.path = get<std::string>("camera.path", "/?action=stream");
        config.boundary = get<std::string>("camera.boundary", "boundarydonotcross");
        config.capacity = static_cast<size_t>(std::max(1, get<int>("camera.capacity", 16)));
        config.snapshotTimeout = std::chrono::milliseconds(get<int>("camera.snapshot.timeout.ms", 5000));
        return config;
    }

    registry::WatcherSettings ConfigManager::getWatcherConfig() const {
        registry::WatcherSettings config;
        config.interval = std::chrono::seconds(get<int>("watcher.interval.seconds", 60));
        return config;
    }

    std::optional<notification::SmtpSettings> ConfigManager::getSmtpConfig() const {
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            bool configured = document_.contains("smtp") ||
                              std::any_of(config_.begin(), config_.end(), [](const auto &entry) {
                                  return entry.first.rfind("smtp.", 0) == 0;
                              });
            if (!configured) {
                return std::nullopt;
            }
        }

        notification::SmtpSettings settings;
        settings.host = get<std::string>("smtp.host", "");
        settings.user = get<std::string>("smtp.user", "");
        settings.password = get<std::string>("smtp.password", "");
        int port = get<int>("smtp.port", 0);
        std::string encryption = get<std::string>("smtp.encryption", "starttls");

        if (port <= 0 || port > 65535) {
            Logger::logError("[ConfigManager] SMTP: port is invalid, smtp support not enabled");
            return std::nullopt;
        }
        if (settings.user.empty()) {
            Logger::logError("[ConfigManager] SMTP: user is empty, smtp support not enabled");
            return std::nullopt;
        }
        if (settings.host.empty()) {
            Logger::logError("[ConfigManager] SMTP: host is empty, smtp support not enabled");
            return std::nullopt;
        }

        auto parsed = parseEncryption(encryption);
        if (!parsed) {
            Logger::logError("[ConfigManager] SMTP: unknown encryption \"" + encryption +
                             "\", smtp support not enabled");
            return std::nullopt;
        }

        settings.port = static_cast<uint16_t>(port);
        settings.encryption = *parsed;
        return settings;
    }

    std::map<std::string, std::string> ConfigManager::getPrinters() const {
        std::lock_guard<std::mutex> lock(configMutex_);
        std::map<std::string, std::string> printers;

        auto section = document_.find("printers");
        if (section == document_.end() || !section->is_object()) {
            return printers;
        }

        for (auto it = section->begin(); it != section->end(); ++it) {
            const auto &entry = it.value();
            if (entry.is_object() && entry.contains("ip") && entry["ip"].is_string() &&
                !entry["ip"].get<std::string>().empty()) {
                printers[it.key()] = entry["ip"].get<std::string>();
            } else {
                Logger::logWarning("[ConfigManager] Printer " + it.key() + " has no ip, skipped");
            }
        }
        return printers;
    }

    std::optional<notification::NotificationDestinations>
    ConfigManager::getNotificationDestinations(notification::EventKind kind) const {
        std::lock_guard<std::mutex> lock(configMutex_);

        auto notifications = document_.find("notifications");
        if (notifications == document_.end() || !notifications->is_object()) {
            return std::nullopt;
        }
        auto section = notifications->find(notification::eventKindKey(kind));
        if (section == notifications->end() || !section->is_object()) {
            return std::nullopt;
        }

        auto readList = [&section](const char *name) {
            std::vector<std::string> values;
            auto list = section->find(name);
            if (list != section->end() && list->is_array()) {
                for (const auto &value: *list) {
                    if (value.is_string()) {
                        values.push_back(value.get<std::string>());
                    }
                }
            }
            return values;
        };

        notification::NotificationDestinations destinations;
        destinations.emails = readList("emails");
        destinations.webhooks = readList("webhooks");
        return destinations;
    }

    bool ConfigManager::isDebugLoggingEnabled() const {
        return get<bool>("log.debug", false);
    }

    ConfigManager::ValidationResult ConfigManager::validate() const {
        ValidationResult result;

        int devicePort = get<int>("device.port", -1);
        if (devicePort <= 0 || devicePort > 65535) {
            result.errors.push_back("device.port must be between 1 and 65535");
        }

        if (get<int>("device.write.timeout.ms", -1) < 100) {
            result.errors.push_back("device.write.timeout.ms must be >= 100");
        }

        if (get<int>("device.read.timeout.ms", -1) < 100) {
            result.errors.push_back("device.read.timeout.ms must be >= 100");
        }

        int cameraPort = get<int>("camera.port", -1);
        if (cameraPort <= 0 || cameraPort > 65535) {
            result.errors.push_back("camera.port must be between 1 and 65535");
        }

        if (get<int>("camera.capacity", -1) < 1) {
            result.errors.push_back("camera.capacity must be >= 1");
        }

        if (get<int>("watcher.interval.seconds", -1) < 1) {
            result.errors.push_back("watcher.interval.seconds must be >= 1");
        }

        if (getPrinters().empty()) {
            result.errors.push_back("printers must declare at least one printer");
        }

        result.isValid = result.errors.empty();
        return result;
    }

    void ConfigManager::setDefaults() {
        config_.clear();
        document_ = nlohmann::json::object();

        // Device defaults
        config_["device.port"] = "8899";
        config_["device.connect.timeout.ms"] = "3000";
        config_["device.write.timeout.ms"] = "3000";
        config_["device.read.timeout.ms"] = "10000";

        // Camera defaults
        config_["camera.port"] = "8080";
        config_["camera.path"] = "/?action=stream";
        config_["camera.boundary"] = "boundarydonotcross";
        config_["camera.capacity"] = "16";
        config_["camera.snapshot.timeout.ms"] = "5000";

        // Watcher defaults
        config_["watcher.interval.seconds"] = "60";

        config_["log.debug"] = "false";
    }

    std::optional<notification::SmtpEncryption> ConfigManager::parseEncryption(const std::string &value) {
        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

        if (lower == "none") return notification::SmtpEncryption::None;
        if (lower == "starttls") return notification::SmtpEncryption::StartTls;
        if (lower == "tls") return notification::SmtpEncryption::Tls;
        return std::nullopt;
    }
} // namespace printfleet::config
