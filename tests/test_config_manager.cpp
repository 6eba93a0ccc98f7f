#include <catch2/catch.hpp>

#include "printfleet/application/config/ConfigManager.hpp"

#include <cstdlib>

using namespace printfleet;
using config::ConfigManager;

namespace {
    const char *FULL_CONFIG = R"({
        "printers": {
            "a4": {"ip": "192.168.1.40"},
            "a5m": {"ip": "192.168.1.41"},
            "broken": {}
        },
        "device": {"port": 8899, "read": {"timeout": {"ms": 4000}}},
        "camera": {"port": 8081, "capacity": 4},
        "watcher": {"interval": {"seconds": 30}},
        "smtp": {"host": "smtp.example.com", "port": 465, "encryption": "TLS",
                 "user": "printers@example.com", "password": "secret"},
        "notifications": {
            "on_done": {
                "emails": ["ops@example.com"],
                "webhooks": ["https://discord.com/api/webhooks/1/abc"]
            }
        },
        "log": {"debug": true}
    })";
}

TEST_CASE("printers and typed sections are read from json", "[config]") {
    auto &config = ConfigManager::getInstance();
    config.loadFromJson(FULL_CONFIG);

    auto printers = config.getPrinters();
    REQUIRE(printers.size() == 2);
    CHECK(printers.at("a4") == "192.168.1.40");
    CHECK(printers.at("a5m") == "192.168.1.41");

    auto device = config.getDeviceConfig();
    CHECK(device.port == 8899);
    CHECK(device.readTimeout == std::chrono::milliseconds(4000));
    CHECK(device.writeTimeout == std::chrono::milliseconds(3000));

    auto camera = config.getCameraConfig();
    CHECK(camera.port == 8081);
    CHECK(camera.capacity == 4);
    CHECK(camera.path == "/?action=stream");

    CHECK(config.getWatcherConfig().interval == std::chrono::seconds(30));
    CHECK(config.isDebugLoggingEnabled());
    CHECK(config.validate().isValid);
}

TEST_CASE("smtp section is parsed with its encryption", "[config]") {
    auto &config = ConfigManager::getInstance();
    config.loadFromJson(FULL_CONFIG);

    auto smtp = config.getSmtpConfig();
    REQUIRE(smtp);
    CHECK(smtp->host == "smtp.example.com");
    CHECK(smtp->port == 465);
    CHECK(smtp->encryption == notification::SmtpEncryption::Tls);
    CHECK(smtp->user == "printers@example.com");
}

TEST_CASE("incomplete smtp section disables email", "[config]") {
    auto &config = ConfigManager::getInstance();

    config.loadFromJson(R"({"printers": {"a4": {"ip": "h"}}})");
    CHECK_FALSE(config.getSmtpConfig());

    config.loadFromJson(R"({"printers": {"a4": {"ip": "h"}}, "smtp": {"host": "s", "port": 0, "user": "u"}})");
    CHECK_FALSE(config.getSmtpConfig());

    config.loadFromJson(R"({"printers": {"a4": {"ip": "h"}}, "smtp": {"host": "s", "port": 25, "user": ""}})");
    CHECK_FALSE(config.getSmtpConfig());

    config.loadFromJson(R"({"printers": {"a4": {"ip": "h"}},
                            "smtp": {"host": "s", "port": 25, "user": "u", "encryption": "ssl3"}})");
    CHECK_FALSE(config.getSmtpConfig());

    config.loadFromJson(R"({"printers": {"a4": {"ip": "h"}}, "smtp": {"host": "s", "port": 25, "user": "u"}})");
    auto smtp = config.getSmtpConfig();
    REQUIRE(smtp);
    CHECK(smtp->encryption == notification::SmtpEncryption::StartTls);
}

TEST_CASE("notification destinations are read per event kind", "[config]") {
    auto &config = ConfigManager::getInstance();
    config.loadFromJson(FULL_CONFIG);

    auto onDone = config.getNotificationDestinations(notification::EventKind::PrintComplete);
    REQUIRE(onDone);
    CHECK(onDone->emails == std::vector<std::string>{"ops@example.com"});
    CHECK(onDone->webhooks == std::vector<std::string>{"https://discord.com/api/webhooks/1/abc"});

    config.loadFromJson(R"({"printers": {"a4": {"ip": "h"}}})");
    CHECK_FALSE(config.getNotificationDestinations(notification::EventKind::PrintComplete));
}

TEST_CASE("defaults apply and validation requires printers", "[config]") {
    auto &config = ConfigManager::getInstance();
    config.loadFromJson("{}");

    auto device = config.getDeviceConfig();
    CHECK(device.port == 8899);
    CHECK(device.connectTimeout == std::chrono::milliseconds(3000));
    CHECK(device.readTimeout == std::chrono::milliseconds(10000));
    CHECK(config.getWatcherConfig().interval == std::chrono::seconds(60));
    CHECK_FALSE(config.isDebugLoggingEnabled());

    auto validation = config.validate();
    CHECK_FALSE(validation.isValid);
    REQUIRE(validation.errors.size() == 1);
    CHECK(validation.errors[0].find("printers") != std::string::npos);
}

TEST_CASE("invalid values fail validation", "[config]") {
    auto &config = ConfigManager::getInstance();
    config.loadFromJson(R"({"printers": {"a4": {"ip": "h"}},
                            "device": {"port": 70000},
                            "watcher": {"interval": {"seconds": 0}}})");

    auto validation = config.validate();
    CHECK_FALSE(validation.isValid);
    CHECK(validation.errors.size() == 2);
}

TEST_CASE("malformed json is reported to the caller", "[config]") {
    CHECK_THROWS_AS(ConfigManager::getInstance().loadFromJson("{not json"), nlohmann::json::parse_error);
}

TEST_CASE("environment overrides file values", "[config]") {
    auto &config = ConfigManager::getInstance();
    config.loadFromJson(FULL_CONFIG);

    setenv("PRINTFLEET_WATCHER_INTERVAL_SECONDS", "5", 1);
    setenv("PRINTFLEET_DEVICE_PORT", "9999", 1);
    config.loadFromEnv();
    unsetenv("PRINTFLEET_WATCHER_INTERVAL_SECONDS");
    unsetenv("PRINTFLEET_DEVICE_PORT");

    CHECK(config.getWatcherConfig().interval == std::chrono::seconds(5));
    CHECK(config.getDeviceConfig().port == 9999);
    CHECK(config.getCameraConfig().port == 8081);
}

TEST_CASE("missing config file falls back to defaults", "[config]") {
    auto &config = ConfigManager::getInstance();
    config.loadFromFile("/nonexistent/printfleet.json");

    CHECK(config.getPrinters().empty());
    CHECK(config.getDeviceConfig().port == 8899);
}
