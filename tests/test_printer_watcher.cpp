#include <catch2/catch.hpp>

#include "printfleet/registry/DeviceRegistry.hpp"
#include "printfleet/registry/PrinterWatcher.hpp"
#include "fakes/RecordingTransports.hpp"
#include "fakes/ScriptedPrinterSocket.hpp"
#include "fakes/Wait.hpp"

#include <map>
#include <thread>

using namespace printfleet;
using namespace std::chrono_literals;

namespace {
    struct Fleet {
        std::map<std::string, std::shared_ptr<testing::PrinterScript>> scripts;
        std::shared_ptr<registry::DeviceRegistry> registry;

        Fleet() {
            registry = std::make_shared<registry::DeviceRegistry>(
                    [this](const std::string &id, const std::string &host) {
                        return std::make_shared<device::DeviceClient>(
                                id, host, device::ConnectionSettings{}, testing::scriptedSockets(scripts.at(id)));
                    });
        }

        std::shared_ptr<testing::PrinterScript> add(const std::string &id, const std::string &file, int layer,
                                                    int layers) {
            auto script = std::make_shared<testing::PrinterScript>();
            script->reply("~M115", testing::infoReply(id));
            script->reply("~M119", testing::statusReply(file));
            script->reply("~M27", testing::progressReply(layer, layers));
            scripts[id] = script;
            registry->addDevice(id, "10.0.0." + std::to_string(scripts.size()));
            return script;
        }
    };
}

TEST_CASE("finished job is notified exactly once", "[watcher]") {
    Fleet fleet;
    fleet.add("a4", "benchy.gx", 120, 120);
    auto notifier = std::make_shared<testing::RecordingNotifier>();
    registry::PrinterWatcher watcher(fleet.registry, notifier);

    CHECK(watcher.tick() == 1);
    CHECK(watcher.tick() == 0);
    CHECK(watcher.tick() == 0);

    auto calls = notifier->calls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].first == "a4");
    CHECK(calls[0].second == "benchy.gx");

    auto ledger = fleet.registry->ledgerSnapshot();
    REQUIRE(ledger.lastNotified("a4"));
    CHECK(*ledger.lastNotified("a4") == "benchy.gx");
}

TEST_CASE("a new finished file triggers a new notification", "[watcher]") {
    Fleet fleet;
    auto script = fleet.add("a4", "first.gx", 10, 10);
    auto notifier = std::make_shared<testing::RecordingNotifier>();
    registry::PrinterWatcher watcher(fleet.registry, notifier);

    CHECK(watcher.tick() == 1);

    script->reply("~M119", testing::statusReply("second.gx"));
    script->reply("~M27", testing::progressReply(3, 50));
    CHECK(watcher.tick() == 0);

    script->reply("~M27", testing::progressReply(50, 50));
    CHECK(watcher.tick() == 1);

    auto calls = notifier->calls();
    REQUIRE(calls.size() == 2);
    CHECK(calls[1].second == "second.gx");
}

TEST_CASE("reprinting the same file is not notified again", "[watcher]") {
    Fleet fleet;
    auto script = fleet.add("a4", "benchy.gx", 10, 10);
    auto notifier = std::make_shared<testing::RecordingNotifier>();
    registry::PrinterWatcher watcher(fleet.registry, notifier);

    CHECK(watcher.tick() == 1);
    script->reply("~M27", testing::progressReply(1, 10));
    CHECK(watcher.tick() == 0);
    script->reply("~M27", testing::progressReply(10, 10));
    CHECK(watcher.tick() == 0);
    CHECK(notifier->calls().size() == 1);
}

TEST_CASE("idle, printing and offline devices are skipped", "[watcher]") {
    Fleet fleet;
    fleet.add("idle", "", 0, 0);
    fleet.add("busy", "vase.gx", 5, 300);
    auto offline = fleet.add("gone", "part.gx", 10, 10);
    offline->setReachable(false);

    auto notifier = std::make_shared<testing::RecordingNotifier>();
    registry::PrinterWatcher watcher(fleet.registry, notifier);

    CHECK(watcher.tick() == 0);
    CHECK(notifier->calls().empty());
    CHECK(offline->countSent("~M27") == 0);
    CHECK(fleet.scripts.at("idle")->countSent("~M27") == 0);

    auto stats = watcher.getStatistics();
    CHECK(stats.ticks == 1);
    CHECK(stats.devicesPolled == 3);
    CHECK(stats.devicesSkipped == 3);
    CHECK(stats.notificationsSent == 0);
}

TEST_CASE("one failing device does not stop the others", "[watcher]") {
    Fleet fleet;
    auto broken = fleet.add("broken", "part.gx", 10, 10);
    broken->forget("~M27");
    fleet.add("healthy", "part.gx", 10, 10);

    auto notifier = std::make_shared<testing::RecordingNotifier>();
    registry::PrinterWatcher watcher(fleet.registry, notifier);

    CHECK(watcher.tick() == 1);
    auto calls = notifier->calls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].first == "healthy");
}

TEST_CASE("failed delivery is still recorded", "[watcher]") {
    Fleet fleet;
    fleet.add("a4", "benchy.gx", 10, 10);
    auto notifier = std::make_shared<testing::RecordingNotifier>();
    notifier->throwOnNotify = true;
    registry::PrinterWatcher watcher(fleet.registry, notifier);

    CHECK(watcher.tick() == 1);
    CHECK(watcher.tick() == 0);
    CHECK(notifier->calls().size() == 1);
}

TEST_CASE("overlapping passes notify a finished job once", "[watcher]") {
    Fleet fleet;
    fleet.add("a4", "benchy.gx", 120, 120);
    auto notifier = std::make_shared<testing::RecordingNotifier>();
    notifier->delay = 200ms;
    registry::PrinterWatcher watcher(fleet.registry, notifier);

    size_t firstDispatched = 0;
    size_t secondDispatched = 0;
    std::thread first([&] { firstDispatched = watcher.tick(); });
    std::thread second([&] { secondDispatched = watcher.tick(); });
    first.join();
    second.join();

    CHECK(firstDispatched + secondDispatched == 1);
    REQUIRE(notifier->calls().size() == 1);
    CHECK(notifier->calls()[0].second == "benchy.gx");
    CHECK(watcher.getStatistics().ticks == 2);

    auto ledger = fleet.registry->ledgerSnapshot();
    REQUIRE(ledger.lastNotified("a4"));
    CHECK(*ledger.lastNotified("a4") == "benchy.gx");
}

TEST_CASE("background loop ticks on its interval and stops promptly", "[watcher]") {
    Fleet fleet;
    fleet.add("a4", "benchy.gx", 10, 10);
    auto notifier = std::make_shared<testing::RecordingNotifier>();

    registry::WatcherSettings settings;
    settings.interval = 20ms;
    registry::PrinterWatcher watcher(fleet.registry, notifier, settings);

    watcher.start();
    CHECK(watcher.isRunning());
    REQUIRE(testing::waitUntil([&watcher] { return watcher.getStatistics().ticks >= 2; }));
    watcher.stop();

    CHECK_FALSE(watcher.isRunning());
    CHECK(notifier->calls().size() == 1);
}

TEST_CASE("ledger only suppresses the exact file", "[watcher]") {
    registry::NotificationLedger ledger;
    CHECK(ledger.shouldNotify("a4", "benchy.gx"));

    ledger.record("a4", "benchy.gx");
    CHECK_FALSE(ledger.shouldNotify("a4", "benchy.gx"));
    CHECK(ledger.shouldNotify("a4", "cube.gx"));
    CHECK(ledger.shouldNotify("other", "benchy.gx"));
    CHECK(ledger.size() == 1);
}

TEST_CASE("registry rejects duplicate ids and keeps unreachable devices", "[registry]") {
    Fleet fleet;
    auto script = std::make_shared<testing::PrinterScript>();
    script->setReachable(false);
    fleet.scripts["late"] = script;

    REQUIRE(fleet.registry->addDevice("late", "10.0.0.9"));
    CHECK_FALSE(fleet.registry->addDevice("late", "10.0.0.10"));

    auto device = fleet.registry->getDevice("late");
    REQUIRE(device);
    CHECK(device->host() == "10.0.0.9");
    CHECK_FALSE(device->identity());
    CHECK_FALSE(fleet.registry->getDevice("missing"));
    CHECK(fleet.registry->listDeviceIds() == std::vector<std::string>{"late"});
}
