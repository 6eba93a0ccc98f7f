#include <catch2/catch.hpp>

#include "printfleet/camera/CameraMultiplexer.hpp"
#include "fakes/ScriptedCameraSource.hpp"
#include "fakes/Wait.hpp"

#include <string>
#include <vector>

using namespace printfleet;
using namespace std::chrono_literals;

namespace {
    const std::string URL = "http://192.168.1.50:8080/?action=stream";
}

TEST_CASE("stream url is built from host and camera settings", "[camera]") {
    camera::CameraSettings settings;
    CHECK(settings.streamUrl("192.168.1.50") == URL);

    settings.port = 9000;
    settings.path = "/stream";
    CHECK(settings.streamUrl("printer.local") == "http://printer.local:9000/stream");
}

TEST_CASE("two subscribers share one upstream connection", "[camera]") {
    auto source = std::make_shared<testing::LoopingCameraSource>();
    source->hold = true;
    camera::CameraMultiplexer mux("a4", URL, source);

    auto first = mux.subscribe();
    auto second = mux.subscribe();
    source->release();

    auto collect = [](auto &receiver) {
        std::vector<std::string> bodies;
        for (int i = 0; i < 5; i++) {
            auto received = receiver.receive(2s);
            REQUIRE(received.status == camera::ReceiveStatus::Ok);
            CHECK(received.skipped == 0);
            bodies.push_back((*received.value)->body);
        }
        return bodies;
    };

    auto a = collect(first);
    auto b = collect(second);
    CHECK(a == std::vector<std::string>{"frame-0", "frame-1", "frame-2", "frame-3", "frame-4"});
    CHECK(a == b);

    CHECK(source->opens == 1);
    CHECK(mux.upstreamConnections() == 1);
    CHECK(mux.isStreaming());
}

TEST_CASE("upstream is released when the last subscriber leaves", "[camera]") {
    auto source = std::make_shared<testing::LoopingCameraSource>();
    camera::CameraMultiplexer mux("a4", URL, source);

    {
        auto receiver = mux.subscribe();
        REQUIRE(receiver.receive(2s).status == camera::ReceiveStatus::Ok);
    }

    REQUIRE(testing::waitUntil([&mux] { return !mux.isStreaming(); }));

    auto again = mux.subscribe();
    REQUIRE(again.receive(2s).status == camera::ReceiveStatus::Ok);
    CHECK(source->opens == 2);
    CHECK(mux.upstreamConnections() == 2);
}

TEST_CASE("snapshot returns a fresh frame and caches it", "[camera]") {
    auto source = std::make_shared<testing::LoopingCameraSource>();
    camera::CameraMultiplexer mux("a4", URL, source);

    CHECK_FALSE(mux.lastFrame());

    auto snapshot = mux.snapshot(2s);
    REQUIRE(snapshot.isSuccess());
    REQUIRE(snapshot.get());

    auto cached = mux.lastFrame();
    REQUIRE(cached);
    CHECK(cached->contentType() == "image/jpeg");
}

TEST_CASE("snapshot of an unreachable camera reports the upstream error", "[camera]") {
    auto source = std::make_shared<testing::UnreachableCameraSource>();
    camera::CameraMultiplexer mux("a4", URL, source);

    auto snapshot = mux.snapshot(2s);
    REQUIRE(snapshot.isCameraUnavailable());
    CHECK(snapshot.message.find("Couldn't connect") != std::string::npos);
    CHECK_FALSE(mux.lastFrame());

    // A later subscriber retries the upstream
    REQUIRE(testing::waitUntil([&mux] { return !mux.isStreaming(); }));
    CHECK(mux.snapshot(2s).isCameraUnavailable());
    CHECK(source->opens == 2);
}

TEST_CASE("snapshot is bounded by its timeout", "[camera]") {
    auto source = std::make_shared<testing::SilentCameraSource>();
    camera::CameraMultiplexer mux("a4", URL, source);

    auto started = std::chrono::steady_clock::now();
    auto snapshot = mux.snapshot(50ms);
    auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(snapshot.isCameraUnavailable());
    CHECK(elapsed < 2s);
}
