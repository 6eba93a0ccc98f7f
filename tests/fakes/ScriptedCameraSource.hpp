#pragma once

#include "printfleet/camera/CameraStreamSource.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include <thread>

namespace printfleet::testing {

    inline std::string mjpegPart(const std::string &boundary, const std::string &body, bool withLength = true) {
        std::string part = "--" + boundary + "\r\nContent-Type: image/jpeg\r\n";
        if (withLength) {
            part += "Content-Length: " + std::to_string(body.size()) + "\r\n";
        }
        part += "\r\n" + body + "\r\n";
        return part;
    }

    /**
     * @brief Camera that keeps producing numbered frames until nobody wants them.
     *
     * With `hold` set the connection opens but the first frame waits for `release()`.
     */
    class LoopingCameraSource : public camera::CameraStreamSource {
    public:
        explicit LoopingCameraSource(std::string boundary = "boundarydonotcross",
                                     std::chrono::milliseconds period = std::chrono::milliseconds(5))
                : boundary_(std::move(boundary)), period_(period) {
        }

        types::Result<> open(const std::string &, const ChunkHandler &onChunk, const CancelCheck &cancelled) override {
            opens++;
            while (hold && !cancelled()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            int index = 0;
            while (!cancelled()) {
                std::string part = mjpegPart(boundary_, "frame-" + std::to_string(index++));
                if (!onChunk(part.data(), part.size())) {
                    return types::Result<>::success();
                }
                std::this_thread::sleep_for(period_);
            }
            return types::Result<>::error(types::ResultCode::CameraUnavailable, "Stream cancelled");
        }

        void release() {
            hold = false;
        }

        std::atomic<int> opens{0};
        std::atomic<bool> hold{false};

    private:
        const std::string boundary_;
        const std::chrono::milliseconds period_;
    };

    /**
     * @brief Camera whose connection always fails.
     */
    class UnreachableCameraSource : public camera::CameraStreamSource {
    public:
        types::Result<> open(const std::string &url, const ChunkHandler &, const CancelCheck &) override {
            opens++;
            return types::Result<>::error(types::ResultCode::CameraUnavailable, "Couldn't connect to " + url);
        }

        std::atomic<int> opens{0};
    };

    /**
     * @brief Camera that accepts the connection and never sends a byte.
     */
    class SilentCameraSource : public camera::CameraStreamSource {
    public:
        types::Result<> open(const std::string &, const ChunkHandler &, const CancelCheck &cancelled) override {
            while (!cancelled()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            return types::Result<>::error(types::ResultCode::CameraUnavailable, "Stream cancelled");
        }
    };

} // namespace printfleet::testing
