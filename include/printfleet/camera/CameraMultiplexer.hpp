#pragma once

#include "printfleet/camera/BroadcastTopic.hpp"
#include "printfleet/camera/CameraFrame.hpp"
#include "printfleet/camera/CameraStreamSource.hpp"
#include "printfleet/types/Result.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace printfleet::camera {

    struct CameraSettings {
        uint16_t port = 8080;
        std::string path = "/?action=stream";
        std::string boundary = "boundarydonotcross";
        size_t capacity = 16;
        std::chrono::milliseconds snapshotTimeout{5000};

        std::string streamUrl(const std::string &host) const {
            return "http://" + host + ":" + std::to_string(port) + path;
        }
    };

    /**
     * @brief Shares one upstream MJPEG connection among any number of viewers.
     *
     * The upstream is opened by the first subscriber and runs on its own thread. Every frame
     * is cached as the last frame and then published. The thread ends by itself once a publish
     * finds no subscriber left; the next subscribe() opens a new upstream.
     */
    class CameraMultiplexer {
    public:
        using FrameTopic = BroadcastTopic<FramePtr>;
        using FrameReceiver = FrameTopic::Receiver;

        CameraMultiplexer(std::string deviceId, std::string streamUrl,
                          std::shared_ptr<CameraStreamSource> source, CameraSettings settings = {});

        ~CameraMultiplexer();

        CameraMultiplexer(const CameraMultiplexer &) = delete;

        CameraMultiplexer &operator=(const CameraMultiplexer &) = delete;

        /**
         * @brief Receiver for all frames from now on, starting the upstream if needed.
         */
        FrameReceiver subscribe();

        /**
         * @brief Waits for one fresh frame, up to the configured snapshot timeout.
         * @return ResultCode::CameraUnavailable if no frame arrived in time or the upstream failed
         */
        types::Result<FramePtr> snapshot();

        types::Result<FramePtr> snapshot(std::chrono::milliseconds timeout);

        /**
         * @brief Last frame seen, possibly stale. Never blocks on the network.
         */
        FramePtr lastFrame() const;

        bool isStreaming() const;

        /**
         * @brief Number of upstream connections opened so far.
         */
        size_t upstreamConnections() const { return upstreamConnections_; }

        const std::string &streamUrl() const { return streamUrl_; }

    private:
        const std::string deviceId_;
        const std::string streamUrl_;
        std::shared_ptr<CameraStreamSource> source_;
        const CameraSettings settings_;

        FrameTopic topic_;

        mutable std::mutex mutex_;
        bool running_ = false;
        std::string lastError_;
        std::thread worker_;

        mutable std::mutex frameMutex_;
        FramePtr lastFrame_;

        std::atomic<bool> stopRequested_{false};
        std::atomic<size_t> upstreamConnections_{0};

        void streamWorker();

        /**
         * @brief Caches and publishes a frame.
         * @return false once no subscriber is left; the worker then releases the upstream
         */
        bool publishFrame(CameraFrame frame);
    };

} // namespace printfleet::camera
