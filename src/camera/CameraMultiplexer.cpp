#include "printfleet/camera/CameraMultiplexer.hpp"
#include "printfleet/camera/MjpegParser.hpp"
#include "printfleet/logger/Logger.hpp"

namespace printfleet::camera {

    using types::ResultCode;

    CameraMultiplexer::CameraMultiplexer(std::string deviceId, std::string streamUrl,
                                         std::shared_ptr<CameraStreamSource> source, CameraSettings settings)
            : deviceId_(std::move(deviceId)), streamUrl_(std::move(streamUrl)), source_(std::move(source)),
              settings_(std::move(settings)), topic_(settings_.capacity) {
    }

    CameraMultiplexer::~CameraMultiplexer() {
        stopRequested_ = true;
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    CameraMultiplexer::FrameReceiver CameraMultiplexer::subscribe() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto receiver = topic_.subscribe();

        if (!running_) {
            // A finished worker no longer touches mutex_, so joining here cannot deadlock
            if (worker_.joinable()) {
                worker_.join();
            }

            running_ = true;
            lastError_.clear();
            ++upstreamConnections_;
            worker_ = std::thread(&CameraMultiplexer::streamWorker, this);
            Logger::logInfo("[CameraMultiplexer] " + deviceId_ + " starting upstream " + streamUrl_);
        }

        return receiver;
    }

    types::Result<FramePtr> CameraMultiplexer::snapshot() {
        return snapshot(settings_.snapshotTimeout);
    }

    types::Result<FramePtr> CameraMultiplexer::snapshot(std::chrono::milliseconds timeout) {
        auto receiver = subscribe();
        auto received = receiver.receive(timeout);

        switch (received.status) {
            case ReceiveStatus::Ok:
                return types::Result<FramePtr>::success(*received.value);
            case ReceiveStatus::Timeout:
                return types::Result<FramePtr>::error(
                        ResultCode::CameraUnavailable,
                        "No frame from " + deviceId_ + " within " + std::to_string(timeout.count()) + " ms");
            case ReceiveStatus::Closed:
                break;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        return types::Result<FramePtr>::error(
                ResultCode::CameraUnavailable,
                lastError_.empty() ? "Camera stream of " + deviceId_ + " closed" : lastError_);
    }

    FramePtr CameraMultiplexer::lastFrame() const {
        std::lock_guard<std::mutex> lock(frameMutex_);
        return lastFrame_;
    }

    bool CameraMultiplexer::isStreaming() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    bool CameraMultiplexer::publishFrame(CameraFrame frame) {
        auto shared = std::make_shared<const CameraFrame>(std::move(frame));
        {
            std::lock_guard<std::mutex> lock(frameMutex_);
            lastFrame_ = shared;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (!topic_.publish(shared)) {
            running_ = false;
            return false;
        }
        return true;
    }

    void CameraMultiplexer::streamWorker() {
        bool released = false;

        MjpegParser parser(settings_.boundary, [this, &released](CameraFrame frame) {
            if (released) return;
            if (!publishFrame(std::move(frame))) {
                released = true;
            }
        });

        types::Result<> result;
        try {
            result = source_->open(
                    streamUrl_,
                    [&parser, &released](const char *data, size_t size) {
                        parser.feed(data, size);
                        return !released;
                    },
                    [this]() { return stopRequested_.load(); });
        } catch (const std::exception &e) {
            result = types::Result<>::error(ResultCode::CameraUnavailable, e.what());
        }

        if (released) {
            // running_ was already cleared under mutex_, a new subscriber may own the next worker
            Logger::logInfo("[CameraMultiplexer] " + deviceId_ + " no subscribers left, upstream released after " +
                            std::to_string(parser.framesParsed()) + " frames");
            return;
        }

        std::string error = result.isSuccess() ? "Camera stream of " + deviceId_ + " ended" : result.message;
        if (!stopRequested_) {
            Logger::logWarning("[CameraMultiplexer] " + deviceId_ + " upstream stopped: " + error);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        lastError_ = error;
        topic_.close();
    }

} // namespace printfleet::camera
