#pragma once

#include "printfleet/camera/CameraFrame.hpp"
#include <functional>
#include <optional>
#include <string>

namespace printfleet::camera {

    /**
     * @brief Incremental parser for multipart/x-mixed-replace bodies.
     *
     * Bytes are fed as they arrive from the network, in chunks of any size. Each complete part
     * is handed to the frame handler. The body length comes from Content-Length when present,
     * otherwise the part ends at the next boundary.
     */
    class MjpegParser {
    public:
        using FrameHandler = std::function<void(CameraFrame)>;

        static constexpr size_t MAX_HEADER_SIZE = 16 * 1024;
        static constexpr size_t MAX_FRAME_SIZE = 16 * 1024 * 1024;

        MjpegParser(const std::string &boundary, FrameHandler onFrame);

        void feed(const char *data, size_t size);

        size_t framesParsed() const { return framesParsed_; }

    private:
        enum class State {
            SeekBoundary,
            Headers,
            Body
        };

        const std::string marker_;
        FrameHandler onFrame_;
        State state_ = State::SeekBoundary;
        std::string buffer_;
        CameraFrame current_;
        std::optional<size_t> contentLength_;
        size_t framesParsed_ = 0;

        bool seekBoundary();

        bool readHeaders();

        bool readBody();

        void emitFrame(std::string body);
    };

} // namespace printfleet::camera
