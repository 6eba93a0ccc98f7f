#pragma once

#include "printfleet/types/Result.hpp"
#include <functional>
#include <string>

namespace printfleet::camera {

    /**
     * @brief Upstream connection to a camera's MJPEG endpoint.
     */
    class CameraStreamSource {
    public:
        /// Receives raw body bytes; returning false ends the stream.
        using ChunkHandler = std::function<bool(const char *data, size_t size)>;
        using CancelCheck = std::function<bool()>;

        virtual ~CameraStreamSource() = default;

        /**
         * @brief Streams the body of `url` into `onChunk` until the stream ends.
         *
         * Blocks for the lifetime of the stream. Returns success when the server closed the
         * stream or the handler declined more data, ResultCode::CameraUnavailable otherwise
         * (connect failure, HTTP error, stall, cancellation).
         */
        virtual types::Result<> open(const std::string &url, const ChunkHandler &onChunk,
                                     const CancelCheck &cancelled) = 0;
    };

} // namespace printfleet::camera
